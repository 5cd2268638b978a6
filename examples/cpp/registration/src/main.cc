#include "registration_logic.hpp"
#include "throwif/errors.hpp"
#include "throwif/logging.hpp"
#include "throwif/status.hpp"
#include <cstdlib>
#include <exception>
#include <string>

int main(int argc, char** argv) {
    if (argc != 5) {
        throwif::log_error("registration", "usage",
            {{"expected", "registration <username> <email> <age> <tier>"}});
        return 2;
    }

    try {
        using registration::RegistrationLogic;

        auto limits = RegistrationLogic::load_limits(std::getenv("MIN_AGE"), std::getenv("MAX_AGE"));
        auto age = RegistrationLogic::parse_number(argv[3], "age");
        auto tier = static_cast<registration::MembershipTier>(
            RegistrationLogic::parse_number(argv[4], "tier"));

        auto account = RegistrationLogic::handle_register(argv[1], argv[2], age, tier, limits);

        throwif::log_info("registration", "account_registered",
            {{"username", account.username},
             {"email", account.email},
             {"age", account.age},
             {"tier", static_cast<int>(account.tier)}});
        return 0;

    } catch (const throwif::ArgumentError& e) {
        auto status = throwif::to_grpc_status(e);
        auto fields = throwif::describe(e);
        fields["status_code"] = static_cast<int>(status.error_code());
        throwif::log_error("registration", "registration_rejected", fields);
        return 1;
    } catch (const std::exception& e) {
        throwif::log_error("registration", "registration_failed", {{"error", e.what()}});
        return 1;
    }
}
