#include "registration_logic.hpp"
#include "throwif/throwif.hpp"
#include <algorithm>
#include <cctype>

namespace registration {

using namespace throwif;

namespace {

bool all_digits(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

int32_t RegistrationLogic::parse_number(const std::string& text, const std::string& name) {
    guard(text, name)
        .throw_if_null_or_whitespace()
        .throw_if_not(all_digits)
        .throw_if([](const std::string& s) { return s.size() > 9; });
    return static_cast<int32_t>(std::stol(text));
}

AgeLimits RegistrationLogic::load_limits(const char* min_age, const char* max_age) {
    AgeLimits limits;
    if (min_age) {
        limits.min_age = parse_number(min_age, "MIN_AGE");
    }
    if (max_age) {
        limits.max_age = parse_number(max_age, "MAX_AGE");
    }

    throw_if(limits,
             [](const AgeLimits& l) { return l.max_age < l.min_age; },
             ArgumentOutOfRangeError("MAX_AGE", "MAX_AGE must not be below MIN_AGE."));
    return limits;
}

Account RegistrationLogic::handle_register(
    const std::string& username, const std::string& email,
    int32_t age, MembershipTier tier, const AgeLimits& limits) {
    Account account;
    account.username = guard(username, "username")
        .throw_if_null_or_whitespace()
        .throw_if([](const std::string& s) { return s.size() > kMaxUsernameLength; })
        .value();
    account.email = throw_if_not(
        throw_if_null_or_empty(email, "email"),
        [](const std::string& s) { return s.find('@') != std::string::npos; },
        "email");
    account.age = throw_if_out_of_range(age, limits.min_age, limits.max_age, "age");
    account.tier = throw_if_out_of_range(tier, "tier");
    return account;
}

} // namespace registration
