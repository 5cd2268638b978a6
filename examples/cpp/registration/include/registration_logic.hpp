#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "throwif/enum.hpp"

namespace registration {

enum class MembershipTier { Free = 1, Standard = 2, Premium = 3 };

struct AgeLimits {
    int32_t min_age = 13;
    int32_t max_age = 120;
};

struct Account {
    std::string username;
    std::string email;
    int32_t age = 0;
    MembershipTier tier = MembershipTier::Free;
};

class RegistrationLogic {
public:
    static constexpr std::size_t kMaxUsernameLength = 32;

    /// Build age limits from optional MIN_AGE / MAX_AGE values.
    static AgeLimits load_limits(const char* min_age, const char* max_age);

    /// Parse a non-negative decimal number named `name`.
    static int32_t parse_number(const std::string& text, const std::string& name);

    static Account handle_register(
        const std::string& username, const std::string& email,
        int32_t age, MembershipTier tier, const AgeLimits& limits);
};

} // namespace registration

THROWIF_ENUM_MEMBERS(registration::MembershipTier,
                     registration::MembershipTier::Free,
                     registration::MembershipTier::Standard,
                     registration::MembershipTier::Premium)
