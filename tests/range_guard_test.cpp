#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include "throwif/guard.hpp"

namespace test_enums {

enum class Weekday { Monday = 1, Tuesday = 2, Wednesday = 3 };

enum Permission : std::uint8_t {
    Read = 1,
    Write = 2,
    ReadWrite = 3,
    Execute = 4
};

} // namespace test_enums

THROWIF_ENUM_MEMBERS(test_enums::Weekday,
                     test_enums::Weekday::Monday,
                     test_enums::Weekday::Tuesday,
                     test_enums::Weekday::Wednesday)

THROWIF_ENUM_MEMBERS(test_enums::Permission,
                     test_enums::Read,
                     test_enums::Write,
                     test_enums::ReadWrite,
                     test_enums::Execute)

using namespace throwif;
using test_enums::Permission;
using test_enums::Weekday;

// =============================================================================
// Inclusive Range Tests
// =============================================================================

TEST(RangeTest, AboveMaximum_ShouldThrowOutOfRange) {
    EXPECT_THROW(throw_if_out_of_range(11, 1, 10), ArgumentOutOfRangeError);
}

TEST(RangeTest, BelowMinimum_ShouldThrowOutOfRange) {
    EXPECT_THROW(throw_if_out_of_range(0, 1, 10, "count"), ArgumentOutOfRangeError);
}

TEST(RangeTest, InsideRange_ShouldReturnValue) {
    int value = 5;
    int& result = throw_if_out_of_range(value, 1, 10);
    EXPECT_EQ(&result, &value);
    EXPECT_EQ(result, 5);
}

TEST(RangeTest, Bounds_ShouldBeInclusive) {
    EXPECT_EQ(throw_if_out_of_range(1, 1, 10), 1);
    EXPECT_EQ(throw_if_out_of_range(10, 1, 10), 10);
    EXPECT_EQ(throw_if_out_of_range(4, 4, 4), 4);
}

TEST(RangeTest, OneBelowMinimum_ShouldAlwaysThrow) {
    for (int min = -3; min <= 3; ++min) {
        EXPECT_THROW(throw_if_out_of_range(min - 1, min, min + 5), ArgumentOutOfRangeError);
    }
}

TEST(RangeTest, IntegerLimits_ShouldBeAccepted) {
    constexpr auto lowest = std::numeric_limits<std::int64_t>::min();
    constexpr auto highest = std::numeric_limits<std::int64_t>::max();
    EXPECT_EQ(throw_if_out_of_range(lowest, lowest, highest), lowest);
    EXPECT_EQ(throw_if_out_of_range(highest, lowest, highest), highest);
}

TEST(RangeTest, Doubles_ShouldConvertBounds) {
    EXPECT_EQ(throw_if_out_of_range(0.5, 0, 1), 0.5);
    EXPECT_THROW(throw_if_out_of_range(1.0001, 0, 1), ArgumentOutOfRangeError);
}

TEST(RangeTest, Strings_ShouldUseLexicographicOrder) {
    std::string word = "kiwi";
    EXPECT_EQ(throw_if_out_of_range(word, "apple", "mango"), "kiwi");
    EXPECT_THROW(throw_if_out_of_range(std::string("zebra"), "apple", "mango"),
                 ArgumentOutOfRangeError);
}

TEST(RangeTest, Failure_ShouldCarryNameAndDefaultMessage) {
    try {
        throw_if_out_of_range(11, 1, 10, "quantity");
        FAIL() << "expected ArgumentOutOfRangeError";
    } catch (const ArgumentOutOfRangeError& e) {
        EXPECT_EQ(e.argument_name(), "quantity");
        EXPECT_EQ(e.message(), ArgumentOutOfRangeError::kDefaultMessage);
        EXPECT_EQ(e.kind(), ErrorKind::ArgumentOutOfRange);
    }
}

TEST(RangeTest, CustomException_ShouldBeThrownVerbatim) {
    EXPECT_THROW(throw_if_out_of_range(42, 0, 10, std::out_of_range("answer too large")),
                 std::out_of_range);
}

// =============================================================================
// Enumeration Membership Tests
// =============================================================================

TEST(EnumMembershipTest, DeclaredMember_ShouldReturnValue) {
    Weekday day = Weekday::Tuesday;
    Weekday& result = throw_if_out_of_range(day, "day");
    EXPECT_EQ(&result, &day);
}

TEST(EnumMembershipTest, UndeclaredValue_ShouldThrowOutOfRange) {
    auto day = static_cast<Weekday>(7);
    EXPECT_THROW(throw_if_out_of_range(day, "day"), ArgumentOutOfRangeError);
}

TEST(EnumMembershipTest, ZeroValue_ShouldThrowWhenNotDeclared) {
    EXPECT_THROW(throw_if_out_of_range(Weekday{}), ArgumentOutOfRangeError);
}

TEST(EnumMembershipTest, DeclaredCombination_ShouldPass) {
    auto combined = static_cast<Permission>(test_enums::Read | test_enums::Write);
    EXPECT_EQ(throw_if_out_of_range(combined), test_enums::ReadWrite);
}

TEST(EnumMembershipTest, UndeclaredCombination_ShouldThrow) {
    auto combined = static_cast<Permission>(test_enums::Read | test_enums::Execute);
    EXPECT_THROW(throw_if_out_of_range(combined, "permission"), ArgumentOutOfRangeError);
}

TEST(EnumMembershipTest, Failure_ShouldCarryName) {
    try {
        throw_if_out_of_range(static_cast<Weekday>(0), "day");
        FAIL() << "expected ArgumentOutOfRangeError";
    } catch (const ArgumentOutOfRangeError& e) {
        EXPECT_EQ(e.argument_name(), "day");
    }
}

TEST(EnumMembershipTest, CustomException_ShouldBeThrownVerbatim) {
    EXPECT_THROW(throw_if_out_of_range(static_cast<Weekday>(9), std::invalid_argument("weekday")),
                 std::invalid_argument);
}

TEST(EnumMembershipTest, MembershipTest_ShouldBeUsableAtCompileTime) {
    static_assert(traits::is_declared_member(Weekday::Wednesday));
    static_assert(!traits::is_declared_member(static_cast<Weekday>(4)));
    static_assert(traits::has_enum_members_v<Weekday>);
    static_assert(!traits::has_enum_members_v<int>);
}
