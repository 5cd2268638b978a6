#pragma once

#include <type_traits>

/**
 * Declares the named members of an enumeration so that
 * throw_if_out_of_range() can test membership.
 *
 * Must be used at global scope, with qualified enumerator names:
 *
 *   enum class Tier { Free = 1, Premium = 2 };
 *   THROWIF_ENUM_MEMBERS(Tier, Tier::Free, Tier::Premium)
 */
#define THROWIF_ENUM_MEMBERS(EnumType, ...) \
    namespace throwif { \
    template<> \
    struct enum_members<EnumType> { \
        static constexpr EnumType values[] = {__VA_ARGS__}; \
    }; \
    }

namespace throwif {

/**
 * Declared members of an enumeration. Specialised by THROWIF_ENUM_MEMBERS.
 */
template<typename E>
struct enum_members {};

namespace traits {

template<typename E, typename = void>
struct has_enum_members : std::false_type {};

template<typename E>
struct has_enum_members<E, std::void_t<decltype(enum_members<E>::values)>>
    : std::is_enum<E> {};

template<typename E>
constexpr bool has_enum_members_v = has_enum_members<E>::value;

/**
 * Exact membership: combinations of flag values are only members when the
 * enumeration declares them.
 */
template<typename E>
constexpr bool is_declared_member(E value) {
    for (const E member : enum_members<E>::values) {
        if (member == value) {
            return true;
        }
    }
    return false;
}

} // namespace traits
} // namespace throwif
