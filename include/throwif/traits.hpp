#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace throwif {
namespace traits {

template<typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template<typename T>
constexpr bool is_character_v =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
    std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

template<typename T>
constexpr bool is_exception_v = std::is_base_of_v<std::exception, remove_cvref_t<T>>;

// Anything a guard accepts as a custom failure.
template<typename T>
constexpr bool is_failure_v =
    is_exception_v<T> || std::is_same_v<remove_cvref_t<T>, std::exception_ptr>;

// =============================================================================
// Text
// =============================================================================

/**
 * Describes how to test a text-like type for absence and how to view its
 * characters. Specialised for strings, string views, C strings and optional
 * text.
 */
template<typename T, typename = void>
struct text_traits {
    static constexpr bool is_text = false;
};

template<typename CharT, typename Traits, typename Alloc>
struct text_traits<std::basic_string<CharT, Traits, Alloc>> {
    static constexpr bool is_text = true;
    using char_type = CharT;
    using view_type = std::basic_string_view<CharT, Traits>;

    static bool is_null(const std::basic_string<CharT, Traits, Alloc>&) { return false; }
    static view_type view(const std::basic_string<CharT, Traits, Alloc>& text) { return text; }
};

template<typename CharT, typename Traits>
struct text_traits<std::basic_string_view<CharT, Traits>> {
    static constexpr bool is_text = true;
    using char_type = CharT;
    using view_type = std::basic_string_view<CharT, Traits>;

    static bool is_null(std::basic_string_view<CharT, Traits> text) { return text.data() == nullptr; }
    static view_type view(std::basic_string_view<CharT, Traits> text) { return text; }
};

template<typename CharT>
struct text_traits<CharT*, std::enable_if_t<is_character_v<std::remove_const_t<CharT>>>> {
    static constexpr bool is_text = true;
    using char_type = std::remove_const_t<CharT>;
    using view_type = std::basic_string_view<char_type>;

    static bool is_null(const char_type* text) { return text == nullptr; }
    static view_type view(const char_type* text) { return view_type(text); }
};

template<typename T>
struct text_traits<std::optional<T>, std::enable_if_t<text_traits<T>::is_text>> {
    static constexpr bool is_text = true;
    using char_type = typename text_traits<T>::char_type;
    using view_type = typename text_traits<T>::view_type;

    static bool is_null(const std::optional<T>& text) {
        return !text.has_value() || text_traits<T>::is_null(*text);
    }
    static view_type view(const std::optional<T>& text) { return text_traits<T>::view(*text); }
};

template<typename T>
constexpr bool is_text_v = text_traits<std::decay_t<T>>::is_text;

/**
 * Locale independent whitespace test. Narrow characters use the ASCII set;
 * wide characters also accept the Unicode space separators.
 */
template<typename CharT>
constexpr bool is_whitespace(CharT ch) {
    const auto code = static_cast<std::uint32_t>(static_cast<std::make_unsigned_t<CharT>>(ch));
    if (code == 0x20 || (code >= 0x09 && code <= 0x0D)) {
        return true;
    }
    if constexpr (sizeof(CharT) == 1) {
        return false;
    } else {
        switch (code) {
            case 0x0085:
            case 0x00A0:
            case 0x1680:
            case 0x2028:
            case 0x2029:
            case 0x202F:
            case 0x205F:
            case 0x3000:
                return true;
            default:
                return code >= 0x2000 && code <= 0x200A;
        }
    }
}

// =============================================================================
// Nullable
// =============================================================================

/**
 * Types with an absent state. These are only ever tested for absence, never
 * against a default value.
 */
template<typename T, typename = void>
struct nullable_traits {
    static constexpr bool is_nullable = false;
};

template<typename T>
struct nullable_traits<T*> {
    static constexpr bool is_nullable = true;
    static bool is_null(const T* value) { return value == nullptr; }
};

template<>
struct nullable_traits<std::nullptr_t> {
    static constexpr bool is_nullable = true;
    static bool is_null(std::nullptr_t) { return true; }
};

template<typename T, typename Deleter>
struct nullable_traits<std::unique_ptr<T, Deleter>> {
    static constexpr bool is_nullable = true;
    static bool is_null(const std::unique_ptr<T, Deleter>& value) { return !value; }
};

template<typename T>
struct nullable_traits<std::shared_ptr<T>> {
    static constexpr bool is_nullable = true;
    static bool is_null(const std::shared_ptr<T>& value) { return !value; }
};

template<typename T>
struct nullable_traits<std::optional<T>> {
    static constexpr bool is_nullable = true;
    static bool is_null(const std::optional<T>& value) { return !value.has_value(); }
};

template<typename Signature>
struct nullable_traits<std::function<Signature>> {
    static constexpr bool is_nullable = true;
    static bool is_null(const std::function<Signature>& value) { return !value; }
};

template<typename T>
constexpr bool is_nullable_v = nullable_traits<remove_cvref_t<T>>::is_nullable;

// =============================================================================
// Comparison and rendering
// =============================================================================

template<typename T, typename = void>
struct is_equality_comparable : std::false_type {};

template<typename T>
struct is_equality_comparable<T, std::void_t<
    decltype(static_cast<bool>(std::declval<const T&>() == std::declval<const T&>()))>>
    : std::true_type {};

template<typename T>
constexpr bool is_equality_comparable_v = is_equality_comparable<T>::value;

template<typename T, typename = void>
struct is_less_than_comparable : std::false_type {};

template<typename T>
struct is_less_than_comparable<T, std::void_t<
    decltype(static_cast<bool>(std::declval<const T&>() < std::declval<const T&>()))>>
    : std::true_type {};

template<typename T>
constexpr bool is_less_than_comparable_v = is_less_than_comparable<T>::value;

template<typename T, typename = void>
struct is_streamable : std::false_type {};

template<typename T>
struct is_streamable<T, std::void_t<
    decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template<typename T>
constexpr bool is_streamable_v = is_streamable<T>::value;

// Plain structs without operator== can still be compared when every bit of
// their object representation takes part in the value.
template<typename T>
constexpr bool is_bytewise_comparable_v =
    std::is_trivially_copyable_v<T> && std::has_unique_object_representations_v<T>;

template<typename T>
constexpr bool has_default_state_v =
    is_nullable_v<T> ||
    (std::is_default_constructible_v<T> &&
     (is_equality_comparable_v<T> || is_bytewise_comparable_v<T>));

template<typename T, typename Predicate>
constexpr bool is_predicate_for_v =
    std::is_invocable_r_v<bool, Predicate&, const remove_cvref_t<T>&>;

/**
 * Returns true if the value equals the value-initialised state of its type.
 */
template<typename T>
bool is_default(const T& value) {
    const T zero{};
    if constexpr (is_equality_comparable_v<T>) {
        return static_cast<bool>(value == zero);
    } else {
        return std::memcmp(std::addressof(value), std::addressof(zero), sizeof(T)) == 0;
    }
}

/**
 * Text rendering of T{} for diagnostics.
 */
template<typename T>
std::string render_default() {
    const T zero{};
    std::ostringstream out;
    out << std::boolalpha;
    if constexpr (std::is_enum_v<T>) {
        out << +static_cast<std::underlying_type_t<T>>(zero);
    } else if constexpr (is_character_v<T> || std::is_same_v<T, signed char> ||
                         std::is_same_v<T, unsigned char>) {
        out << static_cast<std::uint32_t>(zero);
    } else if constexpr (is_streamable_v<T>) {
        out << zero;
    } else {
        return "default value";
    }
    return out.str();
}

} // namespace traits
} // namespace throwif
