#pragma once

#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include "enum.hpp"
#include "errors.hpp"
#include "traits.hpp"

namespace throwif {

/**
 * Default messages for ArgumentError failures.
 */
namespace messages {
    constexpr const char* NULL_OR_EMPTY =
        "String argument cannot be null and must contain at least one character.";
    constexpr const char* NULL_OR_WHITESPACE =
        "String argument cannot be null and must contain at least one non-whitespace character.";
    constexpr const char* NULL_VALUE = "Argument cannot be null.";
    constexpr const char* INVALID = "The argument is invalid.";
}

namespace detail {

template<typename T>
using enable_if_exception_t = std::enable_if_t<traits::is_failure_v<T>, int>;

/**
 * Throws a caller supplied failure. Argument failures are rethrown with their
 * dynamic type even when held through a base reference; other exceptions are
 * thrown as their static type. A std::exception_ptr rethrows the object it
 * holds.
 */
template<typename Exception>
[[noreturn]] void raise(const Exception& exception) {
    if constexpr (std::is_base_of_v<ArgumentError, Exception>) {
        exception.raise();
    } else {
        throw exception;
    }
}

[[noreturn]] inline void raise(const std::exception_ptr& exception) {
    if (!exception) {
        throw std::bad_exception();
    }
    std::rethrow_exception(exception);
}

template<typename Text>
bool is_null_or_empty(const Text& argument) {
    using text = traits::text_traits<std::decay_t<Text>>;
    static_assert(text::is_text, "argument must be a string, string view, C string or optional text");
    return text::is_null(argument) || text::view(argument).empty();
}

template<typename Text>
bool is_null_or_whitespace(const Text& argument) {
    using text = traits::text_traits<std::decay_t<Text>>;
    static_assert(text::is_text, "argument must be a string, string view, C string or optional text");
    if (text::is_null(argument)) {
        return true;
    }
    for (const auto ch : text::view(argument)) {
        if (!traits::is_whitespace(ch)) {
            return false;
        }
    }
    return true;
}

template<typename T>
bool is_null_or_default(const T& argument) {
    static_assert(traits::has_default_state_v<T>,
                  "argument must be nullable, or default constructible and comparable with its default");
    if constexpr (traits::is_nullable_v<T>) {
        return traits::nullable_traits<T>::is_null(argument);
    } else {
        return traits::is_default(argument);
    }
}

template<typename T>
std::string null_or_default_message() {
    if constexpr (traits::is_nullable_v<T>) {
        return messages::NULL_VALUE;
    } else {
        return "Argument cannot be '" + traits::render_default<T>() + "'.";
    }
}

template<typename E>
bool is_undeclared_member(E argument) {
    static_assert(traits::has_enum_members_v<E>,
                  "enumeration members must be declared with THROWIF_ENUM_MEMBERS");
    return !traits::is_declared_member(argument);
}

template<typename T>
bool is_out_of_range(const T& argument, const T& min_value, const T& max_value) {
    static_assert(traits::is_less_than_comparable_v<T>, "argument must be ordered by operator<");
    return argument < min_value || max_value < argument;
}

template<typename T, typename Predicate>
bool holds(const T& argument, Predicate& condition) {
    static_assert(traits::is_predicate_for_v<T, Predicate>,
                  "condition must be callable with the argument and return bool");
    return static_cast<bool>(std::invoke(condition, argument));
}

} // namespace detail

// =============================================================================
// Null or empty text
// =============================================================================

/**
 * Ensures that the text argument is not null or empty.
 */
template<typename Text, typename Exception, detail::enable_if_exception_t<Exception> = 0>
Text throw_if_null_or_empty(Text&& argument, const Exception& exception) {
    if (detail::is_null_or_empty(argument)) {
        detail::raise(exception);
    }
    return std::forward<Text>(argument);
}

template<typename Text>
Text throw_if_null_or_empty(Text&& argument, const std::string& argument_name = kUnspecified) {
    if (detail::is_null_or_empty(argument)) {
        throw ArgumentError(messages::NULL_OR_EMPTY, argument_name);
    }
    return std::forward<Text>(argument);
}

// =============================================================================
// Null or whitespace text
// =============================================================================

/**
 * Ensures that the text argument is not null, empty, or made only of
 * whitespace.
 */
template<typename Text, typename Exception, detail::enable_if_exception_t<Exception> = 0>
Text throw_if_null_or_whitespace(Text&& argument, const Exception& exception) {
    if (detail::is_null_or_whitespace(argument)) {
        detail::raise(exception);
    }
    return std::forward<Text>(argument);
}

template<typename Text>
Text throw_if_null_or_whitespace(Text&& argument, const std::string& argument_name = kUnspecified) {
    if (detail::is_null_or_whitespace(argument)) {
        throw ArgumentError(messages::NULL_OR_WHITESPACE, argument_name);
    }
    return std::forward<Text>(argument);
}

// =============================================================================
// Null or default
// =============================================================================

/**
 * Ensures that the argument is not null (pointers, smart pointers, optional,
 * std::function) or, for value types, not equal to T{}.
 */
template<typename T, typename Exception, detail::enable_if_exception_t<Exception> = 0>
T throw_if_null_or_default(T&& argument, const Exception& exception) {
    if (detail::is_null_or_default<traits::remove_cvref_t<T>>(argument)) {
        detail::raise(exception);
    }
    return std::forward<T>(argument);
}

template<typename T>
T throw_if_null_or_default(T&& argument, const std::string& argument_name = kUnspecified) {
    using value_type = traits::remove_cvref_t<T>;
    if (detail::is_null_or_default<value_type>(argument)) {
        throw ArgumentError(detail::null_or_default_message<value_type>(), argument_name);
    }
    return std::forward<T>(argument);
}

// =============================================================================
// Enumeration membership
// =============================================================================

/**
 * Ensures that the argument is one of the declared members of its
 * enumeration.
 */
template<typename E, typename Exception, detail::enable_if_exception_t<Exception> = 0>
E throw_if_out_of_range(E&& argument, const Exception& exception) {
    if (detail::is_undeclared_member<traits::remove_cvref_t<E>>(argument)) {
        detail::raise(exception);
    }
    return std::forward<E>(argument);
}

template<typename E>
E throw_if_out_of_range(E&& argument, const std::string& argument_name = kUnspecified) {
    if (detail::is_undeclared_member<traits::remove_cvref_t<E>>(argument)) {
        throw ArgumentOutOfRangeError(argument_name);
    }
    return std::forward<E>(argument);
}

// =============================================================================
// Inclusive range
// =============================================================================

/**
 * Ensures that min_value <= argument <= max_value.
 */
template<typename T, typename Exception, detail::enable_if_exception_t<Exception> = 0>
T throw_if_out_of_range(T&& argument,
                         const traits::remove_cvref_t<T>& min_value,
                         const traits::remove_cvref_t<T>& max_value,
                         const Exception& exception) {
    if (detail::is_out_of_range<traits::remove_cvref_t<T>>(argument, min_value, max_value)) {
        detail::raise(exception);
    }
    return std::forward<T>(argument);
}

template<typename T>
T throw_if_out_of_range(T&& argument,
                         const traits::remove_cvref_t<T>& min_value,
                         const traits::remove_cvref_t<T>& max_value,
                         const std::string& argument_name = kUnspecified) {
    if (detail::is_out_of_range<traits::remove_cvref_t<T>>(argument, min_value, max_value)) {
        throw ArgumentOutOfRangeError(argument_name);
    }
    return std::forward<T>(argument);
}

// =============================================================================
// Custom conditions
// =============================================================================

/**
 * Throws if the condition evaluates to true.
 */
template<typename T, typename Predicate, typename Exception, detail::enable_if_exception_t<Exception> = 0>
T throw_if(T&& argument, Predicate&& condition, const Exception& exception) {
    if (detail::holds<traits::remove_cvref_t<T>>(argument, condition)) {
        detail::raise(exception);
    }
    return std::forward<T>(argument);
}

template<typename T, typename Predicate>
T throw_if(T&& argument, Predicate&& condition, const std::string& argument_name = kUnspecified) {
    if (detail::holds<traits::remove_cvref_t<T>>(argument, condition)) {
        throw ArgumentError(messages::INVALID, argument_name);
    }
    return std::forward<T>(argument);
}

/**
 * Throws if the condition evaluates to false.
 */
template<typename T, typename Predicate, typename Exception, detail::enable_if_exception_t<Exception> = 0>
T throw_if_not(T&& argument, Predicate&& condition, const Exception& exception) {
    if (!detail::holds<traits::remove_cvref_t<T>>(argument, condition)) {
        detail::raise(exception);
    }
    return std::forward<T>(argument);
}

template<typename T, typename Predicate>
T throw_if_not(T&& argument, Predicate&& condition, const std::string& argument_name = kUnspecified) {
    if (!detail::holds<traits::remove_cvref_t<T>>(argument, condition)) {
        throw ArgumentError(messages::INVALID, argument_name);
    }
    return std::forward<T>(argument);
}

} // namespace throwif
