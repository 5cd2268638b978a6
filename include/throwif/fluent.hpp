#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include "errors.hpp"
#include "guard.hpp"

namespace throwif {

/**
 * Fluent checks on one named argument.
 *
 * Usage:
 *   const auto& name = throwif::guard(request.name, "name")
 *       .throw_if_null_or_whitespace()
 *       .throw_if([](const std::string& s) { return s.size() > 64; })
 *       .value();
 *
 * The first failing check throws; the checks after it never run.
 */
template<typename T>
class Guard {
public:
    using value_type = std::remove_cv_t<T>;

    Guard(T& argument, std::string argument_name)
        : argument_(&argument), argument_name_(std::move(argument_name)) {}

    T& value() const { return *argument_; }
    const std::string& argument_name() const { return argument_name_; }

    Guard& throw_if_null_or_empty() {
        ::throwif::throw_if_null_or_empty(*argument_, argument_name_);
        return *this;
    }

    template<typename Exception, detail::enable_if_exception_t<Exception> = 0>
    Guard& throw_if_null_or_empty(const Exception& exception) {
        ::throwif::throw_if_null_or_empty(*argument_, exception);
        return *this;
    }

    Guard& throw_if_null_or_whitespace() {
        ::throwif::throw_if_null_or_whitespace(*argument_, argument_name_);
        return *this;
    }

    template<typename Exception, detail::enable_if_exception_t<Exception> = 0>
    Guard& throw_if_null_or_whitespace(const Exception& exception) {
        ::throwif::throw_if_null_or_whitespace(*argument_, exception);
        return *this;
    }

    Guard& throw_if_null_or_default() {
        ::throwif::throw_if_null_or_default(*argument_, argument_name_);
        return *this;
    }

    template<typename Exception, detail::enable_if_exception_t<Exception> = 0>
    Guard& throw_if_null_or_default(const Exception& exception) {
        ::throwif::throw_if_null_or_default(*argument_, exception);
        return *this;
    }

    /**
     * Enumeration membership.
     */
    Guard& throw_if_out_of_range() {
        ::throwif::throw_if_out_of_range(*argument_, argument_name_);
        return *this;
    }

    template<typename Exception, detail::enable_if_exception_t<Exception> = 0>
    Guard& throw_if_out_of_range(const Exception& exception) {
        ::throwif::throw_if_out_of_range(*argument_, exception);
        return *this;
    }

    /**
     * Inclusive range.
     */
    Guard& throw_if_out_of_range(const value_type& min_value, const value_type& max_value) {
        ::throwif::throw_if_out_of_range(*argument_, min_value, max_value, argument_name_);
        return *this;
    }

    template<typename Exception, detail::enable_if_exception_t<Exception> = 0>
    Guard& throw_if_out_of_range(const value_type& min_value, const value_type& max_value,
                                 const Exception& exception) {
        ::throwif::throw_if_out_of_range(*argument_, min_value, max_value, exception);
        return *this;
    }

    template<typename Predicate>
    Guard& throw_if(Predicate&& condition) {
        ::throwif::throw_if(*argument_, std::forward<Predicate>(condition), argument_name_);
        return *this;
    }

    template<typename Predicate, typename Exception, detail::enable_if_exception_t<Exception> = 0>
    Guard& throw_if(Predicate&& condition, const Exception& exception) {
        ::throwif::throw_if(*argument_, std::forward<Predicate>(condition), exception);
        return *this;
    }

    template<typename Predicate>
    Guard& throw_if_not(Predicate&& condition) {
        ::throwif::throw_if_not(*argument_, std::forward<Predicate>(condition), argument_name_);
        return *this;
    }

    template<typename Predicate, typename Exception, detail::enable_if_exception_t<Exception> = 0>
    Guard& throw_if_not(Predicate&& condition, const Exception& exception) {
        ::throwif::throw_if_not(*argument_, std::forward<Predicate>(condition), exception);
        return *this;
    }

private:
    T* argument_;
    std::string argument_name_;
};

/**
 * Start a fluent chain on an lvalue argument.
 */
template<typename T>
Guard<T> guard(T& argument, std::string argument_name = kUnspecified) {
    return Guard<T>(argument, std::move(argument_name));
}

// A guard on a temporary would outlive it.
template<typename T>
void guard(const T&& argument, std::string argument_name = kUnspecified) = delete;

} // namespace throwif
