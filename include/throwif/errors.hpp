#pragma once

#include <stdexcept>
#include <string>

namespace throwif {

/**
 * Argument name used when the caller does not supply one.
 */
constexpr const char* kUnspecified = "unspecified";

/**
 * Kind of a failed argument check.
 */
enum class ErrorKind {
    InvalidArgument,
    ArgumentOutOfRange
};

const char* to_string(ErrorKind kind);

/**
 * Thrown when an argument fails a precondition check.
 *
 * what() carries the message followed by the argument name, e.g.
 * "The argument is invalid. (Parameter 'email')".
 */
class ArgumentError : public std::invalid_argument {
public:
    explicit ArgumentError(const std::string& message,
                           const std::string& argument_name = kUnspecified);

    /**
     * The message without the argument name suffix.
     */
    const std::string& message() const { return message_; }

    const std::string& argument_name() const { return argument_name_; }

    virtual ErrorKind kind() const { return ErrorKind::InvalidArgument; }

    /**
     * Returns true for every argument failure.
     */
    virtual bool is_invalid_argument() const { return true; }

    /**
     * Returns true if the argument was outside its valid range or set.
     */
    virtual bool is_out_of_range() const { return false; }

    /**
     * Throws a copy of this error with its dynamic type.
     */
    [[noreturn]] virtual void raise() const;

private:
    std::string message_;
    std::string argument_name_;
};

/**
 * Thrown when an argument is outside an inclusive range or is not a
 * declared member of its enumeration.
 */
class ArgumentOutOfRangeError : public ArgumentError {
public:
    static constexpr const char* kDefaultMessage =
        "Specified argument was out of the range of valid values.";

    explicit ArgumentOutOfRangeError(const std::string& argument_name = kUnspecified)
        : ArgumentError(kDefaultMessage, argument_name) {}

    ArgumentOutOfRangeError(const std::string& argument_name, const std::string& message)
        : ArgumentError(message, argument_name) {}

    ErrorKind kind() const override { return ErrorKind::ArgumentOutOfRange; }

    bool is_out_of_range() const override { return true; }

    [[noreturn]] void raise() const override;
};

} // namespace throwif
