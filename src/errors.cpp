#include "throwif/errors.hpp"

namespace throwif {

namespace {

std::string format_what(const std::string& message, const std::string& argument_name) {
    return message + " (Parameter '" + argument_name + "')";
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument:
            return "invalid_argument";
        case ErrorKind::ArgumentOutOfRange:
            return "argument_out_of_range";
    }
    return "unknown";
}

ArgumentError::ArgumentError(const std::string& message, const std::string& argument_name)
    : std::invalid_argument(format_what(message, argument_name)),
      message_(message),
      argument_name_(argument_name) {}

void ArgumentError::raise() const {
    throw *this;
}

void ArgumentOutOfRangeError::raise() const {
    throw *this;
}

} // namespace throwif
