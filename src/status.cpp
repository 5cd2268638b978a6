#include "throwif/status.hpp"

namespace throwif {

grpc::StatusCode to_grpc_status_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument:
            return grpc::StatusCode::INVALID_ARGUMENT;
        case ErrorKind::ArgumentOutOfRange:
            return grpc::StatusCode::OUT_OF_RANGE;
    }
    return grpc::StatusCode::UNKNOWN;
}

grpc::Status to_grpc_status(const ArgumentError& error) {
    return grpc::Status(to_grpc_status_code(error.kind()), error.what());
}

} // namespace throwif
