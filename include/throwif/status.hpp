#pragma once

#include <grpcpp/grpcpp.h>
#include "errors.hpp"

namespace throwif {

/**
 * Status code a failed argument check is reported with.
 */
grpc::StatusCode to_grpc_status_code(ErrorKind kind);

/**
 * Convert a failed argument check into a gRPC status carrying what().
 */
grpc::Status to_grpc_status(const ArgumentError& error);

} // namespace throwif
