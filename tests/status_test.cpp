#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>
#include "throwif/guard.hpp"
#include "throwif/status.hpp"

using namespace throwif;

// =============================================================================
// Status Code Mapping Tests
// =============================================================================

TEST(StatusMappingTest, InvalidArgument_ShouldMapToInvalidArgument) {
    EXPECT_EQ(to_grpc_status_code(ErrorKind::InvalidArgument), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(StatusMappingTest, ArgumentOutOfRange_ShouldMapToOutOfRange) {
    EXPECT_EQ(to_grpc_status_code(ErrorKind::ArgumentOutOfRange), grpc::StatusCode::OUT_OF_RANGE);
}

TEST(StatusMappingTest, Status_ShouldCarryWhatAsMessage) {
    ArgumentError error("The argument is invalid.", "email");
    auto status = to_grpc_status(error);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(status.error_message(), "The argument is invalid. (Parameter 'email')");
}

TEST(StatusMappingTest, CaughtRangeFailure_ShouldMapThroughBaseReference) {
    // Given a range failure caught as its base class
    try {
        throw_if_out_of_range(99, 0, 10, "percent");
        FAIL() << "expected ArgumentOutOfRangeError";
    } catch (const ArgumentError& e) {
        // Then the mapping follows the dynamic kind
        EXPECT_EQ(to_grpc_status(e).error_code(), grpc::StatusCode::OUT_OF_RANGE);
    }
}
