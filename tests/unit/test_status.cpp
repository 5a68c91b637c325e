#include <gtest/gtest.h>
#include "contract/status.h"

using namespace costconform;

// ========== Status codes ==========

TEST(StatusTest, test_default_status_is_ok) {
    Status status;
    EXPECT_TRUE(status.is_ok());
    EXPECT_EQ(status.code(), StatusCode::Ok);
    EXPECT_EQ(status.to_string(), "OK");
}

TEST(StatusTest, test_codes_follow_rpc_numbering) {
    EXPECT_EQ(static_cast<int>(StatusCode::InvalidArgument), 3);
    EXPECT_EQ(static_cast<int>(StatusCode::DeadlineExceeded), 4);
    EXPECT_EQ(static_cast<int>(StatusCode::Unimplemented), 12);
    EXPECT_EQ(static_cast<int>(StatusCode::Internal), 13);
}

TEST(StatusTest, test_code_names_round_trip) {
    for (StatusCode code : {StatusCode::Cancelled, StatusCode::NotFound,
                            StatusCode::ResourceExhausted, StatusCode::Unavailable}) {
        auto parsed = status_code_from_name(status_code_name(code));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, code);
    }
    EXPECT_FALSE(status_code_from_name("NOT_A_CODE").has_value());
}

// ========== Origin ==========

TEST(StatusTest, test_handler_status_is_not_timeout) {
    Status status(StatusCode::DeadlineExceeded, "plugin said so");
    EXPECT_FALSE(status.from_transport());
    EXPECT_FALSE(status.is_timeout());
}

TEST(StatusTest, test_transport_deadline_is_timeout) {
    Status status = Status::transport(StatusCode::DeadlineExceeded, "late");
    EXPECT_TRUE(status.is_timeout());
    EXPECT_FALSE(status.is_cancellation());
    EXPECT_EQ(status.to_string(), "DEADLINE_EXCEEDED: late (transport)");
}

TEST(StatusTest, test_transport_cancel_is_cancellation) {
    Status status = Status::transport(StatusCode::Cancelled, "gone");
    EXPECT_TRUE(status.is_cancellation());
    EXPECT_FALSE(status.is_timeout());
}

TEST(StatusTest, test_recovered_fault_keeps_message) {
    Status status = Status::recovered_fault("boom");
    EXPECT_EQ(status.code(), StatusCode::Internal);
    EXPECT_TRUE(status.from_transport());
    EXPECT_TRUE(status.is_recovered_fault());
    EXPECT_NE(status.message().find("boom"), std::string::npos);
}

TEST(StatusTest, test_rpc_result_needs_response) {
    RpcResult<int> result;
    EXPECT_FALSE(result.ok());
    result.response = 7;
    EXPECT_TRUE(result.ok());
    result.status = Status(StatusCode::Internal, "x");
    EXPECT_FALSE(result.ok());
}
