/**
 * @file test_api_codec.cpp
 * @brief Unit tests for the API wire codec.
 * @author Dimitris Kafetzis
 */

#include "api/api_codec.hpp"

#include <gtest/gtest.h>

using namespace kubesim;

TEST(ApiCodecTest, BigEndianHelpers) {
    std::vector<uint8_t> buf;
    ApiCodec::put_u32(buf, 0x01020304u);
    ApiCodec::put_u64(buf, 0x0A0B0C0D0E0F1011ull);
    ASSERT_EQ(buf.size(), 12u);
    EXPECT_EQ(buf[0], 0x01);
    EXPECT_EQ(buf[3], 0x04);
    EXPECT_EQ(buf[4], 0x0A);
    EXPECT_EQ(ApiCodec::get_u32(buf.data()), 0x01020304u);
    EXPECT_EQ(ApiCodec::get_u64(buf.data() + 4), 0x0A0B0C0D0E0F1011ull);
}

TEST(ApiCodecTest, RequestRoundTrip) {
    ApiRequest request;
    request.op = ApiOp::DeleteWorkload;
    request.id = "web-3";
    request.resources = {2, 1024};
    request.replicas = 4;
    request.expected_revision = 17;
    request.phase_filter = static_cast<uint8_t>(WorkloadPhase::Running);
    request.succeeded = false;

    auto decoded = ApiCodec::decode_request(ApiCodec::encode_request(request));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->op, ApiOp::DeleteWorkload);
    EXPECT_EQ(decoded->id, "web-3");
    EXPECT_EQ(decoded->resources, (Resources{2, 1024}));
    EXPECT_EQ(decoded->replicas, 4u);
    EXPECT_EQ(decoded->expected_revision, Revision{17});
    EXPECT_EQ(decoded->phase_filter, static_cast<uint8_t>(WorkloadPhase::Running));
    EXPECT_FALSE(decoded->succeeded);
}

TEST(ApiCodecTest, AbsentOptionalsStayAbsent) {
    ApiRequest request;
    request.op = ApiOp::ListNodes;

    auto decoded = ApiCodec::decode_request(ApiCodec::encode_request(request));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->expected_revision.has_value());
    EXPECT_FALSE(decoded->phase_filter.has_value());
}

TEST(ApiCodecTest, RejectsTruncatedRequest) {
    ApiRequest request;
    request.op = ApiOp::GetNode;
    request.id = "node-a";
    auto bytes = ApiCodec::encode_request(request);
    bytes.pop_back();

    auto decoded = ApiCodec::decode_request(bytes);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::Validation);
}

TEST(ApiCodecTest, RejectsTrailingBytes) {
    auto bytes = ApiCodec::encode_request(ApiRequest{});
    bytes.push_back(0x00);
    EXPECT_FALSE(ApiCodec::decode_request(bytes).has_value());
}

TEST(ApiCodecTest, RejectsOversizedStringLength) {
    std::vector<uint8_t> bytes{static_cast<uint8_t>(ApiOp::GetNode)};
    ApiCodec::put_u32(bytes, 0xFFFFFFFFu);
    EXPECT_FALSE(ApiCodec::decode_request(bytes).has_value());
}

TEST(ApiCodecTest, RejectsUnknownOp) {
    auto bytes = ApiCodec::encode_request(ApiRequest{});
    bytes[0] = kApiOpCount;

    auto decoded = ApiCodec::decode_request(bytes);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::Validation);
}

TEST(ApiCodecTest, ResponseCarriesStatusViews) {
    ApiResponse response;
    response.message = "ok";
    response.nodes.push_back(NodeStatus{
        .id = "node-a", .phase = NodePhase::Ready, .capacity = {4, 4096},
        .free = {1, 3584}, .workload_count = 1, .message = {}, .revision = 5
    });
    WorkloadStatus pending;
    pending.id = "w2";
    pending.group = "w2";
    pending.request = {3, 512};
    pending.scheduling = "cannot fit";
    pending.last_checked = Timestamp{std::chrono::milliseconds{1700000000123}};
    pending.revision = 1;
    response.workloads.push_back(pending);

    WorkloadStatus running;
    running.id = "w1";
    running.phase = WorkloadPhase::Running;
    running.node = "node-a";
    response.workloads.push_back(running);

    auto decoded = ApiCodec::decode_response(ApiCodec::encode_response(response));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_TRUE(decoded->ok());
    ASSERT_EQ(decoded->nodes.size(), 1u);
    EXPECT_EQ(decoded->nodes[0].free, (Resources{1, 3584}));
    EXPECT_EQ(decoded->nodes[0].revision, 5u);

    ASSERT_EQ(decoded->workloads.size(), 2u);
    const auto& w2 = decoded->workloads[0];
    EXPECT_EQ(w2.scheduling, std::string{"cannot fit"});
    EXPECT_EQ(w2.last_checked, pending.last_checked);
    EXPECT_FALSE(w2.node.has_value());

    const auto& w1 = decoded->workloads[1];
    EXPECT_EQ(w1.node, NodeId{"node-a"});
    EXPECT_FALSE(w1.scheduling.has_value());
    EXPECT_FALSE(w1.last_checked.has_value());
}

TEST(ApiCodecTest, ErrorResponse) {
    auto bytes = ApiCodec::encode_response(
        ApiResponse::failure(Error{ErrorCode::Conflict, "node 'a' is at revision 3"}));
    EXPECT_EQ(bytes[0], 1 + static_cast<uint8_t>(ErrorCode::Conflict));

    auto decoded = ApiCodec::decode_response(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->ok());
    EXPECT_EQ(decoded->error, ErrorCode::Conflict);
    EXPECT_EQ(decoded->message, "node 'a' is at revision 3");
}

TEST(ApiCodecTest, RejectsInvalidPhaseInResponse) {
    ApiResponse response;
    response.nodes.push_back(NodeStatus{});
    auto bytes = ApiCodec::encode_response(response);
    // status(1) + message(4) + count(4) + id length(4) = phase offset
    bytes[13] = 0xEE;
    EXPECT_FALSE(ApiCodec::decode_response(bytes).has_value());
}

TEST(ApiCodecTest, RejectsUnknownStatus) {
    auto bytes = ApiCodec::encode_response(ApiResponse{});
    bytes[0] = 0x7F;
    EXPECT_FALSE(ApiCodec::decode_response(bytes).has_value());
}
