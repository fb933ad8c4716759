/**
 * @file api_codec.cpp
 * @brief ApiCodec binary serialization for the API surface.
 * @author Dimitris Kafetzis
 */

#include "api/api_codec.hpp"

#include <chrono>

namespace kubesim {

namespace {

constexpr uint8_t STATUS_OK = 0x00;
constexpr uint8_t MAX_ERROR_CODE = static_cast<uint8_t>(ErrorCode::Runtime);

/**
 * @brief Bounds-checked cursor over a received buffer.
 *
 * Every read fails once the buffer is exhausted; callers check ok() once
 * at the end instead of after each field.
 */
class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data) {}

    uint8_t u8() {
        if (!take(1)) return 0;
        return data_[offset_ - 1];
    }

    uint32_t u32() {
        if (!take(4)) return 0;
        return ApiCodec::get_u32(data_.data() + offset_ - 4);
    }

    uint64_t u64() {
        if (!take(8)) return 0;
        return ApiCodec::get_u64(data_.data() + offset_ - 8);
    }

    std::string str() {
        uint32_t len = u32();
        if (!take(len)) return {};
        return std::string(reinterpret_cast<const char*>(data_.data() + offset_ - len), len);
    }

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] bool at_end() const noexcept { return offset_ == data_.size(); }

private:
    bool take(size_t n) {
        if (!ok_ || data_.size() - offset_ < n) {
            ok_ = false;
            return false;
        }
        offset_ += n;
        return true;
    }

    const std::vector<uint8_t>& data_;
    size_t offset_ = 0;
    bool ok_ = true;
};

Error malformed(const std::string& what) {
    return Error{ErrorCode::Validation, "malformed " + what};
}

void put_resources(std::vector<uint8_t>& buf, const Resources& r) {
    ApiCodec::put_u32(buf, r.cpu);
    ApiCodec::put_u64(buf, r.memory_mb);
}

Resources get_resources(Reader& in) {
    Resources r;
    r.cpu = in.u32();
    r.memory_mb = in.u64();
    return r;
}

void put_node(std::vector<uint8_t>& buf, const NodeStatus& node) {
    ApiCodec::put_str(buf, node.id);
    buf.push_back(static_cast<uint8_t>(node.phase));
    put_resources(buf, node.capacity);
    put_resources(buf, node.free);
    ApiCodec::put_u32(buf, node.workload_count);
    ApiCodec::put_str(buf, node.message);
    ApiCodec::put_u64(buf, node.revision);
}

NodeStatus get_node(Reader& in, bool& valid) {
    NodeStatus node;
    node.id = in.str();
    uint8_t phase = in.u8();
    valid = valid && phase <= static_cast<uint8_t>(NodePhase::Deleted);
    node.phase = static_cast<NodePhase>(phase);
    node.capacity = get_resources(in);
    node.free = get_resources(in);
    node.workload_count = in.u32();
    node.message = in.str();
    node.revision = in.u64();
    return node;
}

void put_workload(std::vector<uint8_t>& buf, const WorkloadStatus& workload) {
    ApiCodec::put_str(buf, workload.id);
    ApiCodec::put_str(buf, workload.group);
    buf.push_back(static_cast<uint8_t>(workload.phase));
    buf.push_back(workload.node ? 1 : 0);
    ApiCodec::put_str(buf, workload.node.value_or(""));
    put_resources(buf, workload.request);
    ApiCodec::put_str(buf, workload.message);
    buf.push_back(workload.scheduling ? 1 : 0);
    ApiCodec::put_str(buf, workload.scheduling.value_or(""));

    uint64_t checked_ms = 0;
    if (workload.last_checked) {
        checked_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            workload.last_checked->time_since_epoch()).count());
    }
    ApiCodec::put_u64(buf, checked_ms);
    ApiCodec::put_u64(buf, workload.revision);
}

WorkloadStatus get_workload(Reader& in, bool& valid) {
    WorkloadStatus workload;
    workload.id = in.str();
    workload.group = in.str();
    uint8_t phase = in.u8();
    valid = valid && phase <= static_cast<uint8_t>(WorkloadPhase::Terminated);
    workload.phase = static_cast<WorkloadPhase>(phase);

    bool has_node = in.u8() != 0;
    std::string node = in.str();
    if (has_node) workload.node = std::move(node);

    workload.request = get_resources(in);
    workload.message = in.str();

    bool has_scheduling = in.u8() != 0;
    std::string scheduling = in.str();
    uint64_t checked_ms = in.u64();
    if (has_scheduling) {
        workload.scheduling = std::move(scheduling);
        workload.last_checked = Timestamp{std::chrono::milliseconds{static_cast<int64_t>(checked_ms)}};
    }

    workload.revision = in.u64();
    return workload;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Helper: big-endian encode/decode
// ─────────────────────────────────────────────

void ApiCodec::put_u64(std::vector<uint8_t>& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void ApiCodec::put_u32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

void ApiCodec::put_str(std::vector<uint8_t>& buf, const std::string& val) {
    put_u32(buf, static_cast<uint32_t>(val.size()));
    buf.insert(buf.end(), val.begin(), val.end());
}

uint64_t ApiCodec::get_u64(const uint8_t* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | p[i];
    }
    return val;
}

uint32_t ApiCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

// ─────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────

std::vector<uint8_t> ApiCodec::encode_request(const ApiRequest& request) {
    std::vector<uint8_t> buf;
    buf.reserve(1 + 4 + request.id.size() + 12 + 4 + 9 + 3);

    buf.push_back(static_cast<uint8_t>(request.op));
    put_str(buf, request.id);
    put_resources(buf, request.resources);
    put_u32(buf, request.replicas);

    buf.push_back(request.expected_revision ? 1 : 0);
    put_u64(buf, request.expected_revision.value_or(0));

    buf.push_back(request.phase_filter ? 1 : 0);
    buf.push_back(request.phase_filter.value_or(0));

    buf.push_back(request.succeeded ? 1 : 0);
    return buf;
}

Result<ApiRequest> ApiCodec::decode_request(const std::vector<uint8_t>& data) {
    Reader in(data);
    ApiRequest request;

    uint8_t op = in.u8();
    request.id = in.str();
    request.resources = get_resources(in);
    request.replicas = in.u32();

    bool has_expected = in.u8() != 0;
    uint64_t expected = in.u64();
    if (has_expected) request.expected_revision = expected;

    bool has_phase = in.u8() != 0;
    uint8_t phase = in.u8();
    if (has_phase) request.phase_filter = phase;

    request.succeeded = in.u8() != 0;

    if (!in.ok() || !in.at_end()) return malformed("request");
    if (op >= kApiOpCount) {
        return Error{ErrorCode::Validation, "unknown operation " + std::to_string(op)};
    }
    request.op = static_cast<ApiOp>(op);
    return request;
}

// ─────────────────────────────────────────────
// Response
// ─────────────────────────────────────────────

std::vector<uint8_t> ApiCodec::encode_response(const ApiResponse& response) {
    std::vector<uint8_t> buf;
    buf.reserve(64 + response.message.size()
                + 64 * (response.nodes.size() + response.workloads.size()));

    buf.push_back(response.error ? static_cast<uint8_t>(1 + static_cast<uint8_t>(*response.error))
                                 : STATUS_OK);
    put_str(buf, response.message);

    put_u32(buf, static_cast<uint32_t>(response.nodes.size()));
    for (const auto& node : response.nodes) {
        put_node(buf, node);
    }

    put_u32(buf, static_cast<uint32_t>(response.workloads.size()));
    for (const auto& workload : response.workloads) {
        put_workload(buf, workload);
    }
    return buf;
}

Result<ApiResponse> ApiCodec::decode_response(const std::vector<uint8_t>& data) {
    Reader in(data);
    ApiResponse response;
    bool valid = true;

    uint8_t status = in.u8();
    if (status != STATUS_OK) {
        if (status - 1 > MAX_ERROR_CODE) return malformed("response status");
        response.error = static_cast<ErrorCode>(status - 1);
    }
    response.message = in.str();

    uint32_t node_count = in.u32();
    for (uint32_t i = 0; i < node_count && in.ok(); ++i) {
        response.nodes.push_back(get_node(in, valid));
    }

    uint32_t workload_count = in.u32();
    for (uint32_t i = 0; i < workload_count && in.ok(); ++i) {
        response.workloads.push_back(get_workload(in, valid));
    }

    if (!in.ok() || !in.at_end() || !valid) return malformed("response");
    return response;
}

}  // namespace kubesim
