/**
 * @file api_codec.hpp
 * @brief Binary encoding of API requests and responses.
 * @author Dimitris Kafetzis
 *
 * Wire format (all multi-byte values are big-endian, strings are
 * [4B length][bytes]):
 *
 * Request:
 *   [1B op][str id][4B cpu][8B memory_mb][4B replicas]
 *   [1B has_expected][8B expected_revision]
 *   [1B has_phase][1B phase][1B succeeded]
 *
 * Response:
 *   [1B status: 0=ok, 1+ErrorCode otherwise][str message]
 *   [4B node_count][node...][4B workload_count][workload...]
 *
 * Node:
 *   [str id][1B phase][4B cap_cpu][8B cap_mem][4B free_cpu][8B free_mem]
 *   [4B workload_count][str message][8B revision]
 *
 * Workload:
 *   [str id][str group][1B phase][1B has_node][str node]
 *   [4B req_cpu][8B req_mem][str message]
 *   [1B has_scheduling][str scheduling][8B last_checked_ms][8B revision]
 */

#pragma once

#include "api/api_types.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <vector>

namespace kubesim {

struct ApiCodec {
    static std::vector<uint8_t> encode_request(const ApiRequest& request);
    static Result<ApiRequest> decode_request(const std::vector<uint8_t>& data);

    static std::vector<uint8_t> encode_response(const ApiResponse& response);
    static Result<ApiResponse> decode_response(const std::vector<uint8_t>& data);

    static void put_u64(std::vector<uint8_t>& buf, uint64_t val);
    static void put_u32(std::vector<uint8_t>& buf, uint32_t val);
    static void put_str(std::vector<uint8_t>& buf, const std::string& val);
    static uint64_t get_u64(const uint8_t* p);
    static uint32_t get_u32(const uint8_t* p);
};

}  // namespace kubesim
