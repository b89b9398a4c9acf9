/**
 * @file unit_codec.hpp
 * @brief Frame codec for the pipe channel between the pool and a process unit.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace adaptive_pool {

/**
 * @brief Decoded response sent back by a unit process.
 */
struct UnitResponse {
    bool success = false;
    TaskId task = 0;
    Duration duration{0};
    std::string data;       ///< Output on success, error message on failure
};

/**
 * @brief Binary encoding of unit requests and responses.
 *
 * Wire format (all multi-byte values are big-endian):
 *   Frame:    [4B body_len][body]
 *   Request:  [1B type=0x01][8B task_id][payload...]
 *   Response: [1B status: 0=ok,1=error][8B task_id][8B duration_us][data...]
 */
struct UnitCodec {
    static constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;  // 16 MB
    static constexpr uint8_t REQUEST_TASK = 0x01;

    static std::vector<uint8_t> encode_request(TaskId task, const Payload& payload);
    static Result<std::pair<TaskId, Payload>> decode_request(const std::vector<uint8_t>& body);

    static std::vector<uint8_t> encode_response(const UnitResponse& response);
    static Result<UnitResponse> decode_response(const std::vector<uint8_t>& body);

    /// Prefix a body with its 4-byte length.
    static std::vector<uint8_t> frame(const std::vector<uint8_t>& body);

    static void put_u64(std::vector<uint8_t>& buf, uint64_t val);
    static void put_u32(std::vector<uint8_t>& buf, uint32_t val);
    static uint64_t get_u64(const uint8_t* p);
    static uint32_t get_u32(const uint8_t* p);
};

}  // namespace adaptive_pool
