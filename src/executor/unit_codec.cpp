/**
 * @file unit_codec.cpp
 * @brief UnitCodec binary serialization for process-unit channels.
 * @author Dimitris Kafetzis
 *
 * Wire format (all multi-byte values are big-endian):
 *
 * Request body:
 *   [1B type: 0x01=task][8B task_id][payload bytes]
 *
 * Response body:
 *   [1B status: 0=success, 1=error]
 *   [8B task_id][8B duration_us]
 *   [output or error message bytes]
 */

#include "executor/unit_codec.hpp"

namespace adaptive_pool {

// ─────────────────────────────────────────────
// Helper: big-endian encode/decode
// ─────────────────────────────────────────────

void UnitCodec::put_u64(std::vector<uint8_t>& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void UnitCodec::put_u32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

uint64_t UnitCodec::get_u64(const uint8_t* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | p[i];
    }
    return val;
}

uint32_t UnitCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

std::vector<uint8_t> UnitCodec::frame(const std::vector<uint8_t>& body) {
    std::vector<uint8_t> buf;
    buf.reserve(4 + body.size());
    put_u32(buf, static_cast<uint32_t>(body.size()));
    buf.insert(buf.end(), body.begin(), body.end());
    return buf;
}

// ─────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────

std::vector<uint8_t> UnitCodec::encode_request(TaskId task, const Payload& payload) {
    std::vector<uint8_t> buf;
    buf.reserve(1 + 8 + payload.size());

    buf.push_back(REQUEST_TASK);
    put_u64(buf, task);
    buf.insert(buf.end(), payload.begin(), payload.end());

    return buf;
}

Result<std::pair<TaskId, Payload>> UnitCodec::decode_request(const std::vector<uint8_t>& body) {
    const size_t MIN_SIZE = 1 + 8;  // type + task_id
    if (body.size() < MIN_SIZE) {
        return Error{"Request too short: " + std::to_string(body.size()) + " bytes",
                     ErrorKind::Protocol};
    }

    const uint8_t* p = body.data();
    if (p[0] != REQUEST_TASK) {
        return Error{"Unknown request type: " + std::to_string(p[0]), ErrorKind::Protocol};
    }

    TaskId task = get_u64(p + 1);
    Payload payload(reinterpret_cast<const char*>(p + MIN_SIZE), body.size() - MIN_SIZE);
    return std::make_pair(task, std::move(payload));
}

// ─────────────────────────────────────────────
// Response
// ─────────────────────────────────────────────

std::vector<uint8_t> UnitCodec::encode_response(const UnitResponse& response) {
    std::vector<uint8_t> buf;
    buf.reserve(1 + 16 + response.data.size());

    // Status
    buf.push_back(response.success ? 0x00 : 0x01);

    put_u64(buf, response.task);
    put_u64(buf, static_cast<uint64_t>(response.duration.count()));

    buf.insert(buf.end(), response.data.begin(), response.data.end());

    return buf;
}

Result<UnitResponse> UnitCodec::decode_response(const std::vector<uint8_t>& body) {
    const size_t MIN_SIZE = 1 + 16;  // status + task_id + duration
    if (body.size() < MIN_SIZE) {
        return Error{"Response too short: " + std::to_string(body.size()) + " bytes",
                     ErrorKind::Protocol};
    }

    const uint8_t* p = body.data();
    if (p[0] > 0x01) {
        return Error{"Unknown response status: " + std::to_string(p[0]), ErrorKind::Protocol};
    }

    UnitResponse response;
    response.success = (p[0] == 0x00);
    response.task = get_u64(p + 1);
    response.duration = Duration{static_cast<int64_t>(get_u64(p + 9))};
    response.data.assign(reinterpret_cast<const char*>(p + MIN_SIZE), body.size() - MIN_SIZE);

    return response;
}

}  // namespace adaptive_pool
