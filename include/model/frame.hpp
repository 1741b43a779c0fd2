#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace telemetry_hub::model {

// Wire envelope, little-endian:
//   [0]  start byte
//   [1]  schema version (low 8 bits)
//   [2]  pdu id
//   [3]  sequence        u32
//   [7]  timestamp_ms    u64
//   [15] payload length  u16
//   [17] header crc16 (CCITT-FALSE over bytes 0..16)
//   [19] payload
//   [19 + len] crc16 (CCITT-FALSE over every preceding byte)
inline constexpr std::size_t kHeaderCrcOffset = 17;
inline constexpr std::size_t kFrameHeaderSize = 19;
inline constexpr std::size_t kFrameTrailerSize = 2;
inline constexpr std::size_t kFrameOverhead = kFrameHeaderSize + kFrameTrailerSize;

struct FrameHeader {
    std::uint8_t start_byte;
    std::uint8_t schema_version;
    std::uint8_t pdu_id;
    std::uint32_t sequence;
    std::uint64_t timestamp_ms;
    std::uint16_t payload_length;
};

struct Frame {
    std::vector<std::uint8_t> bytes;
};

} // namespace telemetry_hub::model
