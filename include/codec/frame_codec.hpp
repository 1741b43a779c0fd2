#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/frame.hpp"
#include "model/reading.hpp"
#include "schema/schema.hpp"

namespace telemetry_hub::codec {

// Payload layout: presence bitmap (one bit per slot of the frame's PDU, LSB
// first), then one little-endian slot per enabled PDU sensor in declaration
// order. Out-of-range fields are reported on the Reading, not as a DecodeError.
struct DecodeError {
  enum class Kind : std::uint8_t { INTEGRITY, VERSION_MISMATCH, UNKNOWN_PDU };

  Kind kind{Kind::INTEGRITY};
  std::string detail{};
};

struct EncodeError {
  enum class Kind : std::uint8_t { UNKNOWN_SENSOR, UNKNOWN_PDU, UNREPRESENTABLE, PAYLOAD_TOO_LARGE };

  Kind kind{Kind::UNKNOWN_SENSOR};
  std::string sensor_id{};
  std::string detail{};
};

const char* to_string(DecodeError::Kind kind) noexcept;
const char* to_string(EncodeError::Kind kind) noexcept;

using SensorValues = std::unordered_map<std::string, double>;

std::optional<model::FrameHeader> read_header(const std::uint8_t* data, std::size_t size) noexcept;

// True when the header CRC matches the first kFrameHeaderSize bytes.
bool header_intact(const std::uint8_t* data, std::size_t size) noexcept;

// Wraps a payload in the envelope and fills in both CRCs. The header's
// payload_length is taken from the payload.
model::Frame seal_frame(const model::FrameHeader& header, const std::vector<std::uint8_t>& payload);

// A frame cut short after an intact header still decodes: slots that arrived
// are read, the rest come back TRUNCATED.
std::optional<model::ReadingBatch> decode(const model::Frame& frame, const schema::Schema& schema,
                                          DecodeError* error = nullptr);

// Encodes into the schema's first PDU.
std::optional<model::Frame> encode(const SensorValues& values, const schema::Schema& schema, std::uint32_t sequence,
                                   std::uint64_t timestamp_ms, EncodeError* error = nullptr);

// Values for declared sensors outside the PDU are skipped.
std::optional<model::Frame> encode_pdu(const SensorValues& values, const schema::Schema& schema, std::uint8_t pdu_id,
                                       std::uint32_t sequence, std::uint64_t timestamp_ms,
                                       EncodeError* error = nullptr);

}  // namespace telemetry_hub::codec
