#include "codec/frame_codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>

#include "codec/crc16.hpp"

namespace telemetry_hub::codec {
namespace {

using schema::FieldType;

// Unsigned integer of the same width as T, used to move T on and off the wire.
template <typename T>
using wire_bits_t =
    std::conditional_t<sizeof(T) == 1, std::uint8_t,
                       std::conditional_t<sizeof(T) == 2, std::uint16_t,
                                          std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>>>;

template <typename T>
void put_le(std::uint8_t* out, const T value) noexcept {
  static_assert(sizeof(T) == sizeof(wire_bits_t<T>));
  wire_bits_t<T> bits{};
  std::memcpy(&bits, &value, sizeof(T));
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    out[i] = static_cast<std::uint8_t>(bits >> (8U * i));
  }
}

template <typename T>
T get_le(const std::uint8_t* in) noexcept {
  static_assert(sizeof(T) == sizeof(wire_bits_t<T>));
  wire_bits_t<T> bits{};
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    bits = static_cast<wire_bits_t<T>>(bits | (static_cast<wire_bits_t<T>>(in[i]) << (8U * i)));
  }
  T value{};
  std::memcpy(&value, &bits, sizeof(T));
  return value;
}

void write_slot(std::uint8_t* out, const FieldType type, const double raw) noexcept {
  switch (type) {
    case FieldType::U8:
      put_le(out, static_cast<std::uint8_t>(raw));
      break;
    case FieldType::I8:
      put_le(out, static_cast<std::int8_t>(raw));
      break;
    case FieldType::U16:
      put_le(out, static_cast<std::uint16_t>(raw));
      break;
    case FieldType::I16:
      put_le(out, static_cast<std::int16_t>(raw));
      break;
    case FieldType::U32:
      put_le(out, static_cast<std::uint32_t>(raw));
      break;
    case FieldType::I32:
      put_le(out, static_cast<std::int32_t>(raw));
      break;
    case FieldType::F32:
      put_le(out, static_cast<float>(raw));
      break;
    case FieldType::F64:
      put_le(out, raw);
      break;
  }
}

double read_slot(const std::uint8_t* in, const FieldType type) noexcept {
  switch (type) {
    case FieldType::U8:
      return get_le<std::uint8_t>(in);
    case FieldType::I8:
      return get_le<std::int8_t>(in);
    case FieldType::U16:
      return get_le<std::uint16_t>(in);
    case FieldType::I16:
      return get_le<std::int16_t>(in);
    case FieldType::U32:
      return get_le<std::uint32_t>(in);
    case FieldType::I32:
      return get_le<std::int32_t>(in);
    case FieldType::F32:
      return static_cast<double>(get_le<float>(in));
    case FieldType::F64:
      return get_le<double>(in);
  }
  return std::numeric_limits<double>::quiet_NaN();
}

void fail(DecodeError* error, const DecodeError::Kind kind, std::string detail) {
  if (error != nullptr) {
    error->kind = kind;
    error->detail = std::move(detail);
  }
}

void fail(EncodeError* error, const EncodeError::Kind kind, const std::string& sensor_id, std::string detail) {
  if (error != nullptr) {
    error->kind = kind;
    error->sensor_id = sensor_id;
    error->detail = std::move(detail);
  }
}

}  // namespace

const char* to_string(const DecodeError::Kind kind) noexcept {
  switch (kind) {
    case DecodeError::Kind::INTEGRITY:
      return "integrity";
    case DecodeError::Kind::VERSION_MISMATCH:
      return "version_mismatch";
    case DecodeError::Kind::UNKNOWN_PDU:
      return "unknown_pdu";
  }
  return "unknown";
}

const char* to_string(const EncodeError::Kind kind) noexcept {
  switch (kind) {
    case EncodeError::Kind::UNKNOWN_SENSOR:
      return "unknown_sensor";
    case EncodeError::Kind::UNKNOWN_PDU:
      return "unknown_pdu";
    case EncodeError::Kind::UNREPRESENTABLE:
      return "unrepresentable";
    case EncodeError::Kind::PAYLOAD_TOO_LARGE:
      return "payload_too_large";
  }
  return "unknown";
}

std::optional<model::FrameHeader> read_header(const std::uint8_t* data, const std::size_t size) noexcept {
  if (data == nullptr || size < model::kFrameHeaderSize) {
    return std::nullopt;
  }

  model::FrameHeader header{};
  header.start_byte = data[0];
  header.schema_version = data[1];
  header.pdu_id = data[2];
  header.sequence = get_le<std::uint32_t>(data + 3);
  header.timestamp_ms = get_le<std::uint64_t>(data + 7);
  header.payload_length = get_le<std::uint16_t>(data + 15);
  return header;
}

bool header_intact(const std::uint8_t* data, const std::size_t size) noexcept {
  if (data == nullptr || size < model::kFrameHeaderSize) {
    return false;
  }
  return get_le<std::uint16_t>(data + model::kHeaderCrcOffset) == crc16_ccitt(data, model::kHeaderCrcOffset);
}

model::Frame seal_frame(const model::FrameHeader& header, const std::vector<std::uint8_t>& payload) {
  model::Frame frame{};
  frame.bytes.resize(model::kFrameOverhead + payload.size());

  std::uint8_t* out = frame.bytes.data();
  out[0] = header.start_byte;
  out[1] = header.schema_version;
  out[2] = header.pdu_id;
  put_le(out + 3, header.sequence);
  put_le(out + 7, header.timestamp_ms);
  put_le(out + 15, static_cast<std::uint16_t>(payload.size()));
  put_le(out + model::kHeaderCrcOffset, crc16_ccitt(out, model::kHeaderCrcOffset));
  if (!payload.empty()) {
    std::memcpy(out + model::kFrameHeaderSize, payload.data(), payload.size());
  }

  const std::size_t crc_offset = model::kFrameHeaderSize + payload.size();
  put_le(out + crc_offset, crc16_ccitt(out, crc_offset));
  return frame;
}

std::optional<model::ReadingBatch> decode(const model::Frame& frame, const schema::Schema& schema,
                                          DecodeError* error) {
  const auto& bytes = frame.bytes;
  const auto header = read_header(bytes.data(), bytes.size());
  if (!header.has_value()) {
    fail(error, DecodeError::Kind::INTEGRITY, "frame shorter than header");
    return std::nullopt;
  }
  if (header->start_byte != schema.start_byte()) {
    fail(error, DecodeError::Kind::INTEGRITY, "bad start byte");
    return std::nullopt;
  }
  if (!header_intact(bytes.data(), bytes.size())) {
    fail(error, DecodeError::Kind::INTEGRITY, "header crc mismatch");
    return std::nullopt;
  }
  if (header->schema_version != schema.wire_version()) {
    fail(error, DecodeError::Kind::VERSION_MISMATCH,
         "frame version " + std::to_string(header->schema_version) + " but schema version " +
             std::to_string(schema.wire_version()));
    return std::nullopt;
  }
  const schema::PduLayout* pdu = schema.find_pdu(header->pdu_id);
  if (pdu == nullptr) {
    fail(error, DecodeError::Kind::UNKNOWN_PDU, "pdu " + std::to_string(header->pdu_id) + " not in schema");
    return std::nullopt;
  }

  const std::size_t frame_size = model::kFrameOverhead + header->payload_length;
  if (bytes.size() > frame_size) {
    fail(error, DecodeError::Kind::INTEGRITY, "frame longer than its payload length");
    return std::nullopt;
  }

  // A cut-off frame keeps whatever payload arrived; its trailing CRC is gone.
  std::size_t payload_size = header->payload_length;
  if (bytes.size() == frame_size) {
    const std::size_t crc_offset = model::kFrameHeaderSize + payload_size;
    if (get_le<std::uint16_t>(bytes.data() + crc_offset) != crc16_ccitt(bytes.data(), crc_offset)) {
      fail(error, DecodeError::Kind::INTEGRITY, "crc mismatch");
      return std::nullopt;
    }
  } else {
    payload_size = std::min(payload_size, bytes.size() - model::kFrameHeaderSize);
  }

  const std::uint8_t* payload = bytes.data() + model::kFrameHeaderSize;

  model::ReadingBatch batch{};
  batch.sequence = header->sequence;
  batch.schema_version = header->schema_version;
  batch.pdu_id = header->pdu_id;
  batch.timestamp_ms = header->timestamp_ms;
  batch.readings.reserve(pdu->slots.size());

  std::size_t offset = pdu->bitmap_size();
  for (std::size_t i = 0; i < pdu->slots.size(); ++i) {
    const auto& definition = schema.slot(*pdu, i);
    const std::size_t width = schema::field_width(definition.type);

    model::Reading reading{definition.id, std::numeric_limits<double>::quiet_NaN(), header->timestamp_ms, false,
                           model::reading_fault::TRUNCATED};

    const std::size_t bitmap_byte = i / 8U;
    if (bitmap_byte < payload_size && offset + width <= payload_size) {
      const bool present = ((payload[bitmap_byte] >> (i % 8U)) & 1U) != 0U;
      if (!present) {
        reading.fault = model::reading_fault::ABSENT;
      } else {
        const double raw = read_slot(payload + offset, definition.type);
        reading.value = definition.from_raw(raw);
        reading.valid = definition.raw_in_range(raw);
        reading.fault = reading.valid ? model::reading_fault::NONE : model::reading_fault::OUT_OF_RANGE;
      }
    }

    batch.readings.push_back(std::move(reading));
    offset += width;
  }

  return batch;
}

std::optional<model::Frame> encode(const SensorValues& values, const schema::Schema& schema,
                                   const std::uint32_t sequence, const std::uint64_t timestamp_ms,
                                   EncodeError* error) {
  return encode_pdu(values, schema, schema.default_pdu().id, sequence, timestamp_ms, error);
}

std::optional<model::Frame> encode_pdu(const SensorValues& values, const schema::Schema& schema,
                                       const std::uint8_t pdu_id, const std::uint32_t sequence,
                                       const std::uint64_t timestamp_ms, EncodeError* error) {
  const schema::PduLayout* pdu = schema.find_pdu(pdu_id);
  if (pdu == nullptr) {
    fail(error, EncodeError::Kind::UNKNOWN_PDU, "", "pdu " + std::to_string(pdu_id) + " not in schema");
    return std::nullopt;
  }
  for (const auto& entry : values) {
    if (schema.lookup(entry.first) == nullptr) {
      fail(error, EncodeError::Kind::UNKNOWN_SENSOR, entry.first, "sensor not declared in schema");
      return std::nullopt;
    }
  }

  if (pdu->payload_size > 0xFFFFU) {
    fail(error, EncodeError::Kind::PAYLOAD_TOO_LARGE, "", "layout exceeds the 16-bit length field");
    return std::nullopt;
  }

  std::vector<std::uint8_t> payload(pdu->payload_size, 0U);
  std::size_t offset = pdu->bitmap_size();
  for (std::size_t i = 0; i < pdu->slots.size(); ++i) {
    const auto& definition = schema.slot(*pdu, i);
    const std::size_t width = schema::field_width(definition.type);

    const auto it = values.find(definition.id);
    if (it != values.end()) {
      if (!definition.representable(it->second)) {
        fail(error, EncodeError::Kind::UNREPRESENTABLE, definition.id,
             "value " + std::to_string(it->second) + " does not fit a " + schema::to_string(definition.type) +
                 " slot");
        return std::nullopt;
      }
      write_slot(payload.data() + offset, definition.type, definition.to_raw(it->second));
      payload[i / 8U] = static_cast<std::uint8_t>(payload[i / 8U] | (1U << (i % 8U)));
    }
    offset += width;
  }

  const model::FrameHeader header{schema.start_byte(), schema.wire_version(), pdu->id, sequence, timestamp_ms,
                                  static_cast<std::uint16_t>(payload.size())};
  return seal_frame(header, payload);
}

}  // namespace telemetry_hub::codec
