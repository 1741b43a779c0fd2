#include "codec/frame_assembler.hpp"

#include <cstring>

#include "codec/crc16.hpp"
#include "codec/frame_codec.hpp"

namespace telemetry_hub::codec {
namespace {

constexpr std::size_t kCompactThreshold = 4096;

}  // namespace

FrameAssembler::FrameAssembler(const std::uint8_t start_byte, const std::size_t max_payload)
    : start_byte_(start_byte), max_payload_(max_payload) {
  buffer_.reserve(model::kFrameOverhead + max_payload_);
}

void FrameAssembler::push(const std::uint8_t* data, const std::size_t size) {
  if (data == nullptr || size == 0U) {
    return;
  }
  compact();
  buffer_.insert(buffer_.end(), data, data + size);
}

std::optional<model::Frame> FrameAssembler::next() {
  while (buffered() > 0U) {
    const std::uint8_t* begin = buffer_.data() + read_pos_;
    const std::size_t available = buffered();

    const auto* marker = static_cast<const std::uint8_t*>(std::memchr(begin, start_byte_, available));
    if (marker == nullptr) {
      discard(available);
      return std::nullopt;
    }
    if (marker != begin) {
      discard(static_cast<std::size_t>(marker - begin));
      continue;
    }

    const auto header = read_header(begin, available);
    if (!header.has_value()) {
      return std::nullopt;
    }

    if (!header_intact(begin, available)) {
      ++stats_.crc_failures;
      discard(1);
      continue;
    }
    if (header->payload_length > max_payload_) {
      ++stats_.oversize_lengths;
      discard(1);
      continue;
    }

    const std::size_t frame_size = model::kFrameOverhead + header->payload_length;
    if (available < frame_size) {
      return std::nullopt;
    }

    const std::size_t crc_offset = model::kFrameHeaderSize + header->payload_length;
    const auto received_crc = static_cast<std::uint16_t>(begin[crc_offset] | (begin[crc_offset + 1] << 8U));
    if (received_crc != crc16_ccitt(begin, crc_offset)) {
      ++stats_.crc_failures;
      discard(1);
      continue;
    }

    model::Frame frame{};
    frame.bytes.assign(begin, begin + frame_size);
    read_pos_ += frame_size;
    ++stats_.frames;
    return frame;
  }

  return std::nullopt;
}

void FrameAssembler::reset() noexcept {
  stats_.discarded_bytes += buffered();
  buffer_.clear();
  read_pos_ = 0;
}

void FrameAssembler::discard(const std::size_t count) noexcept {
  read_pos_ += count;
  stats_.discarded_bytes += count;
}

void FrameAssembler::compact() {
  if (read_pos_ == 0U) {
    return;
  }
  if (read_pos_ == buffer_.size()) {
    buffer_.clear();
    read_pos_ = 0;
    return;
  }
  if (read_pos_ >= kCompactThreshold || read_pos_ * 2U >= buffer_.size()) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
    read_pos_ = 0;
  }
}

}  // namespace telemetry_hub::codec
