#pragma once

#include <cstddef>
#include <cstdint>

namespace telemetry_hub::codec {

// CRC-16/CCITT-FALSE: poly 0x1021, init 0xFFFF, no reflection, no final xor.
std::uint16_t crc16_ccitt(const std::uint8_t* data, std::size_t size) noexcept;

}  // namespace telemetry_hub::codec
