#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace mm::utils {

// Standard CRC-32 (zlib polynomial), used for parameter names and actor hashes.
std::uint32_t Crc32(std::string_view text);
std::uint32_t Crc32(std::span<const std::uint8_t> bytes);

} // namespace mm::utils
