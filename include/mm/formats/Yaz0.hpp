#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace mm::formats::yaz0 {

inline constexpr std::size_t kHeaderSize = 0x10;

bool IsCompressed(std::span<const std::uint8_t> data);

// Size recorded in the header, or 0 when the data is not Yaz0.
std::uint32_t DecompressedSize(std::span<const std::uint8_t> data);

std::vector<std::uint8_t> Decompress(std::span<const std::uint8_t> data,
                                     std::string_view context = "yaz0");

// Returns the input unchanged when it does not carry a Yaz0 header.
std::vector<std::uint8_t> DecompressIfNeeded(std::vector<std::uint8_t> data,
                                             std::string_view context = "yaz0");

std::vector<std::uint8_t> Compress(std::span<const std::uint8_t> data,
                                   std::uint32_t alignment = 0);

} // namespace mm::formats::yaz0
