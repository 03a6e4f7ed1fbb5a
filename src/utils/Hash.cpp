#include "mm/utils/Hash.hpp"

#include <zlib.h>

namespace mm::utils {

std::uint32_t Crc32(std::string_view text) {
    const uLong seed = crc32(0L, Z_NULL, 0);
    return static_cast<std::uint32_t>(
        crc32(seed, reinterpret_cast<const Bytef*>(text.data()), static_cast<uInt>(text.size())));
}

std::uint32_t Crc32(std::span<const std::uint8_t> bytes) {
    const uLong seed = crc32(0L, Z_NULL, 0);
    return static_cast<std::uint32_t>(
        crc32(seed, reinterpret_cast<const Bytef*>(bytes.data()), static_cast<uInt>(bytes.size())));
}

} // namespace mm::utils
