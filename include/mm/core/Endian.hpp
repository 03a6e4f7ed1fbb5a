#pragma once

#include <string_view>

namespace mm::core {

// Scalar byte order of the target platform. Big endian data targets the
// Wii U build of the game, little endian data targets the Switch build.
enum class Endian {
    Big,
    Little
};

constexpr std::string_view ToString(Endian endian) {
    return endian == Endian::Big ? "big" : "little";
}

constexpr std::string_view PlatformName(Endian endian) {
    return endian == Endian::Big ? "Wii U" : "Switch";
}

} // namespace mm::core
