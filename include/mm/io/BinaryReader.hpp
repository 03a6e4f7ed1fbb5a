#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include "mm/core/Endian.hpp"
#include "mm/core/Error.hpp"

namespace mm::io {

template <typename T>
constexpr T ByteSwap(T value) {
    static_assert(std::is_integral_v<T>, "ByteSwap requires an integral type");
    using U = std::make_unsigned_t<T>;
    U v = static_cast<U>(value);
    U out = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        out = static_cast<U>((out << 8) | (v & 0xFF));
        v = static_cast<U>(v >> 8);
    }
    return static_cast<T>(out);
}

constexpr bool IsHostLittleEndian() {
    return std::endian::native == std::endian::little;
}

template <typename T>
T FromEndian(T value, core::Endian endian) {
    if constexpr (sizeof(T) == 1) {
        return value;
    } else if constexpr (std::is_floating_point_v<T>) {
        using Bits = std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>;
        return std::bit_cast<T>(FromEndian(std::bit_cast<Bits>(value), endian));
    } else {
        const bool little = endian == core::Endian::Little;
        return little == IsHostLittleEndian() ? value : ByteSwap(value);
    }
}

/**
 * @brief Bounds-checked random-access reader over a byte buffer.
 *
 * Every read validates the requested range and raises
 * core::ParseError(UnexpectedEof) with the reader's context label instead of
 * reading past the end of the buffer.
 */
class BinaryReader {
public:
    BinaryReader(std::span<const std::uint8_t> data, core::Endian endian, std::string_view context)
        : m_data(data), m_endian(endian), m_context(context) {}

    core::Endian GetEndian() const { return m_endian; }
    void SetEndian(core::Endian endian) { m_endian = endian; }

    std::size_t Size() const { return m_data.size(); }
    std::size_t Tell() const { return m_cursor; }
    void Seek(std::size_t offset) {
        Expect(offset, 0);
        m_cursor = offset;
    }

    std::span<const std::uint8_t> Data() const { return m_data; }
    const std::string& Context() const { return m_context; }

    template <typename T>
    T ReadAt(std::size_t offset) const {
        static_assert(std::is_arithmetic_v<T>, "ReadAt requires an arithmetic type");
        Expect(offset, sizeof(T));
        T value;
        std::memcpy(&value, m_data.data() + offset, sizeof(T));
        return FromEndian(value, m_endian);
    }

    template <typename T>
    T Read() {
        T value = ReadAt<T>(m_cursor);
        m_cursor += sizeof(T);
        return value;
    }

    std::uint32_t ReadU24At(std::size_t offset) const;
    std::uint32_t ReadU24() {
        const std::uint32_t value = ReadU24At(m_cursor);
        m_cursor += 3;
        return value;
    }

    std::span<const std::uint8_t> ReadBytesAt(std::size_t offset, std::size_t size) const {
        Expect(offset, size);
        return m_data.subspan(offset, size);
    }

    // Null-terminated string starting at offset, bounded by maxLength when non-zero.
    std::string ReadCStringAt(std::size_t offset, std::size_t maxLength = 0) const;

    bool MagicAt(std::size_t offset, std::string_view magic) const;

    // Throws UnexpectedEof unless [offset, offset + size) lies inside the buffer.
    void Expect(std::size_t offset, std::size_t size) const;

    [[noreturn]] void Fail(core::ParseErrorKind kind, std::string_view field, std::string details) const;

private:
    std::span<const std::uint8_t> m_data;
    core::Endian m_endian;
    std::string m_context;
    std::size_t m_cursor = 0;
};

} // namespace mm::io
