#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

#include "mm/core/Endian.hpp"
#include "mm/io/BinaryReader.hpp"

namespace mm::io {

// Growable output buffer with endian-aware scalar writes and back-patching.
class BinaryWriter {
public:
    explicit BinaryWriter(core::Endian endian) : m_endian(endian) {}

    core::Endian GetEndian() const { return m_endian; }
    std::size_t Tell() const { return m_buffer.size(); }

    template <typename T>
    void Write(T value) {
        static_assert(std::is_arithmetic_v<T>, "Write requires an arithmetic type");
        const std::size_t offset = m_buffer.size();
        m_buffer.resize(offset + sizeof(T));
        WriteAt(offset, value);
    }

    template <typename T>
    void WriteAt(std::size_t offset, T value) {
        static_assert(std::is_arithmetic_v<T>, "WriteAt requires an arithmetic type");
        const T converted = FromEndian(value, m_endian);
        std::memcpy(m_buffer.data() + offset, &converted, sizeof(T));
    }

    void WriteU24(std::uint32_t value);
    void WriteU24At(std::size_t offset, std::uint32_t value);

    void WriteBytes(std::span<const std::uint8_t> bytes) {
        m_buffer.insert(m_buffer.end(), bytes.begin(), bytes.end());
    }

    void WriteMagic(std::string_view magic) {
        m_buffer.insert(m_buffer.end(), magic.begin(), magic.end());
    }

    void WriteCString(std::string_view text) {
        m_buffer.insert(m_buffer.end(), text.begin(), text.end());
        m_buffer.push_back(0);
    }

    void WriteZeros(std::size_t count) {
        m_buffer.insert(m_buffer.end(), count, 0);
    }

    void AlignTo(std::size_t alignment) {
        if (alignment <= 1) {
            return;
        }
        const std::size_t remainder = m_buffer.size() % alignment;
        if (remainder != 0) {
            WriteZeros(alignment - remainder);
        }
    }

    const std::vector<std::uint8_t>& Buffer() const { return m_buffer; }
    std::vector<std::uint8_t> Finish() && { return std::move(m_buffer); }

private:
    core::Endian m_endian;
    std::vector<std::uint8_t> m_buffer;
};

constexpr std::size_t AlignUp(std::size_t value, std::size_t alignment) {
    return alignment <= 1 ? value : (value + alignment - 1) / alignment * alignment;
}

} // namespace mm::io
