#include "mm/io/BinaryWriter.hpp"

namespace mm::io {

void BinaryWriter::WriteU24(std::uint32_t value) {
    const std::size_t offset = m_buffer.size();
    m_buffer.resize(offset + 3);
    WriteU24At(offset, value);
}

void BinaryWriter::WriteU24At(std::size_t offset, std::uint32_t value) {
    std::uint8_t* bytes = m_buffer.data() + offset;
    if (m_endian == core::Endian::Big) {
        bytes[0] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
        bytes[1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
        bytes[2] = static_cast<std::uint8_t>(value & 0xFF);
    } else {
        bytes[0] = static_cast<std::uint8_t>(value & 0xFF);
        bytes[1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
        bytes[2] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    }
}

} // namespace mm::io
