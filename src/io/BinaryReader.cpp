#include "mm/io/BinaryReader.hpp"

#include <fmt/format.h>

namespace mm::io {

std::uint32_t BinaryReader::ReadU24At(std::size_t offset) const {
    Expect(offset, 3);
    const std::uint8_t* bytes = m_data.data() + offset;
    if (m_endian == core::Endian::Big) {
        return (static_cast<std::uint32_t>(bytes[0]) << 16) |
               (static_cast<std::uint32_t>(bytes[1]) << 8) |
               static_cast<std::uint32_t>(bytes[2]);
    }
    return static_cast<std::uint32_t>(bytes[0]) |
           (static_cast<std::uint32_t>(bytes[1]) << 8) |
           (static_cast<std::uint32_t>(bytes[2]) << 16);
}

std::string BinaryReader::ReadCStringAt(std::size_t offset, std::size_t maxLength) const {
    Expect(offset, 0);
    std::string result;
    std::size_t pos = offset;
    while (true) {
        if (pos >= m_data.size()) {
            Fail(core::ParseErrorKind::UnexpectedEof, {},
                 fmt::format("unterminated string at offset {:#x}", offset));
        }
        const char c = static_cast<char>(m_data[pos]);
        if (c == '\0') {
            break;
        }
        result.push_back(c);
        ++pos;
        if (maxLength != 0 && result.size() >= maxLength) {
            break;
        }
    }
    return result;
}

bool BinaryReader::MagicAt(std::size_t offset, std::string_view magic) const {
    if (offset > m_data.size() || m_data.size() - offset < magic.size()) {
        return false;
    }
    return std::memcmp(m_data.data() + offset, magic.data(), magic.size()) == 0;
}

void BinaryReader::Expect(std::size_t offset, std::size_t size) const {
    if (offset > m_data.size() || m_data.size() - offset < size) {
        Fail(core::ParseErrorKind::UnexpectedEof, {},
             fmt::format("read of {} bytes at offset {:#x} exceeds buffer size {:#x}",
                         size, offset, m_data.size()));
    }
}

void BinaryReader::Fail(core::ParseErrorKind kind, std::string_view field, std::string details) const {
    throw core::ParseError(kind, m_context, field, std::move(details));
}

} // namespace mm::io
