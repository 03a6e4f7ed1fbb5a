#include "mm/formats/Yaz0.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "mm/core/Endian.hpp"
#include "mm/io/BinaryReader.hpp"
#include "mm/io/BinaryWriter.hpp"

namespace mm::formats::yaz0 {

namespace {

constexpr std::size_t kWindowSize = 0x1000;
constexpr std::size_t kMinMatch = 3;
constexpr std::size_t kMaxMatch = 0x111;
constexpr std::size_t kMaxChainSteps = 128;
constexpr std::size_t kHashBits = 15;

std::uint32_t HashAt(std::span<const std::uint8_t> data, std::size_t pos) {
    const std::uint32_t value = (static_cast<std::uint32_t>(data[pos]) << 16) |
                                (static_cast<std::uint32_t>(data[pos + 1]) << 8) |
                                static_cast<std::uint32_t>(data[pos + 2]);
    return (value * 2654435761u) >> (32 - kHashBits);
}

struct Match {
    std::size_t length = 0;
    std::size_t distance = 0;
};

class MatchFinder {
public:
    explicit MatchFinder(std::span<const std::uint8_t> data)
        : m_data(data),
          m_head(std::size_t{1} << kHashBits, -1),
          m_prev(data.size(), -1) {}

    Match Find(std::size_t pos) const {
        Match best;
        if (pos + kMinMatch > m_data.size()) {
            return best;
        }
        const std::size_t maxLength = std::min(kMaxMatch, m_data.size() - pos);
        std::int64_t candidate = m_head[HashAt(m_data, pos)];
        std::size_t steps = 0;
        while (candidate >= 0 && steps++ < kMaxChainSteps) {
            const auto cand = static_cast<std::size_t>(candidate);
            if (pos - cand > kWindowSize) {
                break;
            }
            std::size_t length = 0;
            while (length < maxLength && m_data[cand + length] == m_data[pos + length]) {
                ++length;
            }
            if (length > best.length) {
                best.length = length;
                best.distance = pos - cand;
                if (length == maxLength) {
                    break;
                }
            }
            candidate = m_prev[cand];
        }
        if (best.length < kMinMatch) {
            best = Match{};
        }
        return best;
    }

    void Insert(std::size_t pos) {
        if (pos + kMinMatch > m_data.size()) {
            return;
        }
        const std::uint32_t hash = HashAt(m_data, pos);
        m_prev[pos] = m_head[hash];
        m_head[hash] = static_cast<std::int64_t>(pos);
    }

private:
    std::span<const std::uint8_t> m_data;
    std::vector<std::int64_t> m_head;
    std::vector<std::int64_t> m_prev;
};

} // namespace

bool IsCompressed(std::span<const std::uint8_t> data) {
    return data.size() >= kHeaderSize && data[0] == 'Y' && data[1] == 'a' && data[2] == 'z' && data[3] == '0';
}

std::uint32_t DecompressedSize(std::span<const std::uint8_t> data) {
    if (!IsCompressed(data)) {
        return 0;
    }
    io::BinaryReader reader(data, core::Endian::Big, "yaz0");
    return reader.ReadAt<std::uint32_t>(4);
}

std::vector<std::uint8_t> Decompress(std::span<const std::uint8_t> data, std::string_view context) {
    io::BinaryReader reader(data, core::Endian::Big, context);
    if (!reader.MagicAt(0, "Yaz0")) {
        reader.Fail(core::ParseErrorKind::BadMagic, "header", "expected Yaz0 magic");
    }
    const std::uint32_t size = reader.ReadAt<std::uint32_t>(4);
    // A three byte chunk expands to at most kMaxMatch bytes.
    const std::size_t maxSize = (data.size() - std::min(data.size(), kHeaderSize)) / 3 * kMaxMatch + 8;
    if (size > maxSize) {
        reader.Fail(core::ParseErrorKind::InvalidData, "header",
                    fmt::format("decompressed size {} exceeds {} possible from {} input bytes", size, maxSize,
                                data.size()));
    }

    std::vector<std::uint8_t> out;
    out.reserve(size);
    std::size_t src = kHeaderSize;
    std::uint8_t groupHeader = 0;
    int bitsLeft = 0;

    while (out.size() < size) {
        if (bitsLeft == 0) {
            groupHeader = reader.ReadAt<std::uint8_t>(src++);
            bitsLeft = 8;
        }
        if (groupHeader & 0x80) {
            out.push_back(reader.ReadAt<std::uint8_t>(src++));
        } else {
            const std::uint8_t b1 = reader.ReadAt<std::uint8_t>(src++);
            const std::uint8_t b2 = reader.ReadAt<std::uint8_t>(src++);
            const std::size_t distance = ((static_cast<std::size_t>(b1 & 0x0F) << 8) | b2) + 1;
            std::size_t length = b1 >> 4;
            if (length == 0) {
                length = static_cast<std::size_t>(reader.ReadAt<std::uint8_t>(src++)) + 0x12;
            } else {
                length += 2;
            }
            if (distance > out.size()) {
                reader.Fail(core::ParseErrorKind::InvalidData, "back-reference",
                            fmt::format("distance {} exceeds {} decoded bytes", distance, out.size()));
            }
            const std::size_t start = out.size() - distance;
            for (std::size_t i = 0; i < length && out.size() < size; ++i) {
                out.push_back(out[start + i]);
            }
        }
        groupHeader = static_cast<std::uint8_t>(groupHeader << 1);
        --bitsLeft;
    }
    return out;
}

std::vector<std::uint8_t> DecompressIfNeeded(std::vector<std::uint8_t> data, std::string_view context) {
    if (!IsCompressed(data)) {
        return data;
    }
    return Decompress(data, context);
}

std::vector<std::uint8_t> Compress(std::span<const std::uint8_t> data, std::uint32_t alignment) {
    io::BinaryWriter writer(core::Endian::Big);
    writer.WriteMagic("Yaz0");
    writer.Write<std::uint32_t>(static_cast<std::uint32_t>(data.size()));
    writer.Write<std::uint32_t>(alignment);
    writer.Write<std::uint32_t>(0);

    std::vector<std::uint8_t> out = std::move(writer).Finish();
    out.reserve(kHeaderSize + data.size() + data.size() / 8 + 1);

    MatchFinder finder(data);
    std::size_t pos = 0;
    while (pos < data.size()) {
        const std::size_t groupOffset = out.size();
        out.push_back(0);
        std::uint8_t groupHeader = 0;
        for (int bit = 0; bit < 8 && pos < data.size(); ++bit) {
            const Match match = finder.Find(pos);
            if (match.length == 0) {
                groupHeader |= static_cast<std::uint8_t>(0x80 >> bit);
                out.push_back(data[pos]);
                finder.Insert(pos);
                ++pos;
                continue;
            }
            const std::size_t distance = match.distance - 1;
            if (match.length >= 0x12) {
                out.push_back(static_cast<std::uint8_t>(distance >> 8));
                out.push_back(static_cast<std::uint8_t>(distance & 0xFF));
                out.push_back(static_cast<std::uint8_t>(match.length - 0x12));
            } else {
                out.push_back(static_cast<std::uint8_t>(((match.length - 2) << 4) | (distance >> 8)));
                out.push_back(static_cast<std::uint8_t>(distance & 0xFF));
            }
            for (std::size_t i = 0; i < match.length; ++i) {
                finder.Insert(pos + i);
            }
            pos += match.length;
        }
        out[groupOffset] = groupHeader;
    }
    return out;
}

} // namespace mm::formats::yaz0
