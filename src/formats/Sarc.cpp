#include "mm/formats/Sarc.hpp"

#include <algorithm>
#include <bit>

#include <fmt/format.h>

#include "mm/core/Error.hpp"
#include "mm/formats/Yaz0.hpp"
#include "mm/io/BinaryReader.hpp"
#include "mm/io/BinaryWriter.hpp"

namespace mm::formats {

namespace {

constexpr std::size_t kSarcHeaderSize = 0x14;
constexpr std::size_t kSfatHeaderSize = 0x0C;
constexpr std::size_t kSfatNodeSize = 0x10;
constexpr std::size_t kSfntHeaderSize = 0x08;
constexpr std::uint32_t kNameFlag = 0x01000000;
constexpr std::uint16_t kVersion = 0x0100;

constexpr std::uint32_t kNestedArchiveAlignment = 0x2000;
constexpr std::uint32_t kCompressedMemberAlignment = 0x80;

struct NodeLayout {
    std::uint32_t hash = 0;
    const std::string* name = nullptr;
    const std::vector<std::uint8_t>* data = nullptr;
    std::uint32_t nameOffset = 0;
    std::uint32_t alignment = 0;
};

} // namespace

bool Sarc::IsSarc(std::span<const std::uint8_t> data) {
    return data.size() >= kSarcHeaderSize && data[0] == 'S' && data[1] == 'A' && data[2] == 'R' && data[3] == 'C';
}

std::uint32_t Sarc::HashName(std::string_view name, std::uint32_t key) {
    std::uint32_t hash = 0;
    for (const char c : name) {
        hash = hash * key + static_cast<std::uint32_t>(static_cast<std::int32_t>(static_cast<signed char>(c)));
    }
    return hash;
}

void Sarc::SetMinAlignment(std::uint32_t alignment) {
    if (alignment == 0 || !std::has_single_bit(alignment)) {
        throw core::Error(fmt::format("SARC alignment must be a power of two, got {}", alignment));
    }
    m_minAlignment = alignment;
}

const std::vector<std::uint8_t>* Sarc::GetFile(std::string_view name) const {
    const auto it = m_files.find(std::string(name));
    return it == m_files.end() ? nullptr : &it->second;
}

void Sarc::AddFile(std::string name, std::vector<std::uint8_t> data) {
    m_files.insert_or_assign(std::move(name), std::move(data));
}

bool Sarc::RemoveFile(std::string_view name) {
    return m_files.erase(std::string(name)) > 0;
}

std::uint32_t Sarc::AlignmentFor(std::span<const std::uint8_t> data) const {
    std::uint32_t alignment = m_minAlignment;
    if (IsSarc(data)) {
        alignment = std::max(alignment, kNestedArchiveAlignment);
    } else if (yaz0::IsCompressed(data)) {
        alignment = std::max(alignment, kCompressedMemberAlignment);
    }
    return alignment;
}

Sarc Sarc::FromBinary(std::span<const std::uint8_t> data, std::string_view context) {
    io::BinaryReader reader(data, core::Endian::Big, context);
    if (!reader.MagicAt(0, "SARC")) {
        reader.Fail(core::ParseErrorKind::BadMagic, "header", "expected SARC magic");
    }
    reader.Expect(0, kSarcHeaderSize);
    if (data[6] == 0xFE && data[7] == 0xFF) {
        reader.SetEndian(core::Endian::Big);
    } else if (data[6] == 0xFF && data[7] == 0xFE) {
        reader.SetEndian(core::Endian::Little);
    } else {
        reader.Fail(core::ParseErrorKind::BadMagic, "byte order mark",
                    fmt::format("invalid BOM {:02X}{:02X}", data[6], data[7]));
    }

    Sarc sarc(reader.GetEndian());
    const std::uint16_t headerSize = reader.ReadAt<std::uint16_t>(4);
    const std::uint32_t dataOffset = reader.ReadAt<std::uint32_t>(0x0C);

    const std::size_t sfatOffset = headerSize;
    if (!reader.MagicAt(sfatOffset, "SFAT")) {
        reader.Fail(core::ParseErrorKind::BadMagic, "SFAT", "expected SFAT section");
    }
    const std::uint16_t nodeCount = reader.ReadAt<std::uint16_t>(sfatOffset + 6);
    const std::size_t nodesOffset = sfatOffset + kSfatHeaderSize;
    const std::size_t sfntOffset = nodesOffset + nodeCount * kSfatNodeSize;
    if (!reader.MagicAt(sfntOffset, "SFNT")) {
        reader.Fail(core::ParseErrorKind::BadMagic, "SFNT", "expected SFNT section");
    }
    const std::size_t namesOffset = sfntOffset + kSfntHeaderSize;

    for (std::size_t i = 0; i < nodeCount; ++i) {
        const std::size_t node = nodesOffset + i * kSfatNodeSize;
        const std::uint32_t hash = reader.ReadAt<std::uint32_t>(node);
        const std::uint32_t attributes = reader.ReadAt<std::uint32_t>(node + 4);
        const std::uint32_t begin = reader.ReadAt<std::uint32_t>(node + 8);
        const std::uint32_t end = reader.ReadAt<std::uint32_t>(node + 12);
        if (end < begin) {
            reader.Fail(core::ParseErrorKind::InvalidData, "SFAT node",
                        fmt::format("node {} ends before it begins", i));
        }

        std::string name;
        if (attributes & kNameFlag) {
            name = reader.ReadCStringAt(namesOffset + (attributes & 0xFFFF) * 4);
        } else {
            name = fmt::format("{:08X}", hash);
        }
        const auto bytes = reader.ReadBytesAt(static_cast<std::size_t>(dataOffset) + begin, end - begin);
        sarc.m_files.insert_or_assign(std::move(name), std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
    }
    return sarc;
}

std::vector<std::uint8_t> Sarc::ToBinary() const {
    std::vector<NodeLayout> nodes;
    nodes.reserve(m_files.size());
    for (const auto& [name, data] : m_files) {
        NodeLayout node;
        node.hash = HashName(name);
        node.name = &name;
        node.data = &data;
        node.alignment = AlignmentFor(data);
        nodes.push_back(node);
    }
    std::stable_sort(nodes.begin(), nodes.end(),
                     [](const NodeLayout& a, const NodeLayout& b) { return a.hash < b.hash; });

    io::BinaryWriter writer(m_endian);
    writer.WriteMagic("SARC");
    writer.Write<std::uint16_t>(static_cast<std::uint16_t>(kSarcHeaderSize));
    writer.Write<std::uint16_t>(0xFEFF);
    writer.Write<std::uint32_t>(0);
    writer.Write<std::uint32_t>(0);
    writer.Write<std::uint16_t>(kVersion);
    writer.Write<std::uint16_t>(0);

    writer.WriteMagic("SFAT");
    writer.Write<std::uint16_t>(static_cast<std::uint16_t>(kSfatHeaderSize));
    writer.Write<std::uint16_t>(static_cast<std::uint16_t>(nodes.size()));
    writer.Write<std::uint32_t>(kHashKey);

    std::uint32_t nameCursor = 0;
    for (auto& node : nodes) {
        node.nameOffset = nameCursor;
        nameCursor += static_cast<std::uint32_t>(io::AlignUp(node.name->size() + 1, 4));
    }

    std::uint32_t maxAlignment = m_minAlignment;
    std::uint32_t dataCursor = 0;
    std::vector<std::pair<std::uint32_t, std::uint32_t>> ranges;
    ranges.reserve(nodes.size());
    for (const auto& node : nodes) {
        maxAlignment = std::max(maxAlignment, node.alignment);
        dataCursor = static_cast<std::uint32_t>(io::AlignUp(dataCursor, node.alignment));
        const auto begin = dataCursor;
        dataCursor += static_cast<std::uint32_t>(node.data->size());
        ranges.emplace_back(begin, dataCursor);
    }

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        writer.Write<std::uint32_t>(nodes[i].hash);
        writer.Write<std::uint32_t>(kNameFlag | (nodes[i].nameOffset / 4));
        writer.Write<std::uint32_t>(ranges[i].first);
        writer.Write<std::uint32_t>(ranges[i].second);
    }

    writer.WriteMagic("SFNT");
    writer.Write<std::uint16_t>(static_cast<std::uint16_t>(kSfntHeaderSize));
    writer.Write<std::uint16_t>(0);
    for (const auto& node : nodes) {
        writer.WriteCString(*node.name);
        writer.AlignTo(4);
    }

    writer.AlignTo(maxAlignment);
    const std::size_t dataOffset = writer.Tell();
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const std::size_t target = dataOffset + ranges[i].first;
        writer.WriteZeros(target - writer.Tell());
        writer.WriteBytes(*nodes[i].data);
    }

    writer.WriteAt<std::uint32_t>(0x08, static_cast<std::uint32_t>(writer.Tell()));
    writer.WriteAt<std::uint32_t>(0x0C, static_cast<std::uint32_t>(dataOffset));
    return std::move(writer).Finish();
}

} // namespace mm::formats
