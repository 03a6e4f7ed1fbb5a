#include "mm/formats/Byml.hpp"

#include <bit>
#include <set>
#include <utility>

#include <fmt/format.h>

#include "mm/core/Error.hpp"
#include "mm/io/BinaryReader.hpp"
#include "mm/io/BinaryWriter.hpp"

namespace mm::formats {

namespace {

namespace NodeType {
constexpr std::uint8_t String = 0xA0;
constexpr std::uint8_t Binary = 0xA1;
constexpr std::uint8_t Array = 0xC0;
constexpr std::uint8_t Hash = 0xC1;
constexpr std::uint8_t StringTable = 0xC2;
constexpr std::uint8_t Bool = 0xD0;
constexpr std::uint8_t Int = 0xD1;
constexpr std::uint8_t Float = 0xD2;
constexpr std::uint8_t UInt = 0xD3;
constexpr std::uint8_t Int64 = 0xD4;
constexpr std::uint8_t UInt64 = 0xD5;
constexpr std::uint8_t Double = 0xD6;
constexpr std::uint8_t Null = 0xFF;
} // namespace NodeType

constexpr std::uint16_t kMinVersion = 2;
constexpr std::uint16_t kMaxVersion = 4;
constexpr std::size_t kHeaderSize = 0x10;

std::uint8_t NodeTypeOf(const Byml& node) {
    switch (node.GetType()) {
        case Byml::Type::Null:   return NodeType::Null;
        case Byml::Type::Bool:   return NodeType::Bool;
        case Byml::Type::Int:    return NodeType::Int;
        case Byml::Type::Float:  return NodeType::Float;
        case Byml::Type::UInt:   return NodeType::UInt;
        case Byml::Type::Int64:  return NodeType::Int64;
        case Byml::Type::UInt64: return NodeType::UInt64;
        case Byml::Type::Double: return NodeType::Double;
        case Byml::Type::String: return NodeType::String;
        case Byml::Type::Binary: return NodeType::Binary;
        case Byml::Type::Array:  return NodeType::Array;
        case Byml::Type::Hash:   return NodeType::Hash;
    }
    return NodeType::Null;
}

class Parser {
public:
    Parser(std::span<const std::uint8_t> data, std::string_view context)
        : m_reader(data, core::Endian::Big, context) {}

    Byml Parse() {
        if (m_reader.MagicAt(0, "BY")) {
            m_reader.SetEndian(core::Endian::Big);
        } else if (m_reader.MagicAt(0, "YB")) {
            m_reader.SetEndian(core::Endian::Little);
        } else {
            m_reader.Fail(core::ParseErrorKind::BadMagic, "header", "expected BY or YB");
        }
        m_reader.Expect(0, kHeaderSize);

        const auto version = m_reader.ReadAt<std::uint16_t>(2);
        if (version < kMinVersion || version > kMaxVersion) {
            m_reader.Fail(core::ParseErrorKind::InvalidData, "version",
                          fmt::format("unsupported version {}", version));
        }
        const auto keyTable = m_reader.ReadAt<std::uint32_t>(4);
        const auto stringTable = m_reader.ReadAt<std::uint32_t>(8);
        const auto root = m_reader.ReadAt<std::uint32_t>(12);

        if (keyTable != 0) {
            m_keys = ReadStringTable(keyTable, "key table");
        }
        if (stringTable != 0) {
            m_strings = ReadStringTable(stringTable, "string table");
        }
        if (root == 0) {
            return Byml();
        }
        const auto rootType = m_reader.ReadAt<std::uint8_t>(root);
        if (rootType != NodeType::Array && rootType != NodeType::Hash) {
            m_reader.Fail(core::ParseErrorKind::TypeMismatch, "root",
                          fmt::format("root node type {:#04x} is not a container", rootType));
        }
        return ReadContainer(root, 0);
    }

private:
    std::vector<std::string> ReadStringTable(std::uint32_t offset, std::string_view field) {
        if (m_reader.ReadAt<std::uint8_t>(offset) != NodeType::StringTable) {
            m_reader.Fail(core::ParseErrorKind::TypeMismatch, field, "expected string table node");
        }
        const std::uint32_t count = m_reader.ReadU24At(offset + 1);
        std::vector<std::string> strings;
        strings.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            const auto stringOffset = m_reader.ReadAt<std::uint32_t>(offset + 4 + i * 4);
            strings.push_back(m_reader.ReadCStringAt(static_cast<std::size_t>(offset) + stringOffset));
        }
        return strings;
    }

    Byml ReadContainer(std::uint32_t offset, std::size_t depth) {
        if (depth > Byml::kMaxDepth) {
            m_reader.Fail(core::ParseErrorKind::InvalidData, "node",
                          fmt::format("nesting deeper than {} levels", Byml::kMaxDepth));
        }
        const auto type = m_reader.ReadAt<std::uint8_t>(offset);
        const std::uint32_t count = m_reader.ReadU24At(offset + 1);

        if (type == NodeType::Array) {
            Byml::Array array;
            array.reserve(count);
            const std::size_t values = offset + io::AlignUp(4 + static_cast<std::size_t>(count), 4);
            for (std::uint32_t i = 0; i < count; ++i) {
                const auto childType = m_reader.ReadAt<std::uint8_t>(offset + 4 + i);
                const auto raw = m_reader.ReadAt<std::uint32_t>(values + i * 4);
                array.push_back(ReadValue(childType, raw, depth));
            }
            return Byml(std::move(array));
        }

        if (type == NodeType::Hash) {
            Byml::Hash hash;
            for (std::uint32_t i = 0; i < count; ++i) {
                const std::size_t entry = offset + 4 + static_cast<std::size_t>(i) * 8;
                const std::uint32_t keyIndex = m_reader.ReadU24At(entry);
                const auto childType = m_reader.ReadAt<std::uint8_t>(entry + 3);
                const auto raw = m_reader.ReadAt<std::uint32_t>(entry + 4);
                if (keyIndex >= m_keys.size()) {
                    m_reader.Fail(core::ParseErrorKind::InvalidData, "hash key",
                                  fmt::format("key index {} out of range", keyIndex));
                }
                hash.insert_or_assign(m_keys[keyIndex], ReadValue(childType, raw, depth));
            }
            return Byml(std::move(hash));
        }

        m_reader.Fail(core::ParseErrorKind::TypeMismatch, "node",
                      fmt::format("expected container at {:#x}, found type {:#04x}", offset, type));
    }

    Byml ReadValue(std::uint8_t type, std::uint32_t raw, std::size_t depth) {
        switch (type) {
            case NodeType::String:
                if (raw >= m_strings.size()) {
                    m_reader.Fail(core::ParseErrorKind::InvalidData, "string",
                                  fmt::format("string index {} out of range", raw));
                }
                return Byml(m_strings[raw]);
            case NodeType::Binary: {
                const auto size = m_reader.ReadAt<std::uint32_t>(raw);
                const auto bytes = m_reader.ReadBytesAt(static_cast<std::size_t>(raw) + 4, size);
                return Byml(Byml::Binary(bytes.begin(), bytes.end()));
            }
            case NodeType::Array:
            case NodeType::Hash:
                if (m_reader.ReadAt<std::uint8_t>(raw) != type) {
                    m_reader.Fail(core::ParseErrorKind::TypeMismatch, "node",
                                  fmt::format("container at {:#x} does not match its declared type", raw));
                }
                return ReadContainer(raw, depth + 1);
            case NodeType::Bool:
                return Byml(raw != 0);
            case NodeType::Int:
                return Byml(std::bit_cast<std::int32_t>(raw));
            case NodeType::Float:
                return Byml(std::bit_cast<float>(raw));
            case NodeType::UInt:
                return Byml(raw);
            case NodeType::Int64:
                return Byml(m_reader.ReadAt<std::int64_t>(raw));
            case NodeType::UInt64:
                return Byml(m_reader.ReadAt<std::uint64_t>(raw));
            case NodeType::Double:
                return Byml(m_reader.ReadAt<double>(raw));
            case NodeType::Null:
                return Byml();
            default:
                m_reader.Fail(core::ParseErrorKind::InvalidData, "node",
                              fmt::format("unknown node type {:#04x}", type));
        }
    }

    io::BinaryReader m_reader;
    std::vector<std::string> m_keys;
    std::vector<std::string> m_strings;
};

class Writer {
public:
    Writer(core::Endian endian, std::uint16_t version) : m_writer(endian), m_version(version) {}

    std::vector<std::uint8_t> Write(const Byml& root) {
        if (!root.IsNull() && !root.IsContainer()) {
            throw core::Error(fmt::format("BYML root must be an array or a hash, got {}",
                                          ToString(root.GetType())));
        }
        if (m_version < kMinVersion || m_version > kMaxVersion) {
            throw core::Error(fmt::format("Cannot write BYML version {}", m_version));
        }

        std::set<std::string> keys;
        std::set<std::string> strings;
        Collect(root, keys, strings);
        m_keys.assign(keys.begin(), keys.end());
        m_strings.assign(strings.begin(), strings.end());
        for (std::uint32_t i = 0; i < m_keys.size(); ++i) {
            m_keyIndex.emplace(m_keys[i], i);
        }
        for (std::uint32_t i = 0; i < m_strings.size(); ++i) {
            m_stringIndex.emplace(m_strings[i], i);
        }

        m_writer.WriteMagic(m_writer.GetEndian() == core::Endian::Big ? "BY" : "YB");
        m_writer.Write<std::uint16_t>(m_version);
        m_writer.WriteZeros(12);

        if (!m_keys.empty()) {
            m_writer.WriteAt<std::uint32_t>(4, static_cast<std::uint32_t>(m_writer.Tell()));
            WriteStringTable(m_keys);
        }
        if (!m_strings.empty()) {
            m_writer.WriteAt<std::uint32_t>(8, static_cast<std::uint32_t>(m_writer.Tell()));
            WriteStringTable(m_strings);
        }
        if (root.IsContainer()) {
            m_writer.AlignTo(4);
            m_writer.WriteAt<std::uint32_t>(12, static_cast<std::uint32_t>(m_writer.Tell()));
            WriteContainer(root);
        }
        return std::move(m_writer).Finish();
    }

private:
    struct Slot {
        std::size_t offset;
        const Byml* node;
    };

    static void Collect(const Byml& node, std::set<std::string>& keys, std::set<std::string>& strings) {
        switch (node.GetType()) {
            case Byml::Type::String:
                strings.insert(node.AsString());
                break;
            case Byml::Type::Array:
                for (const auto& child : node.AsArray()) {
                    Collect(child, keys, strings);
                }
                break;
            case Byml::Type::Hash:
                for (const auto& [key, child] : node.AsHash()) {
                    keys.insert(key);
                    Collect(child, keys, strings);
                }
                break;
            default:
                break;
        }
    }

    void WriteStringTable(const std::vector<std::string>& strings) {
        m_writer.Write<std::uint8_t>(NodeType::StringTable);
        m_writer.WriteU24(static_cast<std::uint32_t>(strings.size()));
        std::size_t cursor = 4 + (strings.size() + 1) * 4;
        for (const auto& text : strings) {
            m_writer.Write<std::uint32_t>(static_cast<std::uint32_t>(cursor));
            cursor += text.size() + 1;
        }
        m_writer.Write<std::uint32_t>(static_cast<std::uint32_t>(cursor));
        for (const auto& text : strings) {
            m_writer.WriteCString(text);
        }
        m_writer.AlignTo(4);
    }

    // Inline scalar payload, or a placeholder for nodes stored out of line.
    std::uint32_t InlineValue(const Byml& node) const {
        switch (node.GetType()) {
            case Byml::Type::Bool:   return node.AsBool() ? 1u : 0u;
            case Byml::Type::Int:    return std::bit_cast<std::uint32_t>(node.AsInt());
            case Byml::Type::Float:  return std::bit_cast<std::uint32_t>(node.AsFloat());
            case Byml::Type::UInt:   return node.AsUInt();
            case Byml::Type::String: return m_stringIndex.at(node.AsString());
            default:                 return 0;
        }
    }

    static bool IsOutOfLine(const Byml& node) {
        switch (node.GetType()) {
            case Byml::Type::Int64:
            case Byml::Type::UInt64:
            case Byml::Type::Double:
            case Byml::Type::Binary:
                return true;
            default:
                return false;
        }
    }

    void WriteValueSlot(const Byml& node, std::vector<Slot>& deferred, std::vector<Slot>& children) {
        const std::size_t slot = m_writer.Tell();
        m_writer.Write<std::uint32_t>(InlineValue(node));
        if (node.IsContainer()) {
            children.push_back({slot, &node});
        } else if (IsOutOfLine(node)) {
            deferred.push_back({slot, &node});
        }
    }

    void WriteContainer(const Byml& node) {
        std::vector<Slot> deferred;
        std::vector<Slot> children;

        if (node.GetType() == Byml::Type::Array) {
            const auto& array = node.AsArray();
            m_writer.Write<std::uint8_t>(NodeType::Array);
            m_writer.WriteU24(static_cast<std::uint32_t>(array.size()));
            for (const auto& child : array) {
                m_writer.Write<std::uint8_t>(NodeTypeOf(child));
            }
            m_writer.AlignTo(4);
            for (const auto& child : array) {
                WriteValueSlot(child, deferred, children);
            }
        } else {
            const auto& hash = node.AsHash();
            m_writer.Write<std::uint8_t>(NodeType::Hash);
            m_writer.WriteU24(static_cast<std::uint32_t>(hash.size()));
            for (const auto& [key, child] : hash) {
                m_writer.WriteU24(m_keyIndex.at(key));
                m_writer.Write<std::uint8_t>(NodeTypeOf(child));
                WriteValueSlot(child, deferred, children);
            }
        }

        for (const auto& slot : deferred) {
            m_writer.AlignTo(4);
            m_writer.WriteAt<std::uint32_t>(slot.offset, static_cast<std::uint32_t>(m_writer.Tell()));
            switch (slot.node->GetType()) {
                case Byml::Type::Int64:
                    m_writer.Write<std::int64_t>(slot.node->AsInt64());
                    break;
                case Byml::Type::UInt64:
                    m_writer.Write<std::uint64_t>(slot.node->AsUInt64());
                    break;
                case Byml::Type::Double:
                    m_writer.Write<double>(slot.node->AsDouble());
                    break;
                default: {
                    const auto& binary = slot.node->AsBinary();
                    m_writer.Write<std::uint32_t>(static_cast<std::uint32_t>(binary.size()));
                    m_writer.WriteBytes(binary);
                    break;
                }
            }
        }

        for (const auto& slot : children) {
            m_writer.AlignTo(4);
            m_writer.WriteAt<std::uint32_t>(slot.offset, static_cast<std::uint32_t>(m_writer.Tell()));
            WriteContainer(*slot.node);
        }
    }

    io::BinaryWriter m_writer;
    std::uint16_t m_version;
    std::vector<std::string> m_keys;
    std::vector<std::string> m_strings;
    std::map<std::string, std::uint32_t, std::less<>> m_keyIndex;
    std::map<std::string, std::uint32_t, std::less<>> m_stringIndex;
};

} // namespace

std::string_view ToString(Byml::Type type) {
    switch (type) {
        case Byml::Type::Null:   return "null";
        case Byml::Type::Bool:   return "bool";
        case Byml::Type::Int:    return "int";
        case Byml::Type::Float:  return "float";
        case Byml::Type::UInt:   return "uint";
        case Byml::Type::Int64:  return "int64";
        case Byml::Type::UInt64: return "uint64";
        case Byml::Type::Double: return "double";
        case Byml::Type::String: return "string";
        case Byml::Type::Binary: return "binary";
        case Byml::Type::Array:  return "array";
        case Byml::Type::Hash:   return "hash";
    }
    return "unknown";
}

template <typename T>
const T& Byml::Get(Type expected) const {
    if (const auto* value = std::get_if<T>(&m_value)) {
        return *value;
    }
    throw core::ParseError(core::ParseErrorKind::TypeMismatch, {}, ToString(expected),
                           fmt::format("expected {}, found {}", ToString(expected), ToString(GetType())));
}

bool Byml::AsBool() const { return Get<bool>(Type::Bool); }
std::int32_t Byml::AsInt() const { return Get<std::int32_t>(Type::Int); }
std::uint32_t Byml::AsUInt() const { return Get<std::uint32_t>(Type::UInt); }
float Byml::AsFloat() const { return Get<float>(Type::Float); }
std::int64_t Byml::AsInt64() const { return Get<std::int64_t>(Type::Int64); }
std::uint64_t Byml::AsUInt64() const { return Get<std::uint64_t>(Type::UInt64); }
double Byml::AsDouble() const { return Get<double>(Type::Double); }
const std::string& Byml::AsString() const { return Get<std::string>(Type::String); }
const Byml::Binary& Byml::AsBinary() const { return Get<Binary>(Type::Binary); }
const Byml::Array& Byml::AsArray() const { return Get<Array>(Type::Array); }
const Byml::Hash& Byml::AsHash() const { return Get<Hash>(Type::Hash); }

Byml::Array& Byml::AsArray() {
    return const_cast<Array&>(std::as_const(*this).AsArray());
}

Byml::Hash& Byml::AsHash() {
    return const_cast<Hash&>(std::as_const(*this).AsHash());
}

std::int64_t Byml::AsInteger() const {
    switch (GetType()) {
        case Type::Int:    return AsInt();
        case Type::UInt:   return AsUInt();
        case Type::Int64:  return AsInt64();
        case Type::UInt64: return static_cast<std::int64_t>(AsUInt64());
        default:
            throw core::ParseError(core::ParseErrorKind::TypeMismatch, {}, "integer",
                                   fmt::format("expected an integer, found {}", ToString(GetType())));
    }
}

const Byml* Byml::Find(std::string_view key) const {
    const auto* hash = std::get_if<Hash>(&m_value);
    if (!hash) {
        return nullptr;
    }
    const auto it = hash->find(std::string(key));
    return it == hash->end() ? nullptr : &it->second;
}

const Byml& Byml::At(std::string_view key) const {
    const auto& hash = AsHash();
    const auto it = hash.find(std::string(key));
    if (it == hash.end()) {
        throw core::ParseError(core::ParseErrorKind::MissingField, {}, key, "key not present in hash");
    }
    return it->second;
}

bool Byml::IsByml(std::span<const std::uint8_t> data) {
    return data.size() >= 2 && ((data[0] == 'B' && data[1] == 'Y') || (data[0] == 'Y' && data[1] == 'B'));
}

core::Endian Byml::DetectEndian(std::span<const std::uint8_t> data) {
    if (!IsByml(data)) {
        throw core::ParseError(core::ParseErrorKind::BadMagic, "byml", "header", "expected BY or YB");
    }
    return data[0] == 'B' ? core::Endian::Big : core::Endian::Little;
}

Byml Byml::FromBinary(std::span<const std::uint8_t> data, std::string_view context) {
    return Parser(data, context).Parse();
}

std::vector<std::uint8_t> Byml::ToBinary(core::Endian endian, std::uint16_t version) const {
    return Writer(endian, version).Write(*this);
}

} // namespace mm::formats
