#pragma once

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "mm/core/Endian.hpp"

namespace mm::formats {

/**
 * @brief Typed binary tree document (BYML).
 *
 * A node is one of null, bool, the integer and floating point widths the
 * format knows, a string, a binary blob, an ordered array or a string keyed
 * hash. Hash keys are kept sorted, which is also the order the binary key
 * table uses, so serialization is stable across runs.
 */
class Byml {
public:
    enum class Type : std::uint8_t {
        Null,
        Bool,
        Int,
        Float,
        UInt,
        Int64,
        UInt64,
        Double,
        String,
        Binary,
        Array,
        Hash
    };

    using Array = std::vector<Byml>;
    using Hash = std::map<std::string, Byml>;
    using Binary = std::vector<std::uint8_t>;

    static constexpr std::uint16_t kDefaultVersion = 2;
    static constexpr std::size_t kMaxDepth = 256;

    Byml() = default;
    Byml(bool value) : m_value(value) {}
    Byml(std::int32_t value) : m_value(value) {}
    Byml(std::uint32_t value) : m_value(value) {}
    Byml(float value) : m_value(value) {}
    Byml(std::int64_t value) : m_value(value) {}
    Byml(std::uint64_t value) : m_value(value) {}
    Byml(double value) : m_value(value) {}
    Byml(std::string value) : m_value(std::move(value)) {}
    Byml(const char* value) : m_value(std::string(value)) {}
    Byml(Binary value) : m_value(std::move(value)) {}
    Byml(Array value) : m_value(std::move(value)) {}
    Byml(Hash value) : m_value(std::move(value)) {}

    Type GetType() const { return static_cast<Type>(m_value.index()); }
    bool IsNull() const { return GetType() == Type::Null; }
    bool IsContainer() const { return GetType() == Type::Array || GetType() == Type::Hash; }

    bool AsBool() const;
    std::int32_t AsInt() const;
    std::uint32_t AsUInt() const;
    float AsFloat() const;
    std::int64_t AsInt64() const;
    std::uint64_t AsUInt64() const;
    double AsDouble() const;
    const std::string& AsString() const;
    const Binary& AsBinary() const;
    const Array& AsArray() const;
    Array& AsArray();
    const Hash& AsHash() const;
    Hash& AsHash();

    // Any of the integer node types, widened.
    std::int64_t AsInteger() const;

    // Hash member lookup; nullptr when this is not a hash or the key is absent.
    const Byml* Find(std::string_view key) const;

    // Hash member lookup raising ParseError(MissingField) when absent.
    const Byml& At(std::string_view key) const;

    bool operator==(const Byml& other) const { return m_value == other.m_value; }

    static bool IsByml(std::span<const std::uint8_t> data);
    static core::Endian DetectEndian(std::span<const std::uint8_t> data);

    static Byml FromBinary(std::span<const std::uint8_t> data, std::string_view context = "byml");
    [[nodiscard]] std::vector<std::uint8_t> ToBinary(core::Endian endian,
                                                     std::uint16_t version = kDefaultVersion) const;

private:
    using Value = std::variant<std::monostate,
                               bool,
                               std::int32_t,
                               float,
                               std::uint32_t,
                               std::int64_t,
                               std::uint64_t,
                               double,
                               std::string,
                               Binary,
                               Array,
                               Hash>;

    template <typename T>
    const T& Get(Type expected) const;

    Value m_value;
};

std::string_view ToString(Byml::Type type);

} // namespace mm::formats
