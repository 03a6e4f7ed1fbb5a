#include "mm/formats/BymlJson.hpp"

#include <limits>

#include <fmt/format.h>

#include "mm/core/Error.hpp"

namespace mm::formats {

namespace {

constexpr const char* kTagUInt = "@u32";
constexpr const char* kTagInt64 = "@i64";
constexpr const char* kTagUInt64 = "@u64";
constexpr const char* kTagDouble = "@f64";
constexpr const char* kTagBinary = "@binary";

[[noreturn]] void FailJson(std::string_view field, std::string details) {
    throw core::ParseError(core::ParseErrorKind::TypeMismatch, "byml json", field, std::move(details));
}

std::string EncodeHex(const Byml::Binary& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto byte : bytes) {
        out += fmt::format("{:02x}", byte);
    }
    return out;
}

int HexDigit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

Byml::Binary DecodeHex(const std::string& text) {
    if (text.size() % 2 != 0) {
        FailJson(kTagBinary, "hex string has odd length");
    }
    Byml::Binary bytes;
    bytes.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        const int hi = HexDigit(text[i]);
        const int lo = HexDigit(text[i + 1]);
        if (hi < 0 || lo < 0) {
            FailJson(kTagBinary, fmt::format("invalid hex digit near position {}", i));
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

Byml FromTagged(const std::string& tag, const nlohmann::json& value) {
    if (tag == kTagUInt) {
        if (!value.is_number_unsigned() || value.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            FailJson(tag, "expected an unsigned 32-bit integer");
        }
        return Byml(value.get<std::uint32_t>());
    }
    if (tag == kTagInt64) {
        if (!value.is_number_integer()) {
            FailJson(tag, "expected an integer");
        }
        return Byml(value.get<std::int64_t>());
    }
    if (tag == kTagUInt64) {
        if (!value.is_number_unsigned()) {
            FailJson(tag, "expected an unsigned integer");
        }
        return Byml(value.get<std::uint64_t>());
    }
    if (tag == kTagDouble) {
        if (!value.is_number()) {
            FailJson(tag, "expected a number");
        }
        return Byml(value.get<double>());
    }
    if (!value.is_string()) {
        FailJson(tag, "expected a hex string");
    }
    return Byml(DecodeHex(value.get<std::string>()));
}

bool IsTag(const std::string& key) {
    return key == kTagUInt || key == kTagInt64 || key == kTagUInt64 || key == kTagDouble || key == kTagBinary;
}

} // namespace

nlohmann::json ToJson(const Byml& node) {
    switch (node.GetType()) {
        case Byml::Type::Null:   return nullptr;
        case Byml::Type::Bool:   return node.AsBool();
        case Byml::Type::Int:    return node.AsInt();
        case Byml::Type::Float:  return node.AsFloat();
        case Byml::Type::String: return node.AsString();
        case Byml::Type::UInt:   return nlohmann::json{{kTagUInt, node.AsUInt()}};
        case Byml::Type::Int64:  return nlohmann::json{{kTagInt64, node.AsInt64()}};
        case Byml::Type::UInt64: return nlohmann::json{{kTagUInt64, node.AsUInt64()}};
        case Byml::Type::Double: return nlohmann::json{{kTagDouble, node.AsDouble()}};
        case Byml::Type::Binary: return nlohmann::json{{kTagBinary, EncodeHex(node.AsBinary())}};
        case Byml::Type::Array: {
            auto array = nlohmann::json::array();
            for (const auto& child : node.AsArray()) {
                array.push_back(ToJson(child));
            }
            return array;
        }
        case Byml::Type::Hash: {
            auto object = nlohmann::json::object();
            for (const auto& [key, child] : node.AsHash()) {
                object[key] = ToJson(child);
            }
            return object;
        }
    }
    return nullptr;
}

Byml FromJson(const nlohmann::json& json) {
    switch (json.type()) {
        case nlohmann::json::value_t::null:
            return Byml();
        case nlohmann::json::value_t::boolean:
            return Byml(json.get<bool>());
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: {
            if (json.is_number_unsigned() &&
                json.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
                const auto value = json.get<std::uint64_t>();
                if (value <= std::numeric_limits<std::uint32_t>::max()) {
                    return Byml(static_cast<std::uint32_t>(value));
                }
                return Byml(value);
            }
            const auto value = json.get<std::int64_t>();
            if (value < std::numeric_limits<std::int32_t>::min() || value > std::numeric_limits<std::int32_t>::max()) {
                return Byml(value);
            }
            return Byml(static_cast<std::int32_t>(value));
        }
        case nlohmann::json::value_t::number_float:
            return Byml(json.get<float>());
        case nlohmann::json::value_t::string:
            return Byml(json.get<std::string>());
        case nlohmann::json::value_t::array: {
            Byml::Array array;
            array.reserve(json.size());
            for (const auto& child : json) {
                array.push_back(FromJson(child));
            }
            return Byml(std::move(array));
        }
        case nlohmann::json::value_t::object: {
            if (json.size() == 1 && IsTag(json.begin().key())) {
                return FromTagged(json.begin().key(), json.begin().value());
            }
            Byml::Hash hash;
            for (auto it = json.begin(); it != json.end(); ++it) {
                hash.emplace(it.key(), FromJson(it.value()));
            }
            return Byml(std::move(hash));
        }
        default:
            FailJson("value", fmt::format("unsupported JSON type {}", json.type_name()));
    }
}

} // namespace mm::formats
