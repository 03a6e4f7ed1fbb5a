#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include "mm/collections/OrderedMap.hpp"
#include "mm/core/Endian.hpp"

namespace mm::formats::aamp {

// Parameter, object and list names are stored as their CRC32.
struct Name {
    std::uint32_t hash = 0;

    Name() = default;
    Name(std::uint32_t value) : hash(value) {}
    Name(std::string_view text);
    Name(const char* text) : Name(std::string_view(text)) {}

    auto operator<=>(const Name&) const = default;
};

enum class ParameterType : std::uint8_t {
    Bool = 0,
    F32 = 1,
    Int = 2,
    Vec2 = 3,
    Vec3 = 4,
    Vec4 = 5,
    Color = 6,
    String32 = 7,
    String64 = 8,
    Curve1 = 9,
    Curve2 = 10,
    Curve3 = 11,
    Curve4 = 12,
    BufferInt = 13,
    BufferF32 = 14,
    String256 = 15,
    Quat = 16,
    U32 = 17,
    BufferU32 = 18,
    BufferBinary = 19,
    StringRef = 20
};

std::string_view ToString(ParameterType type);

struct Curve {
    std::uint32_t a = 0;
    std::uint32_t b = 0;
    std::array<float, 30> floats{};

    bool operator==(const Curve&) const = default;
};

/**
 * @brief One typed parameter value.
 *
 * The type tag is kept separately from the stored value because several types
 * share a representation (Vec4/Color/Quat, the four string widths, the curve
 * counts) but serialize differently.
 */
class Parameter {
public:
    Parameter() = default;

    static Parameter Bool(bool value) { return Parameter(ParameterType::Bool, value); }
    static Parameter F32(float value) { return Parameter(ParameterType::F32, value); }
    static Parameter Int(std::int32_t value) { return Parameter(ParameterType::Int, value); }
    static Parameter U32(std::uint32_t value) { return Parameter(ParameterType::U32, value); }
    static Parameter Vec2(glm::vec2 value) { return Parameter(ParameterType::Vec2, value); }
    static Parameter Vec3(glm::vec3 value) { return Parameter(ParameterType::Vec3, value); }
    static Parameter Vec4(glm::vec4 value) { return Parameter(ParameterType::Vec4, value); }
    static Parameter Color(glm::vec4 value) { return Parameter(ParameterType::Color, value); }
    static Parameter Quat(glm::vec4 value) { return Parameter(ParameterType::Quat, value); }
    static Parameter String32(std::string value) { return Parameter(ParameterType::String32, std::move(value)); }
    static Parameter String64(std::string value) { return Parameter(ParameterType::String64, std::move(value)); }
    static Parameter String256(std::string value) { return Parameter(ParameterType::String256, std::move(value)); }
    static Parameter StringRef(std::string value) { return Parameter(ParameterType::StringRef, std::move(value)); }
    static Parameter Curves(std::vector<Curve> curves);
    static Parameter BufferInt(std::vector<std::int32_t> values) { return Parameter(ParameterType::BufferInt, std::move(values)); }
    static Parameter BufferF32(std::vector<float> values) { return Parameter(ParameterType::BufferF32, std::move(values)); }
    static Parameter BufferU32(std::vector<std::uint32_t> values) { return Parameter(ParameterType::BufferU32, std::move(values)); }
    static Parameter BufferBinary(std::vector<std::uint8_t> values) { return Parameter(ParameterType::BufferBinary, std::move(values)); }

    ParameterType GetType() const { return m_type; }
    bool IsString() const;
    bool IsBuffer() const;

    bool AsBool() const;
    float AsF32() const;
    std::int32_t AsInt() const;
    std::uint32_t AsU32() const;
    glm::vec2 AsVec2() const;
    glm::vec3 AsVec3() const;
    // Vec4, Color and Quat values.
    glm::vec4 AsVec4() const;
    // Any of the string types.
    const std::string& AsString() const;
    const std::vector<Curve>& AsCurves() const;
    const std::vector<std::int32_t>& AsBufferInt() const;
    const std::vector<float>& AsBufferF32() const;
    const std::vector<std::uint32_t>& AsBufferU32() const;
    const std::vector<std::uint8_t>& AsBufferBinary() const;

    bool operator==(const Parameter&) const = default;

private:
    using Value = std::variant<bool,
                               float,
                               std::int32_t,
                               std::uint32_t,
                               glm::vec2,
                               glm::vec3,
                               glm::vec4,
                               std::string,
                               std::vector<Curve>,
                               std::vector<std::int32_t>,
                               std::vector<float>,
                               std::vector<std::uint32_t>,
                               std::vector<std::uint8_t>>;

    template <typename T>
    Parameter(ParameterType type, T value) : m_type(type), m_value(std::move(value)) {}

    template <typename T>
    const T& Get(std::string_view expected) const;

    ParameterType m_type = ParameterType::Bool;
    Value m_value = false;
};

struct ParameterObject {
    collections::OrderedMap<Name, Parameter> params;

    const Parameter* Find(Name name) const;
    // Throws ParseError(MissingField) when absent.
    const Parameter& At(Name name, std::string_view label) const;
    ParameterObject& Set(Name name, Parameter value);

    bool operator==(const ParameterObject&) const = default;
};

struct ParameterList {
    collections::OrderedMap<Name, ParameterObject> objects;
    collections::OrderedMap<Name, ParameterList> lists;

    const ParameterObject* FindObject(Name name) const;
    const ParameterList* FindList(Name name) const;

    bool operator==(const ParameterList&) const = default;
};

/**
 * @brief Parameter archive (AAMP v2) document.
 *
 * The root list is named "param_root". Serialization lays the document out
 * breadth-first per section (lists, objects, parameters, data, strings) so a
 * parsed document written back produces identical bytes.
 */
struct ParameterIO {
    static constexpr std::uint32_t kFormatVersion = 2;

    std::uint32_t version = 0;
    std::string type = "xml";
    ParameterList root;

    const ParameterObject* FindObject(Name name) const { return root.FindObject(name); }
    const ParameterList* FindList(Name name) const { return root.FindList(name); }

    bool operator==(const ParameterIO&) const = default;

    static bool IsParameterIO(std::span<const std::uint8_t> data);
    static ParameterIO FromBinary(std::span<const std::uint8_t> data, std::string_view context = "aamp");
    [[nodiscard]] std::vector<std::uint8_t> ToBinary(core::Endian endian = core::Endian::Little) const;
};

} // namespace mm::formats::aamp
