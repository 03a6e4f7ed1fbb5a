#include "mm/formats/Aamp.hpp"

#include <initializer_list>

#include <fmt/format.h>

#include "mm/core/Error.hpp"
#include "mm/io/BinaryReader.hpp"
#include "mm/io/BinaryWriter.hpp"
#include "mm/utils/Hash.hpp"

namespace mm::formats::aamp {

namespace {

constexpr std::size_t kHeaderSize = 0x30;
constexpr std::size_t kListSize = 0x0C;
constexpr std::size_t kObjectSize = 0x08;
constexpr std::size_t kParameterSize = 0x08;
constexpr std::uint32_t kFlagLittleEndian = 1u << 0;
constexpr std::uint32_t kFlagUtf8 = 1u << 1;
constexpr std::size_t kCurveSize = 8 + 30 * 4;

const Name kRootName("param_root");

class Parser {
public:
    Parser(std::span<const std::uint8_t> data, std::string_view context)
        : m_reader(data, core::Endian::Little, context) {}

    ParameterIO Parse() {
        if (!m_reader.MagicAt(0, "AAMP")) {
            m_reader.Fail(core::ParseErrorKind::BadMagic, "header", "expected AAMP magic");
        }
        m_reader.Expect(0, kHeaderSize);
        // The flags word is read little endian first; bit 0 clear means a big endian file.
        const auto flagsLe = m_reader.ReadAt<std::uint32_t>(8);
        if ((flagsLe & kFlagLittleEndian) == 0) {
            m_reader.SetEndian(core::Endian::Big);
        }
        const auto formatVersion = m_reader.ReadAt<std::uint32_t>(4);
        if (formatVersion != ParameterIO::kFormatVersion) {
            m_reader.Fail(core::ParseErrorKind::InvalidData, "version",
                          fmt::format("unsupported AAMP version {}", formatVersion));
        }

        ParameterIO pio;
        pio.version = m_reader.ReadAt<std::uint32_t>(0x10);
        const auto rootOffset = m_reader.ReadAt<std::uint32_t>(0x14);
        pio.type = m_reader.ReadCStringAt(kHeaderSize);

        const std::size_t rootList = kHeaderSize + rootOffset;
        const auto rootName = m_reader.ReadAt<std::uint32_t>(rootList);
        if (rootName != kRootName.hash) {
            m_reader.Fail(core::ParseErrorKind::InvalidData, "param_root",
                          fmt::format("root list name {:#010x} is not param_root", rootName));
        }
        pio.root = ReadList(rootList, 0);
        return pio;
    }

private:
    static constexpr std::size_t kMaxDepth = 128;

    ParameterList ReadList(std::size_t offset, std::size_t depth) {
        if (depth > kMaxDepth) {
            m_reader.Fail(core::ParseErrorKind::InvalidData, "list", "lists nested too deeply");
        }
        ParameterList list;
        const std::size_t listsOffset = offset + m_reader.ReadAt<std::uint16_t>(offset + 4) * 4u;
        const std::uint16_t listCount = m_reader.ReadAt<std::uint16_t>(offset + 6);
        const std::size_t objectsOffset = offset + m_reader.ReadAt<std::uint16_t>(offset + 8) * 4u;
        const std::uint16_t objectCount = m_reader.ReadAt<std::uint16_t>(offset + 10);

        list.lists.reserve(listCount);
        for (std::size_t i = 0; i < listCount; ++i) {
            const std::size_t child = listsOffset + i * kListSize;
            list.lists.insert_or_assign(Name(m_reader.ReadAt<std::uint32_t>(child)), ReadList(child, depth + 1));
        }
        list.objects.reserve(objectCount);
        for (std::size_t i = 0; i < objectCount; ++i) {
            const std::size_t child = objectsOffset + i * kObjectSize;
            list.objects.insert_or_assign(Name(m_reader.ReadAt<std::uint32_t>(child)), ReadObject(child));
        }
        return list;
    }

    ParameterObject ReadObject(std::size_t offset) {
        ParameterObject object;
        const std::size_t paramsOffset = offset + m_reader.ReadAt<std::uint16_t>(offset + 4) * 4u;
        const std::uint16_t paramCount = m_reader.ReadAt<std::uint16_t>(offset + 6);
        object.params.reserve(paramCount);
        for (std::size_t i = 0; i < paramCount; ++i) {
            const std::size_t param = paramsOffset + i * kParameterSize;
            object.params.insert_or_assign(Name(m_reader.ReadAt<std::uint32_t>(param)), ReadParameter(param));
        }
        return object;
    }

    float F32At(std::size_t offset) const { return m_reader.ReadAt<float>(offset); }

    template <typename T>
    std::vector<T> ReadBuffer(std::size_t data) const {
        if (data < 4) {
            m_reader.Fail(core::ParseErrorKind::InvalidData, "buffer", "buffer without a size prefix");
        }
        const auto count = m_reader.ReadAt<std::uint32_t>(data - 4);
        m_reader.Expect(data, static_cast<std::size_t>(count) * sizeof(T));
        std::vector<T> values;
        values.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            values.push_back(m_reader.ReadAt<T>(data + i * sizeof(T)));
        }
        return values;
    }

    Parameter ReadParameter(std::size_t offset) {
        const std::uint32_t dataOffset = m_reader.ReadU24At(offset + 4);
        const auto type = m_reader.ReadAt<std::uint8_t>(offset + 7);
        const std::size_t data = offset + static_cast<std::size_t>(dataOffset) * 4;

        switch (static_cast<ParameterType>(type)) {
            case ParameterType::Bool:
                return Parameter::Bool(m_reader.ReadAt<std::uint32_t>(data) != 0);
            case ParameterType::F32:
                return Parameter::F32(F32At(data));
            case ParameterType::Int:
                return Parameter::Int(m_reader.ReadAt<std::int32_t>(data));
            case ParameterType::U32:
                return Parameter::U32(m_reader.ReadAt<std::uint32_t>(data));
            case ParameterType::Vec2:
                return Parameter::Vec2({F32At(data), F32At(data + 4)});
            case ParameterType::Vec3:
                return Parameter::Vec3({F32At(data), F32At(data + 4), F32At(data + 8)});
            case ParameterType::Vec4:
                return Parameter::Vec4({F32At(data), F32At(data + 4), F32At(data + 8), F32At(data + 12)});
            case ParameterType::Color:
                return Parameter::Color({F32At(data), F32At(data + 4), F32At(data + 8), F32At(data + 12)});
            case ParameterType::Quat:
                return Parameter::Quat({F32At(data), F32At(data + 4), F32At(data + 8), F32At(data + 12)});
            case ParameterType::String32:
                return Parameter::String32(m_reader.ReadCStringAt(data));
            case ParameterType::String64:
                return Parameter::String64(m_reader.ReadCStringAt(data));
            case ParameterType::String256:
                return Parameter::String256(m_reader.ReadCStringAt(data));
            case ParameterType::StringRef:
                return Parameter::StringRef(m_reader.ReadCStringAt(data));
            case ParameterType::Curve1:
            case ParameterType::Curve2:
            case ParameterType::Curve3:
            case ParameterType::Curve4: {
                const std::size_t count = type - static_cast<std::uint8_t>(ParameterType::Curve1) + 1;
                std::vector<Curve> curves(count);
                for (std::size_t i = 0; i < count; ++i) {
                    const std::size_t base = data + i * kCurveSize;
                    curves[i].a = m_reader.ReadAt<std::uint32_t>(base);
                    curves[i].b = m_reader.ReadAt<std::uint32_t>(base + 4);
                    for (std::size_t f = 0; f < curves[i].floats.size(); ++f) {
                        curves[i].floats[f] = F32At(base + 8 + f * 4);
                    }
                }
                return Parameter::Curves(std::move(curves));
            }
            case ParameterType::BufferInt:
                return Parameter::BufferInt(ReadBuffer<std::int32_t>(data));
            case ParameterType::BufferF32:
                return Parameter::BufferF32(ReadBuffer<float>(data));
            case ParameterType::BufferU32:
                return Parameter::BufferU32(ReadBuffer<std::uint32_t>(data));
            case ParameterType::BufferBinary:
                return Parameter::BufferBinary(ReadBuffer<std::uint8_t>(data));
        }
        m_reader.Fail(core::ParseErrorKind::InvalidData, "parameter",
                      fmt::format("unknown parameter type {}", type));
    }

    io::BinaryReader m_reader;
};

class Writer {
public:
    explicit Writer(core::Endian endian) : m_writer(endian) {}

    std::vector<std::uint8_t> Write(const ParameterIO& pio) {
        m_writer.WriteMagic("AAMP");
        m_writer.Write<std::uint32_t>(ParameterIO::kFormatVersion);
        const std::uint32_t flags =
            kFlagUtf8 | (m_writer.GetEndian() == core::Endian::Little ? kFlagLittleEndian : 0u);
        m_writer.Write<std::uint32_t>(flags);
        m_writer.WriteZeros(kHeaderSize - m_writer.Tell());
        m_writer.WriteAt<std::uint32_t>(0x10, pio.version);

        m_writer.WriteCString(pio.type);
        m_writer.AlignTo(4);
        m_writer.WriteAt<std::uint32_t>(0x14, static_cast<std::uint32_t>(m_writer.Tell() - kHeaderSize));

        // Lists: the root entry, then each list's children as one contiguous block.
        m_lists.push_back({&pio.root, m_writer.Tell()});
        WriteListEntry(kRootName, pio.root);
        WriteChildLists(0);

        // Objects grouped per list, in list order.
        for (const auto& [list, entry] : m_lists) {
            PatchU16(entry + 8, entry);
            for (const auto& [name, object] : list->objects) {
                m_objects.push_back({&object, m_writer.Tell()});
                m_writer.Write<std::uint32_t>(name.hash);
                m_writer.Write<std::uint16_t>(0);
                m_writer.Write<std::uint16_t>(static_cast<std::uint16_t>(object.params.size()));
            }
        }

        // Parameters grouped per object, in object order.
        for (const auto& [object, entry] : m_objects) {
            PatchU16(entry + 4, entry);
            for (const auto& [name, param] : object->params) {
                m_params.push_back({&param, m_writer.Tell()});
                m_writer.Write<std::uint32_t>(name.hash);
                m_writer.WriteU24(0);
                m_writer.Write<std::uint8_t>(static_cast<std::uint8_t>(param.GetType()));
            }
        }

        const std::size_t dataStart = m_writer.Tell();
        for (const auto& [param, entry] : m_params) {
            if (!param->IsString()) {
                WriteData(*param, entry);
            }
        }
        const std::size_t stringStart = m_writer.Tell();
        for (const auto& [param, entry] : m_params) {
            if (param->IsString()) {
                PatchDataOffset(entry);
                m_writer.WriteCString(param->AsString());
                m_writer.AlignTo(4);
            }
        }

        m_writer.WriteAt<std::uint32_t>(0x0C, static_cast<std::uint32_t>(m_writer.Tell()));
        m_writer.WriteAt<std::uint32_t>(0x18, static_cast<std::uint32_t>(m_lists.size()));
        m_writer.WriteAt<std::uint32_t>(0x1C, static_cast<std::uint32_t>(m_objects.size()));
        m_writer.WriteAt<std::uint32_t>(0x20, static_cast<std::uint32_t>(m_params.size()));
        m_writer.WriteAt<std::uint32_t>(0x24, static_cast<std::uint32_t>(stringStart - dataStart));
        m_writer.WriteAt<std::uint32_t>(0x28, static_cast<std::uint32_t>(m_writer.Tell() - stringStart));
        return std::move(m_writer).Finish();
    }

private:
    template <typename T>
    struct Placed {
        const T* node;
        std::size_t entry;
    };

    void WriteListEntry(Name name, const ParameterList& list) {
        m_writer.Write<std::uint32_t>(name.hash);
        m_writer.Write<std::uint16_t>(0);
        m_writer.Write<std::uint16_t>(static_cast<std::uint16_t>(list.lists.size()));
        m_writer.Write<std::uint16_t>(0);
        m_writer.Write<std::uint16_t>(static_cast<std::uint16_t>(list.objects.size()));
    }

    void WriteChildLists(std::size_t index) {
        const auto [list, entry] = m_lists[index];
        PatchU16(entry + 4, entry);
        const std::size_t first = m_lists.size();
        for (const auto& [name, child] : list->lists) {
            m_lists.push_back({&child, m_writer.Tell()});
            WriteListEntry(name, child);
        }
        const std::size_t last = m_lists.size();
        for (std::size_t i = first; i < last; ++i) {
            WriteChildLists(i);
        }
    }

    // Stores the current position as a word offset relative to an entry.
    void PatchU16(std::size_t field, std::size_t entry) {
        const std::size_t words = (m_writer.Tell() - entry) / 4;
        if (words > 0xFFFF) {
            throw core::Error("AAMP section offset exceeds 16-bit range");
        }
        m_writer.WriteAt<std::uint16_t>(field, static_cast<std::uint16_t>(words));
    }

    void PatchDataOffset(std::size_t entry) {
        const std::size_t words = (m_writer.Tell() - entry) / 4;
        if (words > 0xFFFFFF) {
            throw core::Error("AAMP data offset exceeds 24-bit range");
        }
        m_writer.WriteU24At(entry + 4, static_cast<std::uint32_t>(words));
    }

    void WriteF32s(std::initializer_list<float> values) {
        for (const float value : values) {
            m_writer.Write<float>(value);
        }
    }

    template <typename T>
    void WriteBuffer(const std::vector<T>& values, std::size_t entry) {
        m_writer.Write<std::uint32_t>(static_cast<std::uint32_t>(values.size()));
        PatchDataOffset(entry);
        for (const auto& value : values) {
            m_writer.Write<T>(value);
        }
    }

    void WriteData(const Parameter& param, std::size_t entry) {
        m_writer.AlignTo(4);
        if (param.IsBuffer()) {
            switch (param.GetType()) {
                case ParameterType::BufferInt: WriteBuffer(param.AsBufferInt(), entry); break;
                case ParameterType::BufferF32: WriteBuffer(param.AsBufferF32(), entry); break;
                case ParameterType::BufferU32: WriteBuffer(param.AsBufferU32(), entry); break;
                default: WriteBuffer(param.AsBufferBinary(), entry); break;
            }
            m_writer.AlignTo(4);
            return;
        }

        PatchDataOffset(entry);
        switch (param.GetType()) {
            case ParameterType::Bool:
                m_writer.Write<std::uint32_t>(param.AsBool() ? 1u : 0u);
                break;
            case ParameterType::F32:
                m_writer.Write<float>(param.AsF32());
                break;
            case ParameterType::Int:
                m_writer.Write<std::int32_t>(param.AsInt());
                break;
            case ParameterType::U32:
                m_writer.Write<std::uint32_t>(param.AsU32());
                break;
            case ParameterType::Vec2: {
                const auto v = param.AsVec2();
                WriteF32s({v.x, v.y});
                break;
            }
            case ParameterType::Vec3: {
                const auto v = param.AsVec3();
                WriteF32s({v.x, v.y, v.z});
                break;
            }
            case ParameterType::Vec4:
            case ParameterType::Color:
            case ParameterType::Quat: {
                const auto v = param.AsVec4();
                WriteF32s({v.x, v.y, v.z, v.w});
                break;
            }
            default:
                for (const auto& curve : param.AsCurves()) {
                    m_writer.Write<std::uint32_t>(curve.a);
                    m_writer.Write<std::uint32_t>(curve.b);
                    for (const float value : curve.floats) {
                        m_writer.Write<float>(value);
                    }
                }
                break;
        }
    }

    io::BinaryWriter m_writer;
    std::vector<Placed<ParameterList>> m_lists;
    std::vector<Placed<ParameterObject>> m_objects;
    std::vector<Placed<Parameter>> m_params;
};

} // namespace

Name::Name(std::string_view text) : hash(utils::Crc32(text)) {}

std::string_view ToString(ParameterType type) {
    switch (type) {
        case ParameterType::Bool:         return "bool";
        case ParameterType::F32:          return "f32";
        case ParameterType::Int:          return "int";
        case ParameterType::Vec2:         return "vec2";
        case ParameterType::Vec3:         return "vec3";
        case ParameterType::Vec4:         return "vec4";
        case ParameterType::Color:        return "color";
        case ParameterType::String32:     return "string32";
        case ParameterType::String64:     return "string64";
        case ParameterType::Curve1:       return "curve1";
        case ParameterType::Curve2:       return "curve2";
        case ParameterType::Curve3:       return "curve3";
        case ParameterType::Curve4:       return "curve4";
        case ParameterType::BufferInt:    return "buffer_int";
        case ParameterType::BufferF32:    return "buffer_f32";
        case ParameterType::String256:    return "string256";
        case ParameterType::Quat:         return "quat";
        case ParameterType::U32:          return "u32";
        case ParameterType::BufferU32:    return "buffer_u32";
        case ParameterType::BufferBinary: return "buffer_binary";
        case ParameterType::StringRef:    return "string_ref";
    }
    return "unknown";
}

Parameter Parameter::Curves(std::vector<Curve> curves) {
    if (curves.empty() || curves.size() > 4) {
        throw core::Error(fmt::format("A curve parameter holds 1 to 4 curves, got {}", curves.size()));
    }
    const auto type = static_cast<ParameterType>(static_cast<std::uint8_t>(ParameterType::Curve1) + curves.size() - 1);
    return Parameter(type, std::move(curves));
}

bool Parameter::IsString() const {
    return m_type == ParameterType::String32 || m_type == ParameterType::String64 ||
           m_type == ParameterType::String256 || m_type == ParameterType::StringRef;
}

bool Parameter::IsBuffer() const {
    return m_type == ParameterType::BufferInt || m_type == ParameterType::BufferF32 ||
           m_type == ParameterType::BufferU32 || m_type == ParameterType::BufferBinary;
}

template <typename T>
const T& Parameter::Get(std::string_view expected) const {
    if (const auto* value = std::get_if<T>(&m_value)) {
        return *value;
    }
    throw core::ParseError(core::ParseErrorKind::TypeMismatch, {}, expected,
                           fmt::format("expected {}, parameter is {}", expected, ToString(m_type)));
}

bool Parameter::AsBool() const { return Get<bool>("bool"); }
float Parameter::AsF32() const { return Get<float>("f32"); }
std::int32_t Parameter::AsInt() const { return Get<std::int32_t>("int"); }
std::uint32_t Parameter::AsU32() const { return Get<std::uint32_t>("u32"); }
glm::vec2 Parameter::AsVec2() const { return Get<glm::vec2>("vec2"); }
glm::vec3 Parameter::AsVec3() const { return Get<glm::vec3>("vec3"); }
glm::vec4 Parameter::AsVec4() const { return Get<glm::vec4>("vec4"); }
const std::string& Parameter::AsString() const { return Get<std::string>("string"); }
const std::vector<Curve>& Parameter::AsCurves() const { return Get<std::vector<Curve>>("curve"); }
const std::vector<std::int32_t>& Parameter::AsBufferInt() const { return Get<std::vector<std::int32_t>>("buffer_int"); }
const std::vector<float>& Parameter::AsBufferF32() const { return Get<std::vector<float>>("buffer_f32"); }
const std::vector<std::uint32_t>& Parameter::AsBufferU32() const { return Get<std::vector<std::uint32_t>>("buffer_u32"); }
const std::vector<std::uint8_t>& Parameter::AsBufferBinary() const { return Get<std::vector<std::uint8_t>>("buffer_binary"); }

const Parameter* ParameterObject::Find(Name name) const {
    const auto it = params.find(name);
    return it == params.end() ? nullptr : &it->second;
}

const Parameter& ParameterObject::At(Name name, std::string_view label) const {
    const Parameter* param = Find(name);
    if (!param) {
        throw core::ParseError(core::ParseErrorKind::MissingField, {}, label, "parameter not present");
    }
    return *param;
}

ParameterObject& ParameterObject::Set(Name name, Parameter value) {
    params.insert_or_assign(name, std::move(value));
    return *this;
}

const ParameterObject* ParameterList::FindObject(Name name) const {
    const auto it = objects.find(name);
    return it == objects.end() ? nullptr : &it->second;
}

const ParameterList* ParameterList::FindList(Name name) const {
    const auto it = lists.find(name);
    return it == lists.end() ? nullptr : &it->second;
}

bool ParameterIO::IsParameterIO(std::span<const std::uint8_t> data) {
    return data.size() >= 4 && data[0] == 'A' && data[1] == 'A' && data[2] == 'M' && data[3] == 'P';
}

ParameterIO ParameterIO::FromBinary(std::span<const std::uint8_t> data, std::string_view context) {
    return Parser(data, context).Parse();
}

std::vector<std::uint8_t> ParameterIO::ToBinary(core::Endian endian) const {
    return Writer(endian).Write(*this);
}

} // namespace mm::formats::aamp
