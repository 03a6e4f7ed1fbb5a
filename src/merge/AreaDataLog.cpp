#include "mm/merge/AreaDataLog.hpp"

#include <charconv>

#include "mm/content/AreaData.hpp"
#include "mm/core/Error.hpp"
#include "mm/core/Logger.hpp"
#include "mm/formats/BymlJson.hpp"
#include "mm/formats/Sarc.hpp"
#include "mm/formats/SimpleYaml.hpp"
#include "mm/formats/Yaz0.hpp"

namespace mm::merge {

namespace {

constexpr std::string_view kLogName = "areadata log";

content::AreaData ParseLog(const nlohmann::json& log) {
    if (!log.is_object()) {
        throw core::ParseError(core::ParseErrorKind::TypeMismatch, kLogName, {}, "expected an object keyed by area number");
    }

    collections::SortedDeleteMap<std::int64_t, formats::Byml> areas;
    for (const auto& [key, value] : log.items()) {
        std::int64_t number = 0;
        const auto [end, ec] = std::from_chars(key.data(), key.data() + key.size(), number);
        if (ec != std::errc() || end != key.data() + key.size()) {
            throw core::ParseError(core::ParseErrorKind::InvalidData, kLogName, key, "area key is not a number");
        }
        areas.Insert(number, formats::FromJson(value));
    }
    return content::AreaData(std::move(areas));
}

} // namespace

AreaDataPatch ApplyAreaDataLog(const DumpSource& dump, const nlohmann::json& log, core::Endian endian) {
    const auto diff = ParseLog(log);

    const auto stored = dump.GetFromSarc(kAreaDataPath, kBootupAreaDataPath);
    const auto base = content::AreaData::FromBinary(formats::yaz0::DecompressIfNeeded(stored, kAreaDataPath));

    AreaDataPatch patch;
    patch.data = formats::yaz0::Compress(base.Merge(diff).ToBinary(endian));
    core::Logger::Info("[AreaDataLog] Applied {} areas onto {}", diff.Areas().Size(), kAreaDataPath);
    return patch;
}

AreaDataPatch ApplyAreaDataLog(const DumpSource& dump, const std::filesystem::path& logPath, core::Endian endian) {
    nlohmann::json log;
    std::string error;
    if (!formats::SimpleYaml::LoadStructuredFile(logPath, log, error)) {
        throw core::ParseError(core::ParseErrorKind::InvalidData, kLogName, {}, error);
    }
    core::Logger::Debug("[AreaDataLog] Loaded {} entries from {}", log.size(), logPath.generic_string());
    return ApplyAreaDataLog(dump, log, endian);
}

std::vector<std::uint8_t> InjectIntoSarc(std::span<const std::uint8_t> archive,
                                         std::string_view member,
                                         std::vector<std::uint8_t> data) {
    const bool compressed = formats::yaz0::IsCompressed(archive);
    auto sarc = compressed ? formats::Sarc::FromBinary(formats::yaz0::Decompress(archive))
                           : formats::Sarc::FromBinary(archive);
    sarc.AddFile(std::string(member), std::move(data));
    auto bytes = sarc.ToBinary();
    return compressed ? formats::yaz0::Compress(bytes) : bytes;
}

} // namespace mm::merge
