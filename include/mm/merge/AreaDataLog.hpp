#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "mm/core/Endian.hpp"
#include "mm/merge/DumpSource.hpp"

namespace mm::merge {

inline constexpr std::string_view kAreaDataPath = "Ecosystem/AreaData.byml";
inline constexpr std::string_view kBootupAreaDataPath = "Pack/Bootup.pack//Ecosystem/AreaData.sbyml";

struct AreaDataPatch {
    std::string archivePath = "Pack/Bootup.pack";
    std::string memberPath = "Ecosystem/AreaData.sbyml";
    std::vector<std::uint8_t> data;     // Yaz0 compressed
};

/**
 * @brief Applies a legacy area-data log onto the dump's area table.
 *
 * The log is a mapping keyed by decimal AreaNumber whose values are whole
 * area entries in the BYML JSON form. Listed areas replace or extend the base
 * table; the result is the compressed member to place into Bootup.pack.
 * Throws core::ParseError on a malformed log.
 */
AreaDataPatch ApplyAreaDataLog(const DumpSource& dump, const nlohmann::json& log, core::Endian endian);

// Reads the log from disk (YAML such as logs/areadata.yml, or .json) and applies it.
AreaDataPatch ApplyAreaDataLog(const DumpSource& dump, const std::filesystem::path& logPath, core::Endian endian);

// Replaces or adds one member of a (possibly compressed) archive, keeping its compression.
std::vector<std::uint8_t> InjectIntoSarc(std::span<const std::uint8_t> archive,
                                         std::string_view member,
                                         std::vector<std::uint8_t> data);

} // namespace mm::merge
