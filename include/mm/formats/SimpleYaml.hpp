#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace mm::formats::SimpleYaml {

/**
 * @brief Parse the block-style YAML subset used by patch logs into the BYML
 * JSON view (see BymlJson.hpp).
 *
 * Supported features:
 * - Mappings indented by 2 spaces per level, with plain or quoted keys
 * - Block lists using '- value' and flat flow lists like [1, 2.5, x]
 * - Scalars: strings, quoted strings, integers, floats, booleans, null
 * - Width tags on numeric scalars: !u, !l, !ul and !f64 become the
 *   {"@u32": n}, {"@i64": n}, {"@u64": n} and {"@f64": x} tagged objects
 *
 * @param source Raw YAML text
 * @param out Parsed JSON document
 * @param error Error message on failure
 * @return true on success
 */
bool Parse(const std::string& source, nlohmann::json& out, std::string& error);

/**
 * @brief Load a .json file through nlohmann and anything else through Parse.
 */
bool LoadStructuredFile(const std::filesystem::path& path, nlohmann::json& out, std::string& error);

} // namespace mm::formats::SimpleYaml
