#pragma once

#include <nlohmann/json.hpp>

#include "mm/formats/Byml.hpp"

namespace mm::formats {

/**
 * JSON view of a BYML document. Plain JSON values map onto the default node
 * types (int, float, string, bool, null, array, hash); the remaining widths and
 * binary blobs use a single-key tagged object: {"@u32": 5}, {"@i64": -1},
 * {"@u64": 7}, {"@f64": 0.5}, {"@binary": "0a0bff"}.
 */
nlohmann::json ToJson(const Byml& node);
Byml FromJson(const nlohmann::json& json);

} // namespace mm::formats
