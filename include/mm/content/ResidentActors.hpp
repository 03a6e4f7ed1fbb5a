#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "mm/collections/DeleteMap.hpp"
#include "mm/core/Endian.hpp"
#include "mm/formats/Byml.hpp"

namespace mm::content {

// Resident actor list (Actor/ResidentActors.byml): actor name to its only_res flag.
class ResidentActors {
public:
    static constexpr std::string_view kKindName = "ResidentActors";

    static bool PathMatches(std::string_view canonicalPath);
    static ResidentActors FromByml(const formats::Byml& byml);
    static ResidentActors FromBinary(std::span<const std::uint8_t> data);

    formats::Byml ToByml() const;
    std::vector<std::uint8_t> ToBinary(core::Endian endian) const { return ToByml().ToBinary(endian); }

    ResidentActors Diff(const ResidentActors& modified) const;
    ResidentActors Merge(const ResidentActors& diff) const;

    const collections::DeleteMap<std::string, bool>& Actors() const { return m_actors; }
    collections::DeleteMap<std::string, bool>& Actors() { return m_actors; }

    bool operator==(const ResidentActors&) const = default;

private:
    collections::DeleteMap<std::string, bool> m_actors;
};

} // namespace mm::content
