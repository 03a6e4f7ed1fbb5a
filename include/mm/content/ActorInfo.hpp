#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "mm/collections/DeleteMap.hpp"
#include "mm/content/BymlMerge.hpp"
#include "mm/core/Endian.hpp"
#include "mm/formats/Byml.hpp"

namespace mm::content {

/**
 * @brief Actor info database (Actor/ActorInfo.product.byml).
 *
 * Actor entries are keyed by the CRC32 of their name and merged key-wise. The
 * Hashes array is derived data and is rebuilt from the keys on write.
 */
class ActorInfo {
public:
    static constexpr std::string_view kKindName = "ActorInfo";

    static bool PathMatches(std::string_view canonicalPath);
    static ActorInfo FromByml(const formats::Byml& byml);
    static ActorInfo FromBinary(std::span<const std::uint8_t> data);

    formats::Byml ToByml() const;
    std::vector<std::uint8_t> ToBinary(core::Endian endian) const { return ToByml().ToBinary(endian); }

    ActorInfo Diff(const ActorInfo& modified) const;
    ActorInfo Merge(const ActorInfo& diff) const;

    const collections::SortedDeleteMap<std::uint32_t, formats::Byml>& Actors() const { return m_actors; }
    collections::SortedDeleteMap<std::uint32_t, formats::Byml>& Actors() { return m_actors; }

    bool operator==(const ActorInfo&) const = default;

private:
    collections::SortedDeleteMap<std::uint32_t, formats::Byml> m_actors;
};

} // namespace mm::content
