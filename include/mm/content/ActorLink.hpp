#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "mm/collections/DeleteVec.hpp"
#include "mm/content/ParameterMerge.hpp"
#include "mm/formats/Aamp.hpp"

namespace mm::content {

// Actor link file (.bxml): the LinkTarget parameter object and an optional tag set.
class ActorLink {
public:
    static constexpr std::string_view kKindName = "ActorLink";

    static bool PathMatches(std::string_view canonicalPath);
    static ActorLink FromParameterIO(const formats::aamp::ParameterIO& pio);
    static ActorLink FromBinary(std::span<const std::uint8_t> data);

    formats::aamp::ParameterIO ToParameterIO() const;
    std::vector<std::uint8_t> ToBinary() const { return ToParameterIO().ToBinary(); }

    ActorLink Diff(const ActorLink& modified) const;
    ActorLink Merge(const ActorLink& diff) const;

    const formats::aamp::ParameterObject& Targets() const { return m_targets; }
    formats::aamp::ParameterObject& Targets() { return m_targets; }
    const std::optional<collections::DeleteVec<std::string>>& Tags() const { return m_tags; }
    void SetTags(collections::DeleteVec<std::string> tags) { m_tags = std::move(tags); }

    bool operator==(const ActorLink&) const = default;

private:
    formats::aamp::ParameterObject m_targets;
    std::optional<collections::DeleteVec<std::string>> m_tags;
};

} // namespace mm::content
