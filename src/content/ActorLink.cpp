#include "mm/content/ActorLink.hpp"

#include <fmt/format.h>

#include "mm/core/Error.hpp"
#include "mm/utils/PathUtil.hpp"

namespace mm::content {

using namespace formats::aamp;

bool ActorLink::PathMatches(std::string_view canonicalPath) {
    return utils::Extension(canonicalPath) == ".bxml";
}

ActorLink ActorLink::FromParameterIO(const ParameterIO& pio) {
    ActorLink link;
    const auto* targets = pio.FindObject("LinkTarget");
    if (!targets) {
        throw core::ParseError(core::ParseErrorKind::MissingField, {}, "LinkTarget",
                               "actor link is missing its LinkTarget object");
    }
    link.m_targets = *targets;

    if (const auto* tags = pio.FindObject("Tags")) {
        collections::DeleteVec<std::string> values;
        for (const auto& [name, param] : tags->params) {
            values.Insert(param.AsString());
        }
        link.m_tags = std::move(values);
    }
    return link;
}

ActorLink ActorLink::FromBinary(std::span<const std::uint8_t> data) {
    return FromParameterIO(ParameterIO::FromBinary(data, kKindName));
}

ParameterIO ActorLink::ToParameterIO() const {
    ParameterIO pio;
    pio.root.objects.insert_or_assign("LinkTarget", m_targets);
    if (m_tags) {
        ParameterObject tags;
        std::size_t index = 0;
        for (const auto& tag : m_tags->Values()) {
            tags.Set(Name(fmt::format("Tag{}", index++)), Parameter::String64(tag));
        }
        pio.root.objects.insert_or_assign("Tags", std::move(tags));
    }
    return pio;
}

ActorLink ActorLink::Diff(const ActorLink& modified) const {
    ActorLink diff;
    diff.m_targets = DiffObject(m_targets, modified.m_targets);
    if (m_tags && modified.m_tags) {
        diff.m_tags = m_tags->Diff(*modified.m_tags);
    } else {
        diff.m_tags = modified.m_tags;
    }
    return diff;
}

ActorLink ActorLink::Merge(const ActorLink& diff) const {
    ActorLink merged;
    merged.m_targets = MergeObject(m_targets, diff.m_targets);
    if (m_tags && diff.m_tags) {
        merged.m_tags = m_tags->Merge(*diff.m_tags);
    } else {
        merged.m_tags = diff.m_tags ? diff.m_tags : m_tags;
    }
    return merged;
}

} // namespace mm::content
