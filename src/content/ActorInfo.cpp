#include "mm/content/ActorInfo.hpp"

#include "mm/core/Error.hpp"
#include "mm/utils/Hash.hpp"

namespace mm::content {

using formats::Byml;

namespace {

constexpr std::uint32_t kMaxSignedHash = 0x7FFFFFFF;

} // namespace

bool ActorInfo::PathMatches(std::string_view canonicalPath) {
    return canonicalPath.ends_with("Actor/ActorInfo.product.byml");
}

ActorInfo ActorInfo::FromByml(const Byml& byml) {
    ActorInfo info;
    for (const auto& actor : byml.At("Actors").AsArray()) {
        const auto& name = actor.At("name").AsString();
        info.m_actors.Insert(utils::Crc32(name), actor);
    }
    return info;
}

ActorInfo ActorInfo::FromBinary(std::span<const std::uint8_t> data) {
    return FromByml(Byml::FromBinary(data, kKindName));
}

Byml ActorInfo::ToByml() const {
    Byml::Array actors;
    Byml::Array hashes;
    m_actors.ForEachPresent([&](std::uint32_t hash, const Byml& actor) {
        actors.push_back(actor);
        if (hash > kMaxSignedHash) {
            hashes.emplace_back(hash);
        } else {
            hashes.emplace_back(static_cast<std::int32_t>(hash));
        }
    });
    Byml::Hash root;
    root.emplace("Actors", Byml(std::move(actors)));
    root.emplace("Hashes", Byml(std::move(hashes)));
    return Byml(std::move(root));
}

ActorInfo ActorInfo::Diff(const ActorInfo& modified) const {
    ActorInfo diff;
    diff.m_actors = m_actors.DeepDiff(modified.m_actors);
    return diff;
}

ActorInfo ActorInfo::Merge(const ActorInfo& diff) const {
    ActorInfo merged;
    merged.m_actors = m_actors.DeepMerge(diff.m_actors);
    return merged;
}

} // namespace mm::content
