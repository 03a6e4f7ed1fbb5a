#include "mm/content/BymlMerge.hpp"

namespace mm::content {

using formats::Byml;

namespace {

bool BothHashes(const Byml& lhs, const Byml& rhs) {
    return lhs.GetType() == Byml::Type::Hash && rhs.GetType() == Byml::Type::Hash;
}

} // namespace

Byml DiffDocument(const Byml& base, const Byml& modified) {
    if (!BothHashes(base, modified)) {
        return modified;
    }
    Byml::Hash diff;
    const auto& before = base.AsHash();
    for (const auto& [key, value] : modified.AsHash()) {
        const auto it = before.find(key);
        if (it == before.end()) {
            diff.emplace(key, value);
        } else if (!(it->second == value)) {
            diff.emplace(key, DiffDocument(it->second, value));
        }
    }
    for (const auto& [key, value] : before) {
        if (!modified.Find(key)) {
            diff.emplace(key, Byml());
        }
    }
    return Byml(std::move(diff));
}

Byml MergeDocument(const Byml& base, const Byml& diff) {
    if (!BothHashes(base, diff)) {
        return diff;
    }
    Byml merged(base);
    auto& hash = merged.AsHash();
    for (const auto& [key, value] : diff.AsHash()) {
        if (value.IsNull()) {
            hash.erase(key);
            continue;
        }
        const auto it = hash.find(key);
        if (it == hash.end()) {
            hash.emplace(key, value);
        } else {
            it->second = MergeDocument(it->second, value);
        }
    }
    return merged;
}

} // namespace mm::content
