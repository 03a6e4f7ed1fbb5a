#pragma once

#include "mm/collections/Mergeable.hpp"
#include "mm/formats/Byml.hpp"

namespace mm::content {

/**
 * Key-wise document diff. When both sides are hashes the diff is a hash of the
 * keys that changed (recursing into nested hashes) with null marking a key
 * the modified side removed. Any other pair of nodes diffs atomically: the
 * diff is the modified node itself.
 */
formats::Byml DiffDocument(const formats::Byml& base, const formats::Byml& modified);
formats::Byml MergeDocument(const formats::Byml& base, const formats::Byml& diff);

} // namespace mm::content

namespace mm::collections {

template <>
struct MergeTraits<formats::Byml> {
    static formats::Byml Diff(const formats::Byml& base, const formats::Byml& modified) {
        return content::DiffDocument(base, modified);
    }
    static formats::Byml Merge(const formats::Byml& base, const formats::Byml& diff) {
        return content::MergeDocument(base, diff);
    }
};

} // namespace mm::collections
