#pragma once

namespace mm::collections {

/**
 * @brief Diff/merge customization point.
 *
 * The default forwards to member Diff() and Merge(). Types that come from a
 * codec and carry no members of their own (parameter objects, BYML nodes)
 * specialize this next to their merge rules.
 *
 *  - Diff(base, modified) holds only what changed between the two.
 *  - Merge(base, diff) applies such a diff; Merge(a, Diff(a, b)) == b.
 */
template <typename T>
struct MergeTraits {
    static T Diff(const T& base, const T& modified) { return base.Diff(modified); }
    static T Merge(const T& base, const T& diff) { return base.Merge(diff); }
};

} // namespace mm::collections
