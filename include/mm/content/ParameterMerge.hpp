#pragma once

#include "mm/collections/Mergeable.hpp"
#include "mm/formats/Aamp.hpp"

namespace mm::content {

// Parameters of `modified` that are new or differ from `base`. Parameter
// objects never record deletions.
formats::aamp::ParameterObject DiffObject(const formats::aamp::ParameterObject& base,
                                          const formats::aamp::ParameterObject& modified);
formats::aamp::ParameterObject MergeObject(const formats::aamp::ParameterObject& base,
                                           const formats::aamp::ParameterObject& diff);

// Recursive object- and list-wise diff.
formats::aamp::ParameterList DiffList(const formats::aamp::ParameterList& base,
                                      const formats::aamp::ParameterList& modified);
formats::aamp::ParameterList MergeList(const formats::aamp::ParameterList& base,
                                       const formats::aamp::ParameterList& diff);

} // namespace mm::content

namespace mm::collections {

template <>
struct MergeTraits<formats::aamp::ParameterObject> {
    static formats::aamp::ParameterObject Diff(const formats::aamp::ParameterObject& base,
                                               const formats::aamp::ParameterObject& modified) {
        return content::DiffObject(base, modified);
    }
    static formats::aamp::ParameterObject Merge(const formats::aamp::ParameterObject& base,
                                                const formats::aamp::ParameterObject& diff) {
        return content::MergeObject(base, diff);
    }
};

template <>
struct MergeTraits<formats::aamp::ParameterList> {
    static formats::aamp::ParameterList Diff(const formats::aamp::ParameterList& base,
                                             const formats::aamp::ParameterList& modified) {
        return content::DiffList(base, modified);
    }
    static formats::aamp::ParameterList Merge(const formats::aamp::ParameterList& base,
                                              const formats::aamp::ParameterList& diff) {
        return content::MergeList(base, diff);
    }
};

} // namespace mm::collections
