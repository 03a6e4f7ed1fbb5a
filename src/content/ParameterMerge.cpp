#include "mm/content/ParameterMerge.hpp"

namespace mm::content {

using formats::aamp::ParameterList;
using formats::aamp::ParameterObject;

ParameterObject DiffObject(const ParameterObject& base, const ParameterObject& modified) {
    ParameterObject diff;
    for (const auto& [name, param] : modified.params) {
        const auto* current = base.Find(name);
        if (!current || !(*current == param)) {
            diff.params.insert_or_assign(name, param);
        }
    }
    return diff;
}

ParameterObject MergeObject(const ParameterObject& base, const ParameterObject& diff) {
    ParameterObject merged(base);
    for (const auto& [name, param] : diff.params) {
        merged.params.insert_or_assign(name, param);
    }
    return merged;
}

ParameterList DiffList(const ParameterList& base, const ParameterList& modified) {
    ParameterList diff;
    for (const auto& [name, object] : modified.objects) {
        const auto* current = base.FindObject(name);
        if (!current) {
            diff.objects.insert_or_assign(name, object);
        } else if (!(*current == object)) {
            diff.objects.insert_or_assign(name, DiffObject(*current, object));
        }
    }
    for (const auto& [name, list] : modified.lists) {
        const auto* current = base.FindList(name);
        if (!current) {
            diff.lists.insert_or_assign(name, list);
        } else if (!(*current == list)) {
            diff.lists.insert_or_assign(name, DiffList(*current, list));
        }
    }
    return diff;
}

ParameterList MergeList(const ParameterList& base, const ParameterList& diff) {
    ParameterList merged(base);
    for (const auto& [name, object] : diff.objects) {
        if (const auto* current = base.FindObject(name)) {
            merged.objects.insert_or_assign(name, MergeObject(*current, object));
        } else {
            merged.objects.insert_or_assign(name, object);
        }
    }
    for (const auto& [name, list] : diff.lists) {
        if (const auto* current = base.FindList(name)) {
            merged.lists.insert_or_assign(name, MergeList(*current, list));
        } else {
            merged.lists.insert_or_assign(name, list);
        }
    }
    return merged;
}

} // namespace mm::content
