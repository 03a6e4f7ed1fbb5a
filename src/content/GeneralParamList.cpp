#include "mm/content/GeneralParamList.hpp"

#include "mm/utils/PathUtil.hpp"

namespace mm::content {

using namespace formats::aamp;

bool GeneralParamList::PathMatches(std::string_view canonicalPath) {
    return utils::Extension(canonicalPath) == ".bgparamlist";
}

GeneralParamList GeneralParamList::FromParameterIO(const ParameterIO& pio) {
    GeneralParamList list;
    for (const auto& [name, object] : pio.root.objects) {
        list.m_objects.Insert(name, object);
    }
    return list;
}

GeneralParamList GeneralParamList::FromBinary(std::span<const std::uint8_t> data) {
    return FromParameterIO(ParameterIO::FromBinary(data, kKindName));
}

ParameterIO GeneralParamList::ToParameterIO() const {
    ParameterIO pio;
    m_objects.ForEachPresent([&](const Name& name, const ParameterObject& object) {
        pio.root.objects.insert_or_assign(name, object);
    });
    return pio;
}

GeneralParamList GeneralParamList::Diff(const GeneralParamList& modified) const {
    GeneralParamList diff;
    diff.m_objects = m_objects.DeepDiff(modified.m_objects);
    return diff;
}

GeneralParamList GeneralParamList::Merge(const GeneralParamList& diff) const {
    GeneralParamList merged;
    merged.m_objects = m_objects.DeepMerge(diff.m_objects);
    return merged;
}

} // namespace mm::content
