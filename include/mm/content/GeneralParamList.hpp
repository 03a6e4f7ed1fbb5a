#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "mm/collections/DeleteMap.hpp"
#include "mm/content/ParameterMerge.hpp"
#include "mm/formats/Aamp.hpp"

namespace mm::content {

// General parameter list (.bgparamlist): root objects keyed by name, merged parameter-wise.
class GeneralParamList {
public:
    static constexpr std::string_view kKindName = "GeneralParamList";

    static bool PathMatches(std::string_view canonicalPath);
    static GeneralParamList FromParameterIO(const formats::aamp::ParameterIO& pio);
    static GeneralParamList FromBinary(std::span<const std::uint8_t> data);

    formats::aamp::ParameterIO ToParameterIO() const;
    std::vector<std::uint8_t> ToBinary() const { return ToParameterIO().ToBinary(); }

    GeneralParamList Diff(const GeneralParamList& modified) const;
    GeneralParamList Merge(const GeneralParamList& diff) const;

    const collections::DeleteMap<formats::aamp::Name, formats::aamp::ParameterObject>& Objects() const {
        return m_objects;
    }
    collections::DeleteMap<formats::aamp::Name, formats::aamp::ParameterObject>& Objects() { return m_objects; }

    bool operator==(const GeneralParamList&) const = default;

private:
    collections::DeleteMap<formats::aamp::Name, formats::aamp::ParameterObject> m_objects;
};

} // namespace mm::content
