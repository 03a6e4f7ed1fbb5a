#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "mm/collections/DeleteMap.hpp"
#include "mm/content/ParameterMerge.hpp"
#include "mm/formats/Aamp.hpp"

namespace mm::content {

/**
 * @brief Drop table (.bdrop).
 *
 * The Header object names each table (TableNum, Table01..TableNN); each table
 * is a parameter object of the same name. Tables are merged parameter-wise and
 * the header is regenerated from the surviving tables on write.
 */
class DropTable {
public:
    static constexpr std::string_view kKindName = "DropTable";

    static bool PathMatches(std::string_view canonicalPath);
    static DropTable FromParameterIO(const formats::aamp::ParameterIO& pio);
    static DropTable FromBinary(std::span<const std::uint8_t> data);

    formats::aamp::ParameterIO ToParameterIO() const;
    std::vector<std::uint8_t> ToBinary() const { return ToParameterIO().ToBinary(); }

    DropTable Diff(const DropTable& modified) const;
    DropTable Merge(const DropTable& diff) const;

    const collections::DeleteMap<std::string, formats::aamp::ParameterObject>& Tables() const { return m_tables; }
    collections::DeleteMap<std::string, formats::aamp::ParameterObject>& Tables() { return m_tables; }

    bool operator==(const DropTable&) const = default;

private:
    collections::DeleteMap<std::string, formats::aamp::ParameterObject> m_tables;
};

} // namespace mm::content
