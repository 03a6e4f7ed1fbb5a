#include "mm/content/DropTable.hpp"

#include <fmt/format.h>

#include "mm/core/Error.hpp"
#include "mm/utils/PathUtil.hpp"

namespace mm::content {

using namespace formats::aamp;

bool DropTable::PathMatches(std::string_view canonicalPath) {
    return utils::Extension(canonicalPath) == ".bdrop";
}

DropTable DropTable::FromParameterIO(const ParameterIO& pio) {
    const auto* header = pio.FindObject("Header");
    if (!header) {
        throw core::ParseError(core::ParseErrorKind::MissingField, {}, "Header", "drop table is missing its header");
    }
    const auto count = header->At("TableNum", "Header.TableNum").AsInt();

    DropTable table;
    for (std::int32_t i = 1; i <= count; ++i) {
        const std::string field = fmt::format("Table{:02}", i);
        const auto& name = header->At(Name(field), field).AsString();
        const auto* object = pio.FindObject(Name(name));
        if (!object) {
            throw core::ParseError(core::ParseErrorKind::MissingField, {}, name,
                                   "drop table header names a table that does not exist");
        }
        table.m_tables.Insert(name, *object);
    }
    return table;
}

DropTable DropTable::FromBinary(std::span<const std::uint8_t> data) {
    return FromParameterIO(ParameterIO::FromBinary(data, kKindName));
}

ParameterIO DropTable::ToParameterIO() const {
    ParameterIO pio;
    ParameterObject header;
    header.Set("TableNum", Parameter::Int(static_cast<std::int32_t>(m_tables.PresentCount())));
    std::int32_t index = 1;
    m_tables.ForEachPresent([&](const std::string& name, const ParameterObject&) {
        header.Set(Name(fmt::format("Table{:02}", index++)), Parameter::String64(name));
    });
    pio.root.objects.insert_or_assign("Header", std::move(header));
    m_tables.ForEachPresent([&](const std::string& name, const ParameterObject& object) {
        pio.root.objects.insert_or_assign(Name(name), object);
    });
    return pio;
}

DropTable DropTable::Diff(const DropTable& modified) const {
    DropTable diff;
    diff.m_tables = m_tables.DeepDiff(modified.m_tables);
    return diff;
}

DropTable DropTable::Merge(const DropTable& diff) const {
    DropTable merged;
    merged.m_tables = m_tables.DeepMerge(diff.m_tables);
    return merged;
}

} // namespace mm::content
