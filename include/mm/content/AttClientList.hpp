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

// Attention client list (.batcllist): AttPos parameters and client name to file map.
class AttClientList {
public:
    static constexpr std::string_view kKindName = "AttClientList";

    static bool PathMatches(std::string_view canonicalPath);
    static AttClientList FromParameterIO(const formats::aamp::ParameterIO& pio);
    static AttClientList FromBinary(std::span<const std::uint8_t> data);

    formats::aamp::ParameterIO ToParameterIO() const;
    std::vector<std::uint8_t> ToBinary() const { return ToParameterIO().ToBinary(); }

    AttClientList Diff(const AttClientList& modified) const;
    AttClientList Merge(const AttClientList& diff) const;

    const formats::aamp::ParameterObject& AttPos() const { return m_attPos; }
    const collections::DeleteMap<std::string, std::string>& Clients() const { return m_clients; }
    collections::DeleteMap<std::string, std::string>& Clients() { return m_clients; }

    bool operator==(const AttClientList&) const = default;

private:
    formats::aamp::ParameterObject m_attPos;
    collections::DeleteMap<std::string, std::string> m_clients;
};

} // namespace mm::content
