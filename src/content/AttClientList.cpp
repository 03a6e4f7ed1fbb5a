#include "mm/content/AttClientList.hpp"

#include <fmt/format.h>

#include "mm/core/Error.hpp"
#include "mm/utils/PathUtil.hpp"

namespace mm::content {

using namespace formats::aamp;

bool AttClientList::PathMatches(std::string_view canonicalPath) {
    return utils::Extension(canonicalPath) == ".batcllist";
}

AttClientList AttClientList::FromParameterIO(const ParameterIO& pio) {
    const auto* attPos = pio.FindObject("AttPos");
    if (!attPos) {
        throw core::ParseError(core::ParseErrorKind::MissingField, {}, "AttPos",
                               "attention client list is missing AttPos");
    }
    const auto* clients = pio.FindList("AttClients");
    if (!clients) {
        throw core::ParseError(core::ParseErrorKind::MissingField, {}, "AttClients",
                               "attention client list is missing its client list");
    }

    AttClientList list;
    list.m_attPos = *attPos;
    for (const auto& [name, client] : clients->objects) {
        list.m_clients.Insert(client.At("Name", "AttClients.Name").AsString(),
                              client.At("FileName", "AttClients.FileName").AsString());
    }
    return list;
}

AttClientList AttClientList::FromBinary(std::span<const std::uint8_t> data) {
    return FromParameterIO(ParameterIO::FromBinary(data, kKindName));
}

ParameterIO AttClientList::ToParameterIO() const {
    ParameterIO pio;
    pio.root.objects.insert_or_assign("AttPos", m_attPos);
    ParameterList clients;
    std::size_t index = 0;
    m_clients.ForEachPresent([&](const std::string& name, const std::string& file) {
        ParameterObject client;
        client.Set("Name", Parameter::String64(name));
        client.Set("FileName", Parameter::String64(file));
        clients.objects.insert_or_assign(Name(fmt::format("AttClient_{}", index++)), std::move(client));
    });
    pio.root.lists.insert_or_assign("AttClients", std::move(clients));
    return pio;
}

AttClientList AttClientList::Diff(const AttClientList& modified) const {
    AttClientList diff;
    diff.m_attPos = DiffObject(m_attPos, modified.m_attPos);
    diff.m_clients = m_clients.Diff(modified.m_clients);
    return diff;
}

AttClientList AttClientList::Merge(const AttClientList& diff) const {
    AttClientList merged;
    merged.m_attPos = MergeObject(m_attPos, diff.m_attPos);
    merged.m_clients = m_clients.Merge(diff.m_clients);
    return merged;
}

} // namespace mm::content
