#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "mm/content/ResourceData.hpp"
#include "mm/content/ResourceRegistry.hpp"

namespace mm::merge {

/**
 * @brief Fills a resource table from raw files.
 *
 * Typed schemas take precedence over archive expansion. Other SARC archives
 * are expanded recursively into SarcMap entries whose members live under
 * "archive//member" keys. Data no schema or magic recognises is kept as
 * opaque binary.
 */
class ResourceLoader {
public:
    explicit ResourceLoader(const content::ResourceRegistry& registry) : m_registry(registry) {}

    // Loads one file and returns its canonical key.
    std::string Load(content::ResourceTable& table, std::string_view path, std::vector<std::uint8_t> bytes) const;

private:
    void LoadKey(content::ResourceTable& table, const std::string& key, std::vector<std::uint8_t> bytes) const;

    const content::ResourceRegistry& m_registry;
};

} // namespace mm::merge
