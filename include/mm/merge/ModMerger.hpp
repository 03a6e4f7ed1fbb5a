#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mm/content/ResourceData.hpp"
#include "mm/core/Endian.hpp"
#include "mm/merge/Manifest.hpp"
#include "mm/utils/ThreadPool.hpp"

namespace mm::utils {
struct EngineConfig;
}

namespace mm::merge {

struct MergerOptions {
    std::size_t workerThreads = 0;
    bool compressOutput = true;
    content::MissingResourcePolicy missingResources = content::MissingResourcePolicy::Fail;

    static MergerOptions FromConfig(const utils::EngineConfig& config);
};

// Final file bytes keyed by the manifest path they are written to.
struct RenderedOutputs {
    std::map<std::string, std::vector<std::uint8_t>> content;
    std::map<std::string, std::vector<std::uint8_t>> aoc;
    std::vector<std::string> skippedEntries;
};

/**
 * @brief Diffs mods against the base game and folds the diffs in load order.
 *
 * Every key is folded sequentially through the diffs in the order given, so
 * a later mod wins where two mods touch the same field. Distinct keys are
 * processed concurrently on the merger's worker pool.
 */
class ModMerger {
public:
    explicit ModMerger(MergerOptions options = {});

    const MergerOptions& Options() const { return m_options; }

    // Changed and new resources of `modified`; unchanged keys are omitted.
    content::ResourceTable Diff(const content::ResourceTable& base, const content::ResourceTable& modified) const;

    content::ResourceTable Merge(const content::ResourceTable& base,
                                 const std::vector<content::ResourceTable>& diffs) const;

    // Only keys inside the manifest scope, or archive members beneath them, are reconstructed.
    content::ResourceTable Merge(const content::ResourceTable& base,
                                 const std::vector<content::ResourceTable>& diffs,
                                 const Manifest& scope) const;

    RenderedOutputs RenderOutputs(const content::ResourceTable& table,
                                  const Manifest& manifest,
                                  core::Endian endian) const;

private:
    content::ResourceTable MergeKeys(const content::ResourceTable& base,
                                     const std::vector<content::ResourceTable>& diffs,
                                     const std::vector<std::string>& keys) const;

    MergerOptions m_options;
    std::unique_ptr<utils::ThreadPool> m_pool;
};

} // namespace mm::merge
