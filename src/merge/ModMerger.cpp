#include "mm/merge/ModMerger.hpp"

#include <optional>
#include <set>
#include <string_view>
#include <utility>

#include "mm/core/Error.hpp"
#include "mm/core/Logger.hpp"
#include "mm/utils/Config.hpp"
#include "mm/utils/PathUtil.hpp"

namespace mm::merge {

namespace {

// Root file of an archive member key ("Pack/Bootup.pack//Actor/X.bxml" -> "Pack/Bootup.pack").
std::string_view RootKey(std::string_view key) {
    const auto separator = key.find(utils::kArchiveSeparator);
    return separator == std::string_view::npos ? key : key.substr(0, separator);
}

struct RenderJob {
    std::string path;
    bool aoc = false;
};

struct RenderedFile {
    std::optional<std::vector<std::uint8_t>> data;
    std::vector<std::string> skipped;
};

} // namespace

MergerOptions MergerOptions::FromConfig(const utils::EngineConfig& config) {
    MergerOptions options;
    options.workerThreads = config.workerThreads;
    options.compressOutput = config.compressOutput;
    options.missingResources = config.missingResources;
    return options;
}

ModMerger::ModMerger(MergerOptions options)
    : m_options(options),
      m_pool(std::make_unique<utils::ThreadPool>(options.workerThreads)) {
    core::Logger::Debug("[ModMerger] Using {} worker threads", m_pool->ThreadCount());
}

content::ResourceTable ModMerger::Diff(const content::ResourceTable& base,
                                       const content::ResourceTable& modified) const {
    std::vector<std::string> keys;
    keys.reserve(modified.size());
    for (const auto& [key, resource] : modified) {
        keys.push_back(key);
    }

    // Tasks only read both tables; they are joined before either can go away.
    auto pending = m_pool->SubmitEach(keys, [&base, &modified](const std::string& key)
                                                -> std::optional<content::ResourceData> {
        const auto& resource = modified.at(key);
        const auto baseIt = base.find(key);
        if (baseIt == base.end()) {
            return resource;
        }
        if (baseIt->second == resource) {
            return std::nullopt;
        }
        return baseIt->second.Diff(resource);
    });
    utils::ThreadPool::WaitAll(pending);

    content::ResourceTable diff;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (auto result = pending[i].get()) {
            diff.insert_or_assign(keys[i], std::move(*result));
        }
    }
    core::Logger::Info("[ModMerger] Diff holds {} of {} resources", diff.size(), modified.size());
    return diff;
}

content::ResourceTable ModMerger::MergeKeys(const content::ResourceTable& base,
                                            const std::vector<content::ResourceTable>& diffs,
                                            const std::vector<std::string>& keys) const {
    // Each key folds through the diffs in load order; only keys present in a diff are passed in.
    auto pending = m_pool->SubmitEach(keys, [&base, &diffs](const std::string& key) {
        std::optional<content::ResourceData> current;
        if (const auto it = base.find(key); it != base.end()) {
            current = it->second;
        }
        for (const auto& diff : diffs) {
            const auto it = diff.find(key);
            if (it == diff.end()) {
                continue;
            }
            if (current) {
                current = current->Merge(it->second);
            } else {
                current = it->second;
            }
        }
        return std::move(*current);
    });
    utils::ThreadPool::WaitAll(pending);

    content::ResourceTable merged = base;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        merged.insert_or_assign(keys[i], pending[i].get());
    }
    core::Logger::Info("[ModMerger] Merged {} resources from {} diffs", keys.size(), diffs.size());
    return merged;
}

content::ResourceTable ModMerger::Merge(const content::ResourceTable& base,
                                        const std::vector<content::ResourceTable>& diffs) const {
    std::set<std::string> keys;
    for (const auto& diff : diffs) {
        for (const auto& [key, resource] : diff) {
            keys.insert(key);
        }
    }
    return MergeKeys(base, diffs, std::vector<std::string>(keys.begin(), keys.end()));
}

content::ResourceTable ModMerger::Merge(const content::ResourceTable& base,
                                        const std::vector<content::ResourceTable>& diffs,
                                        const Manifest& scope) const {
    const auto resources = scope.Resources();
    const std::set<std::string, std::less<>> roots(resources.begin(), resources.end());

    std::set<std::string> keys;
    for (const auto& diff : diffs) {
        for (const auto& [key, resource] : diff) {
            if (roots.contains(RootKey(key))) {
                keys.insert(key);
            }
        }
    }
    return MergeKeys(base, diffs, std::vector<std::string>(keys.begin(), keys.end()));
}

RenderedOutputs ModMerger::RenderOutputs(const content::ResourceTable& table,
                                         const Manifest& manifest,
                                         core::Endian endian) const {
    std::vector<RenderJob> jobs;
    jobs.reserve(manifest.contentFiles.size() + manifest.aocFiles.size());
    for (const auto& path : manifest.contentFiles) {
        jobs.push_back(RenderJob{path, false});
    }
    for (const auto& path : manifest.aocFiles) {
        jobs.push_back(RenderJob{path, true});
    }

    auto pending = m_pool->SubmitEach(jobs, [this, &table, endian](const RenderJob& job) {
        RenderedFile file;
        const std::string key = Manifest::CanonicalKey(job.path, job.aoc);
        const auto it = table.find(key);
        if (it == table.end()) {
            if (m_options.missingResources == content::MissingResourcePolicy::Skip) {
                core::Logger::Warning("[ModMerger] Skipping '{}': no resource '{}'", job.path, key);
                file.skipped.push_back(key);
                return file;
            }
            throw core::MissingResourceError(job.path, key, "listed in manifest");
        }
        content::SerializeContext context;
        context.missingResources = m_options.missingResources;
        const bool compress = m_options.compressOutput && utils::HasCompressedExtension(job.path);
        file.data = it->second.ToBinary(endian, table, context, compress, key);
        file.skipped = std::move(context.skippedEntries);
        return file;
    });
    utils::ThreadPool::WaitAll(pending);

    RenderedOutputs outputs;
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        RenderedFile file = pending[i].get();
        outputs.skippedEntries.insert(outputs.skippedEntries.end(), file.skipped.begin(), file.skipped.end());
        if (!file.data) {
            continue;
        }
        auto& target = jobs[i].aoc ? outputs.aoc : outputs.content;
        target.insert_or_assign(jobs[i].path, std::move(*file.data));
    }
    core::Logger::Info("[ModMerger] Rendered {} files for {}", outputs.content.size() + outputs.aoc.size(),
                       core::PlatformName(endian));
    return outputs;
}

} // namespace mm::merge
