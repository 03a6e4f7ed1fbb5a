#include "mm/merge/DumpSource.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include "mm/core/Error.hpp"
#include "mm/core/Logger.hpp"
#include "mm/formats/Sarc.hpp"
#include "mm/formats/Yaz0.hpp"
#include "mm/utils/PathUtil.hpp"

namespace mm::merge {

std::optional<std::vector<std::uint8_t>> DumpSource::Read(std::string_view path) const {
    auto separator = path.find(utils::kArchiveSeparator);
    auto data = ReadFile(path.substr(0, separator));
    std::string archive(path.substr(0, separator));

    while (data && separator != std::string_view::npos) {
        path.remove_prefix(separator + utils::kArchiveSeparator.size());
        separator = path.find(utils::kArchiveSeparator);
        const std::string_view member = path.substr(0, separator);

        const auto plain = formats::yaz0::DecompressIfNeeded(std::move(*data), archive);
        if (!formats::Sarc::IsSarc(plain)) {
            core::Logger::Warning("[DumpSource] '{}' is not an archive, cannot read '{}'", archive, member);
            return std::nullopt;
        }
        const auto sarc = formats::Sarc::FromBinary(plain, archive);
        const auto* file = sarc.GetFile(member);
        if (!file) {
            return std::nullopt;
        }
        data = *file;
        archive = utils::JoinArchivePath(archive, member);
    }
    return data;
}

std::vector<std::uint8_t> DumpSource::GetFromSarc(std::string_view primaryPath, std::string_view fallbackPath) const {
    if (auto data = Read(primaryPath)) {
        return std::move(*data);
    }
    if (auto data = Read(fallbackPath)) {
        core::Logger::Debug("[DumpSource] '{}' not found, using '{}'", primaryPath, fallbackPath);
        return std::move(*data);
    }
    throw core::MissingResourceError(primaryPath, fallbackPath, "not present in the dump");
}

DirectoryDump::DirectoryDump(std::filesystem::path contentRoot, std::filesystem::path aocRoot)
    : m_contentRoot(std::move(contentRoot)),
      m_aocRoot(std::move(aocRoot)) {}

std::optional<std::vector<std::uint8_t>> DirectoryDump::ReadFile(std::string_view path) const {
    std::filesystem::path file;
    if (path.starts_with(utils::kAocPrefix)) {
        if (m_aocRoot.empty()) {
            return std::nullopt;
        }
        file = m_aocRoot / std::filesystem::path(std::string(path.substr(utils::kAocPrefix.size())));
    } else {
        file = m_contentRoot / std::filesystem::path(std::string(path));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return std::nullopt;
    }

    std::ifstream stream(file, std::ios::binary);
    if (!stream) {
        core::Logger::Error("[DirectoryDump] Failed to open '{}'", file.string());
        return std::nullopt;
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

} // namespace mm::merge
