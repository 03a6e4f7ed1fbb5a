#include "mm/utils/PathUtil.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace mm::utils {

namespace {

// Extensions that begin with 's' without being a compressed variant.
constexpr std::array<std::string_view, 4> kPlainSExtensions{
    ".sarc", ".stera", ".sstera", ".stats"
};

bool StartsWithIgnoreCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string_view FileName(std::string_view path) {
    const auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::string_view Extension(std::string_view path) {
    const std::string_view name = FileName(path);
    const auto dot = name.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0) {
        return {};
    }
    return name.substr(dot);
}

bool HasCompressedExtension(std::string_view path) {
    const std::string_view ext = Extension(path);
    if (ext.size() < 3 || ext[1] != 's') {
        return false;
    }
    return std::find(kPlainSExtensions.begin(), kPlainSExtensions.end(), ext) == kPlainSExtensions.end();
}

std::string CanonicalizePath(std::string_view path) {
    std::string result(path);
    std::replace(result.begin(), result.end(), '\\', '/');

    std::string_view view(result);
    while (!view.empty() && view.front() == '/') {
        view.remove_prefix(1);
    }

    std::string prefix;
    if (StartsWithIgnoreCase(view, "content/")) {
        view.remove_prefix(8);
    } else if (StartsWithIgnoreCase(view, "aoc/0010/")) {
        view.remove_prefix(9);
        if (StartsWithIgnoreCase(view, "content/")) {
            view.remove_prefix(8);
        }
        prefix = kAocPrefix;
    } else if (StartsWithIgnoreCase(view, "aoc/")) {
        view.remove_prefix(4);
        prefix = kAocPrefix;
    }

    std::string canonical = prefix + std::string(view);
    if (HasCompressedExtension(canonical)) {
        const std::size_t dot = canonical.size() - Extension(canonical).size();
        canonical.erase(dot + 1, 1);
    }
    return canonical;
}

std::string JoinArchivePath(std::string_view archiveKey, std::string_view member) {
    std::string joined(archiveKey);
    joined.append(kArchiveSeparator);
    joined.append(CanonicalizePath(member));
    return joined;
}

} // namespace mm::utils
