#pragma once

#include <string>
#include <string_view>

namespace mm::utils {

// Separator between an archive's canonical key and a member path.
inline constexpr std::string_view kArchiveSeparator = "//";

// Virtual directory prefixed to add-on content keys.
inline constexpr std::string_view kAocPrefix = "Aoc/0010/";

/**
 * @brief Canonical resource key for a logical file path.
 *
 * Converts backslashes, drops leading slashes and a "content/" root, maps an
 * "aoc/0010/" root onto kAocPrefix and strips the compression marker from the
 * extension ("Static.smubin" becomes "Static.mubin").
 */
std::string CanonicalizePath(std::string_view path);

// Extension including the dot, taken from the final path component.
std::string_view Extension(std::string_view path);
std::string_view FileName(std::string_view path);

// True when the extension names a Yaz0-compressed variant (".sbyml", ".ssarc").
bool HasCompressedExtension(std::string_view path);

std::string JoinArchivePath(std::string_view archiveKey, std::string_view member);

} // namespace mm::utils
