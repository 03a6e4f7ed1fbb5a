#pragma once

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "mm/core/Endian.hpp"

namespace mm::formats {

/**
 * @brief In-memory SARC archive: a flat map of member names to raw bytes.
 *
 * Parsing accepts any node order the game produces; serialization is
 * deterministic (nodes sorted by name hash, members aligned by content) so
 * that an archive written by this class re-serializes byte-identically.
 */
class Sarc {
public:
    static constexpr std::uint32_t kHashKey = 0x65;
    static constexpr std::uint32_t kDefaultMinAlignment = 4;

    Sarc() = default;
    explicit Sarc(core::Endian endian) : m_endian(endian) {}

    static bool IsSarc(std::span<const std::uint8_t> data);
    static Sarc FromBinary(std::span<const std::uint8_t> data, std::string_view context = "sarc");
    [[nodiscard]] std::vector<std::uint8_t> ToBinary() const;

    static std::uint32_t HashName(std::string_view name, std::uint32_t key = kHashKey);

    core::Endian GetEndian() const { return m_endian; }
    void SetEndian(core::Endian endian) { m_endian = endian; }

    std::uint32_t GetMinAlignment() const { return m_minAlignment; }
    void SetMinAlignment(std::uint32_t alignment);

    const std::map<std::string, std::vector<std::uint8_t>>& Files() const { return m_files; }
    const std::vector<std::uint8_t>* GetFile(std::string_view name) const;
    void AddFile(std::string name, std::vector<std::uint8_t> data);
    bool RemoveFile(std::string_view name);
    std::size_t Size() const { return m_files.size(); }

    bool operator==(const Sarc&) const = default;

private:
    std::uint32_t AlignmentFor(std::span<const std::uint8_t> data) const;

    core::Endian m_endian = core::Endian::Little;
    std::uint32_t m_minAlignment = kDefaultMinAlignment;
    std::map<std::string, std::vector<std::uint8_t>> m_files;
};

} // namespace mm::formats
