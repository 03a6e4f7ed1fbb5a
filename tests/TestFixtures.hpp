#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "mm/content/GameData.hpp"
#include "mm/core/Endian.hpp"
#include "mm/formats/Aamp.hpp"
#include "mm/formats/Byml.hpp"

std::vector<std::uint8_t> BytesOf(std::string_view text);

// An actor link document with the given LinkTarget strings and tags.
mm::formats::aamp::ParameterIO MakeActorLinkIO(const std::map<std::string, std::string>& targets,
                                               const std::vector<std::string>& tags);

// ActorInfo.product document: one { name, profile } entry per actor.
mm::formats::Byml MakeActorInfoDocument(const std::map<std::string, std::string>& actorProfiles);

std::vector<std::uint8_t> MakeSarc(const std::map<std::string, std::vector<std::uint8_t>>& files,
                                   mm::core::Endian endian = mm::core::Endian::Little);

// A s32 game flag with the given hash and initial value.
mm::formats::Byml MakeS32Flag(std::uint32_t hash, std::int32_t initValue);

// An s32_data table holding `count` flags with hashes 1..count.
mm::content::GameData MakeS32Table(std::size_t count);

// Temporary directory removed on destruction.
struct TempDirectory {
    std::filesystem::path path;

    explicit TempDirectory(std::string_view name);
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    void WriteFile(const std::filesystem::path& relative, const std::vector<std::uint8_t>& data) const;
};
