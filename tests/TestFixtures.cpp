#include "TestFixtures.hpp"

#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "mm/formats/Sarc.hpp"

using mm::formats::Byml;
using namespace mm::formats::aamp;

std::vector<std::uint8_t> BytesOf(std::string_view text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

ParameterIO MakeActorLinkIO(const std::map<std::string, std::string>& targets,
                            const std::vector<std::string>& tags) {
    ParameterIO pio;
    ParameterObject linkTarget;
    for (const auto& [name, value] : targets) {
        linkTarget.Set(Name(name), Parameter::String64(value));
    }
    pio.root.objects.insert_or_assign("LinkTarget", std::move(linkTarget));

    if (!tags.empty()) {
        ParameterObject tagObject;
        for (std::size_t i = 0; i < tags.size(); ++i) {
            tagObject.Set(Name(fmt::format("Tag{}", i)), Parameter::String64(tags[i]));
        }
        pio.root.objects.insert_or_assign("Tags", std::move(tagObject));
    }
    return pio;
}

Byml MakeActorInfoDocument(const std::map<std::string, std::string>& actorProfiles) {
    Byml::Array actors;
    for (const auto& [name, profile] : actorProfiles) {
        actors.push_back(Byml(Byml::Hash{{"name", Byml(name)}, {"profile", Byml(profile)}}));
    }
    return Byml(Byml::Hash{{"Actors", Byml(std::move(actors))}, {"Hashes", Byml(Byml::Array{})}});
}

std::vector<std::uint8_t> MakeSarc(const std::map<std::string, std::vector<std::uint8_t>>& files,
                                   mm::core::Endian endian) {
    mm::formats::Sarc sarc(endian);
    for (const auto& [name, data] : files) {
        sarc.AddFile(name, data);
    }
    return sarc.ToBinary();
}

Byml MakeS32Flag(std::uint32_t hash, std::int32_t initValue) {
    return Byml(Byml::Hash{
        {"DataName", Byml(fmt::format("Flag_{}", hash))},
        {"HashValue", Byml(static_cast<std::int32_t>(hash))},
        {"InitValue", Byml(initValue)},
        {"IsEventAssociated", Byml(false)},
        {"IsOneTrigger", Byml(false)},
        {"IsProgramReadable", Byml(true)},
        {"IsProgramWritable", Byml(true)},
        {"IsSave", Byml(true)},
        {"MaxValue", Byml(std::int32_t{100})},
        {"MinValue", Byml(std::int32_t{0})},
        {"ResetType", Byml(std::int32_t{0})},
    });
}

mm::content::GameData MakeS32Table(std::size_t count) {
    mm::content::GameData table("s32_data");
    for (std::size_t i = 1; i <= count; ++i) {
        const auto hash = static_cast<std::uint32_t>(i);
        table.Flags().Insert(hash, MakeS32Flag(hash, static_cast<std::int32_t>(i % 7)));
    }
    return table;
}

TempDirectory::TempDirectory(std::string_view name)
    : path(std::filesystem::temp_directory_path() / fmt::format("modmerge_{}", name)) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

void TempDirectory::WriteFile(const std::filesystem::path& relative, const std::vector<std::uint8_t>& data) const {
    const auto file = path / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream stream(file, std::ios::binary | std::ios::trunc);
    stream.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}
