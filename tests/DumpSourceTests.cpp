#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "TestFixtures.hpp"
#include "mm/content/AreaData.hpp"
#include "mm/core/Error.hpp"
#include "mm/formats/Sarc.hpp"
#include "mm/formats/Yaz0.hpp"
#include "mm/merge/AreaDataLog.hpp"
#include "mm/merge/DumpSource.hpp"

using mm::core::Endian;
using mm::formats::Byml;
using mm::merge::DirectoryDump;
namespace yaz0 = mm::formats::yaz0;

namespace {

std::vector<std::uint8_t> AreaTable(Endian endian) {
    Byml::Array areas;
    areas.push_back(Byml(Byml::Hash{{"AreaNumber", Byml(std::int32_t{0})}, {"Climate", Byml("HyrulePlainClimate")}}));
    areas.push_back(Byml(Byml::Hash{{"AreaNumber", Byml(std::int32_t{1})}, {"Climate", Byml("DesertClimate")}}));
    return Byml(std::move(areas)).ToBinary(endian);
}

// Bootup.pack as shipped: compressed, with the area table as a compressed member.
std::vector<std::uint8_t> BootupPack(Endian endian) {
    return yaz0::Compress(MakeSarc({
        {"Ecosystem/AreaData.sbyml", yaz0::Compress(AreaTable(endian))},
        {"Actor/ActorInfo.product.sbyml", yaz0::Compress(BytesOf("not parsed here"))},
    }, endian));
}

} // namespace

TEST_CASE("Directory dumps read content and add-on files", "[dump]") {
    const TempDirectory dir("dump_files");
    dir.WriteFile("content/Pack/TitleBG.pack", BytesOf("title"));
    dir.WriteFile("aoc/Pack/AocMainField.pack", BytesOf("aoc"));

    const DirectoryDump dump(dir.path / "content", dir.path / "aoc");
    REQUIRE(dump.ReadFile("Pack/TitleBG.pack") == BytesOf("title"));
    REQUIRE(dump.ReadFile("Aoc/0010/Pack/AocMainField.pack") == BytesOf("aoc"));
    REQUIRE_FALSE(dump.ReadFile("Pack/Missing.pack").has_value());

    const DirectoryDump baseOnly(dir.path / "content");
    REQUIRE_FALSE(baseOnly.ReadFile("Aoc/0010/Pack/AocMainField.pack").has_value());
}

TEST_CASE("Dumps resolve members of compressed archives", "[dump][archive]") {
    const TempDirectory dir("dump_nested");
    dir.WriteFile("Pack/Bootup.pack", BootupPack(Endian::Little));
    const DirectoryDump dump(dir.path);

    const auto member = dump.Read("Pack/Bootup.pack//Ecosystem/AreaData.sbyml");
    REQUIRE(member.has_value());
    REQUIRE(yaz0::IsCompressed(*member));
    REQUIRE(yaz0::Decompress(*member) == AreaTable(Endian::Little));

    REQUIRE_FALSE(dump.Read("Pack/Bootup.pack//Ecosystem/Missing.sbyml").has_value());
    REQUIRE_FALSE(dump.Read("Pack/Bootup.pack//Actor/ActorInfo.product.sbyml//Inner.byml").has_value());

    REQUIRE(dump.GetFromSarc("Ecosystem/AreaData.byml", "Pack/Bootup.pack//Ecosystem/AreaData.sbyml") == *member);
    REQUIRE_THROWS_AS(dump.GetFromSarc("Ecosystem/Absent.byml", "Pack/Absent.pack//Absent.byml"),
                      mm::core::MissingResourceError);
}

TEST_CASE("Area data logs patch the area table", "[dump][areadata]") {
    const TempDirectory dir("dump_areadata");
    dir.WriteFile("Pack/Bootup.pack", BootupPack(Endian::Big));
    const DirectoryDump dump(dir.path);

    const auto log = nlohmann::json::parse(R"({
        "1": {"AreaNumber": 1, "Climate": "TropicalClimate"},
        "7": {"AreaNumber": 7, "Climate": "SnowClimate"}
    })");

    const auto patch = mm::merge::ApplyAreaDataLog(dump, log, Endian::Big);
    REQUIRE(patch.archivePath == "Pack/Bootup.pack");
    REQUIRE(patch.memberPath == "Ecosystem/AreaData.sbyml");
    REQUIRE(yaz0::IsCompressed(patch.data));

    const auto areas = mm::content::AreaData::FromBinary(yaz0::Decompress(patch.data));
    REQUIRE(areas.Areas().PresentCount() == 3);
    REQUIRE(areas.Areas().Get(0)->At("Climate").AsString() == "HyrulePlainClimate");
    REQUIRE(areas.Areas().Get(1)->At("Climate").AsString() == "TropicalClimate");
    REQUIRE(areas.Areas().Get(7)->At("Climate").AsString() == "SnowClimate");

    const auto bootup = *dump.ReadFile("Pack/Bootup.pack");
    const auto injected = mm::merge::InjectIntoSarc(bootup, patch.memberPath, patch.data);
    REQUIRE(yaz0::IsCompressed(injected));
    const auto sarc = mm::formats::Sarc::FromBinary(yaz0::Decompress(injected));
    REQUIRE(sarc.Size() == 2);
    REQUIRE(*sarc.GetFile("Ecosystem/AreaData.sbyml") == patch.data);
}

TEST_CASE("Malformed area data logs are rejected", "[dump][areadata][errors]") {
    const TempDirectory dir("dump_badlog");
    dir.WriteFile("Pack/Bootup.pack", BootupPack(Endian::Little));
    const DirectoryDump dump(dir.path);

    REQUIRE_THROWS_AS(mm::merge::ApplyAreaDataLog(dump, nlohmann::json::array(), Endian::Little),
                      mm::core::ParseError);
    try {
        (void)mm::merge::ApplyAreaDataLog(dump, nlohmann::json::parse(R"({"north": {}})"), Endian::Little);
        FAIL("expected a parse error");
    } catch (const mm::core::ParseError& e) {
        REQUIRE(e.resource() == "areadata log");
        REQUIRE(e.field() == "north");
    }
}

TEST_CASE("Area data logs load from YAML keyed by area number", "[dump][areadata][yaml]") {
    const TempDirectory dir("dump_areadata_yaml");
    dir.WriteFile("Pack/Bootup.pack", BootupPack(Endian::Little));
    dir.WriteFile("logs/areadata.yml", BytesOf(
        "# edited areas\n"
        "1:\n"
        "  AreaNumber: 1\n"
        "  Climate: TropicalClimate\n"
        "  Temperature: !f64 31.5\n"
        "9:\n"
        "  AreaNumber: 9\n"
        "  Climate: \"SnowClimate\"\n"));
    const DirectoryDump dump(dir.path);

    const auto patch = mm::merge::ApplyAreaDataLog(dump, dir.path / "logs" / "areadata.yml", Endian::Little);
    const auto areas = mm::content::AreaData::FromBinary(yaz0::Decompress(patch.data));
    REQUIRE(areas.Areas().PresentCount() == 3);
    REQUIRE(areas.Areas().Get(0)->At("Climate").AsString() == "HyrulePlainClimate");
    REQUIRE(areas.Areas().Get(1)->At("Climate").AsString() == "TropicalClimate");
    REQUIRE(areas.Areas().Get(1)->At("Temperature").AsDouble() == 31.5);
    REQUIRE(areas.Areas().Get(9)->At("AreaNumber").AsInt() == 9);
    REQUIRE(areas.Areas().Get(9)->At("Climate").AsString() == "SnowClimate");

    dir.WriteFile("logs/broken.yml", BytesOf("1:\n   AreaNumber: 1\n"));
    REQUIRE_THROWS_AS(mm::merge::ApplyAreaDataLog(dump, dir.path / "logs" / "broken.yml", Endian::Little),
                      mm::core::ParseError);
    REQUIRE_THROWS_AS(mm::merge::ApplyAreaDataLog(dump, dir.path / "logs" / "missing.yml", Endian::Little),
                      mm::core::ParseError);
}
