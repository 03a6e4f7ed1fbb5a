#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

#include "TestFixtures.hpp"
#include "mm/merge/Manifest.hpp"

using mm::merge::Manifest;

TEST_CASE("Manifest maps disk paths to resource keys", "[manifest]") {
    Manifest manifest;
    manifest.contentFiles = {"Actor/Pack/Enemy_Lynel.sbactorpack", "Pack/TitleBG.pack"};
    manifest.aocFiles = {"Map/MainField/Static.smubin"};

    auto resources = manifest.Resources();
    std::sort(resources.begin(), resources.end());
    REQUIRE(resources == std::vector<std::string>{
                             "Actor/Pack/Enemy_Lynel.bactorpack",
                             "Aoc/0010/Map/MainField/Static.mubin",
                             "Pack/TitleBG.pack",
                         });
    REQUIRE(Manifest::CanonicalKey("content\\Quest\\QuestProduct.sbyml", false) == "Quest/QuestProduct.byml");
}

TEST_CASE("Manifests extend as sets and clear", "[manifest]") {
    Manifest first;
    first.contentFiles = {"Pack/TitleBG.pack"};
    Manifest second;
    second.contentFiles = {"Pack/TitleBG.pack", "Pack/Bootup.pack"};
    second.aocFiles = {"Pack/AocMainField.pack"};

    first.Extend(second);
    REQUIRE(first.contentFiles.size() == 2);
    REQUIRE(first.aocFiles.size() == 1);
    REQUIRE_FALSE(first.IsEmpty());

    first.Clear();
    REQUIRE(first.IsEmpty());
}

TEST_CASE("Manifest JSON round trips through a file", "[manifest][io]") {
    const TempDirectory dir("manifest");
    Manifest manifest;
    manifest.contentFiles = {"Pack/Bootup.pack", "Actor/ActorInfo.product.sbyml"};
    manifest.aocFiles = {"Pack/AocMainField.pack"};

    const auto path = dir.path / "mod" / "manifest.json";
    const auto saved = mm::merge::SaveManifest(manifest, path);
    REQUIRE(saved.success);

    const auto loaded = mm::merge::LoadManifest(path);
    REQUIRE(loaded.success);
    REQUIRE(loaded.warnings.empty());
    REQUIRE(loaded.manifest == manifest);
}

TEST_CASE("Manifest parsing reports bad entries", "[manifest][errors]") {
    SECTION("invalid entries are skipped with warnings") {
        const auto result = mm::merge::ParseManifest(R"({"content": ["Pack/Bootup.pack", 4, ""]})");
        REQUIRE(result.success);
        REQUIRE(result.warnings.size() == 2);
        REQUIRE(result.manifest.contentFiles == std::set<std::string>{"Pack/Bootup.pack"});
        REQUIRE(result.manifest.aocFiles.empty());
    }

    SECTION("a section that is not an array is an error") {
        const auto result = mm::merge::ParseManifest(R"({"content": "Pack/Bootup.pack"})");
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errors.size() == 1);
    }

    SECTION("malformed JSON is an error") {
        REQUIRE_FALSE(mm::merge::ParseManifest("{\"content\": [").success);
        REQUIRE_FALSE(mm::merge::ParseManifest("[]").success);
    }

    SECTION("a missing file is an error") {
        const TempDirectory dir("manifest_missing");
        REQUIRE_FALSE(mm::merge::LoadManifest(dir.path / "absent.json").success);
    }
}
