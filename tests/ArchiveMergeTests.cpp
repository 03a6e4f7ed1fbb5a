#include <catch2/catch_test_macros.hpp>

#include <string>

#include "TestFixtures.hpp"
#include "mm/content/ResourceRegistry.hpp"
#include "mm/core/Error.hpp"
#include "mm/formats/Sarc.hpp"
#include "mm/formats/Yaz0.hpp"
#include "mm/merge/ModMerger.hpp"
#include "mm/merge/ResourceLoader.hpp"

using mm::core::Endian;
using mm::formats::Byml;
using namespace mm::content;
using mm::merge::ResourceLoader;

namespace {

struct TitleBgFixture {
    std::vector<std::uint8_t> link = MakeActorLinkIO({{"ModelUser", "Lynel"}}, {"Enemy"}).ToBinary();
    std::vector<std::uint8_t> info = mm::formats::yaz0::Compress(
        ActorInfo::FromByml(MakeActorInfoDocument({{"Enemy_Lynel", "Enemy"}})).ToBinary(Endian::Little));
    std::vector<std::uint8_t> model = BytesOf("FRES opaque model data");

    std::vector<std::uint8_t> Archive() const {
        return MakeSarc({
            {"Actor/ActorLink/Enemy_Lynel.bxml", link},
            {"Actor/ActorInfo.product.sbyml", info},
            {"Model/Enemy_Lynel.bfres", model},
        });
    }
};

} // namespace

TEST_CASE("Loader expands archives into member keys", "[archive][loader]") {
    const ResourceRegistry registry;
    const ResourceLoader loader(registry);
    const TitleBgFixture fixture;

    ResourceTable table;
    const auto key = loader.Load(table, "content/Pack/TitleBG.pack", fixture.Archive());
    REQUIRE(key == "Pack/TitleBG.pack");

    const auto* sarc = table.at(key).AsSarc();
    REQUIRE(sarc != nullptr);
    REQUIRE(sarc->Entries().PresentCount() == 3);
    REQUIRE(*sarc->Entries().Get("Actor/ActorInfo.product.sbyml") ==
            "Pack/TitleBG.pack//Actor/ActorInfo.product.byml");

    REQUIRE(table.at("Pack/TitleBG.pack//Actor/ActorLink/Enemy_Lynel.bxml").KindName() == "ActorLink");
    REQUIRE(table.at("Pack/TitleBG.pack//Actor/ActorInfo.product.byml").KindName() == "ActorInfo");
    REQUIRE(table.at("Pack/TitleBG.pack//Model/Enemy_Lynel.bfres").AsBinary() != nullptr);
}

TEST_CASE("Unchanged archives serialize byte for byte", "[archive][passthrough]") {
    const ResourceRegistry registry;
    const ResourceLoader loader(registry);
    const TitleBgFixture fixture;
    const auto archive = fixture.Archive();

    ResourceTable table;
    const auto key = loader.Load(table, "Pack/TitleBG.pack", archive);

    SerializeContext context;
    const auto rebuilt = table.at(key).ToBinary(Endian::Little, table, context, false, key);
    REQUIRE(rebuilt == archive);

    const auto members = mm::formats::Sarc::FromBinary(rebuilt).Files();
    REQUIRE(members.at("Actor/ActorInfo.product.sbyml") == fixture.info);
    REQUIRE(members.at("Model/Enemy_Lynel.bfres") == fixture.model);
    REQUIRE(context.skippedEntries.empty());
}

TEST_CASE("A merged archive keeps untouched members and re-encodes edited ones", "[archive][merge][output]") {
    const ResourceRegistry registry;
    const ResourceLoader loader(registry);
    const TitleBgFixture fixture;

    const auto moddedInfo = ActorInfo::FromByml(
        MakeActorInfoDocument({{"Enemy_Lynel", "Enemy"}, {"Enemy_Lynel_Gold", "Enemy"}}));
    const auto moddedInfoBytes = mm::formats::yaz0::Compress(moddedInfo.ToBinary(Endian::Little));

    ResourceTable base;
    loader.Load(base, "Pack/TitleBG.pack", fixture.Archive());
    ResourceTable modded;
    loader.Load(modded, "Pack/TitleBG.pack", MakeSarc({
                                                  {"Actor/ActorLink/Enemy_Lynel.bxml", fixture.link},
                                                  {"Actor/ActorInfo.product.sbyml", moddedInfoBytes},
                                                  {"Model/Enemy_Lynel.bfres", fixture.model},
                                              }));

    mm::merge::MergerOptions options;
    options.workerThreads = 2;
    const mm::merge::ModMerger merger(options);
    const auto diff = merger.Diff(base, modded);
    REQUIRE(diff.size() == 1);
    REQUIRE(diff.contains("Pack/TitleBG.pack//Actor/ActorInfo.product.byml"));

    const auto merged = merger.Merge(base, {diff});
    REQUIRE_FALSE(merged.at("Pack/TitleBG.pack//Actor/ActorInfo.product.byml").Source().has_value());
    REQUIRE(merged.at("Pack/TitleBG.pack//Actor/ActorLink/Enemy_Lynel.bxml").Source().has_value());

    mm::merge::Manifest manifest;
    manifest.contentFiles.insert("Pack/TitleBG.pack");
    const auto outputs = merger.RenderOutputs(merged, manifest, Endian::Little);
    REQUIRE(outputs.skippedEntries.empty());

    const auto& archive = outputs.content.at("Pack/TitleBG.pack");
    REQUIRE_FALSE(mm::formats::yaz0::IsCompressed(archive));
    const auto files = mm::formats::Sarc::FromBinary(archive).Files();
    REQUIRE(files.size() == 3);

    // Opaque and unchanged typed members come out as the base bytes.
    REQUIRE(files.at("Model/Enemy_Lynel.bfres") == fixture.model);
    REQUIRE(files.at("Actor/ActorLink/Enemy_Lynel.bxml") == fixture.link);

    const auto& info = files.at("Actor/ActorInfo.product.sbyml");
    REQUIRE(mm::formats::yaz0::IsCompressed(info));
    REQUIRE(ActorInfo::FromBinary(mm::formats::yaz0::Decompress(info)) == moddedInfo);
    REQUIRE(info != fixture.info);
}

TEST_CASE("Archive member deletions propagate through diff and merge", "[archive][merge]") {
    const ResourceRegistry registry;
    const ResourceLoader loader(registry);
    const TitleBgFixture fixture;

    ResourceTable base;
    loader.Load(base, "Pack/TitleBG.pack", fixture.Archive());
    ResourceTable modded;
    loader.Load(modded, "Pack/TitleBG.pack", MakeSarc({
                                                  {"Actor/ActorLink/Enemy_Lynel.bxml", fixture.link},
                                                  {"Actor/ActorInfo.product.sbyml", fixture.info},
                                              }));

    const auto& baseMap = base.at("Pack/TitleBG.pack");
    const auto diff = baseMap.Diff(modded.at("Pack/TitleBG.pack"));
    REQUIRE(diff.AsSarc()->Entries().State("Model/Enemy_Lynel.bfres") == mm::collections::EntryState::Deleted);

    const auto merged = baseMap.Merge(diff);
    REQUIRE_FALSE(merged.AsSarc()->Entries().Contains("Model/Enemy_Lynel.bfres"));

    SerializeContext context;
    const auto files = mm::formats::Sarc::FromBinary(merged.ToBinary(Endian::Little, base, context)).Files();
    REQUIRE(files.size() == 2);
    REQUIRE_FALSE(files.contains("Model/Enemy_Lynel.bfres"));
}

TEST_CASE("Dangling archive entries follow the missing resource policy", "[archive][errors]") {
    SarcMap sarc;
    sarc.Entries().Insert("Actor/ActorLink/Ghost.bxml", "Pack/Test.pack//Actor/ActorLink/Ghost.bxml");
    sarc.Entries().Insert("Model/Present.bfres", "Pack/Test.pack//Model/Present.bfres");

    ResourceTable table;
    table.insert_or_assign("Pack/Test.pack//Model/Present.bfres",
                           ResourceData(BinaryResource(BinaryResource::Agnostic{BytesOf("model")})));

    SECTION("fail") {
        SerializeContext context;
        try {
            (void)sarc.ToBinary(Endian::Little, table, context, "Pack/Test.pack");
            FAIL("expected a missing resource error");
        } catch (const mm::core::MissingResourceError& e) {
            REQUIRE(e.entry() == "Actor/ActorLink/Ghost.bxml");
            REQUIRE(e.canonicalKey() == "Pack/Test.pack//Actor/ActorLink/Ghost.bxml");
        }
    }

    SECTION("skip") {
        SerializeContext context{MissingResourcePolicy::Skip, {}};
        const auto files = mm::formats::Sarc::FromBinary(sarc.ToBinary(Endian::Little, table, context)).Files();
        REQUIRE(files.size() == 1);
        REQUIRE(files.contains("Model/Present.bfres"));
        REQUIRE(context.skippedEntries == std::vector<std::string>{"Pack/Test.pack//Actor/ActorLink/Ghost.bxml"});
    }
}

TEST_CASE("Source bytes are reused only when the byte order matches", "[archive][source]") {
    const ResourceRegistry registry;
    const ResourceTable empty;
    SerializeContext context;

    // Parameter archives are little endian on both platforms.
    const auto linkBytes = MakeActorLinkIO({{"ModelUser", "Lynel"}}, {}).ToBinary();
    const auto link = registry.IdentifyAndParse("Actor/ActorLink/Enemy_Lynel.bxml", linkBytes);
    REQUIRE(link.ToBinary(Endian::Big, empty, context) == linkBytes);
    REQUIRE(mm::formats::yaz0::Decompress(link.ToBinary(Endian::Big, empty, context, true)) == linkBytes);

    const auto info = ActorInfo::FromByml(MakeActorInfoDocument({{"Enemy_Lynel", "Enemy"}}));
    const auto loaded = registry.IdentifyAndParse("Actor/ActorInfo.product.byml", info.ToBinary(Endian::Little));
    REQUIRE(loaded.ToBinary(Endian::Little, empty, context) == info.ToBinary(Endian::Little));
    REQUIRE(loaded.ToBinary(Endian::Big, empty, context) == info.ToBinary(Endian::Big));

    // Merge results carry no source.
    const auto merged = loaded.Merge(loaded.Diff(loaded));
    REQUIRE_FALSE(merged.Source().has_value());
    REQUIRE(merged == loaded);
}

TEST_CASE("Platform binaries need the requested variant", "[archive][binary]") {
    const auto wiiu = BinaryResource::ForPlatform(Endian::Big, BytesOf("BY big"));
    REQUIRE(wiiu.ToBinary(Endian::Big) == BytesOf("BY big"));
    REQUIRE_THROWS_AS(wiiu.ToBinary(Endian::Little, "Quest/QuestProduct.byml"), mm::core::MissingResourceError);

    const auto nx = BinaryResource::ForPlatform(Endian::Little, BytesOf("YB little"));
    const auto merged = wiiu.Merge(wiiu.Diff(nx));
    REQUIRE(merged.ToBinary(Endian::Little) == BytesOf("YB little"));
    REQUIRE(merged.ToBinary(Endian::Big) == BytesOf("BY big"));

    const BinaryResource agnostic(BinaryResource::Agnostic{BytesOf("raw")});
    REQUIRE_THROWS_AS(agnostic.Diff(nx), mm::core::SchemaMismatchError);
}
