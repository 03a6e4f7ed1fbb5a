#include <catch2/catch_test_macros.hpp>

#include <string>

#include "TestFixtures.hpp"
#include "mm/content/ResourceRegistry.hpp"
#include "mm/core/Error.hpp"
#include "mm/formats/Yaz0.hpp"

using mm::core::Endian;
using mm::formats::Byml;
using namespace mm::content;

TEST_CASE("Registry matches schemas by canonical path", "[registry]") {
    const ResourceRegistry registry;
    REQUIRE(registry.MatchSchema("Actor/ActorLink/Enemy_Lynel.bxml") == "ActorLink");
    REQUIRE(registry.MatchSchema("Actor/AttClientList/Lynel.batcllist") == "AttClientList");
    REQUIRE(registry.MatchSchema("Actor/DropTable/Lynel.bdrop") == "DropTable");
    REQUIRE(registry.MatchSchema("Actor/GeneralParamList/Lynel.bgparamlist") == "GeneralParamList");
    REQUIRE(registry.MatchSchema("Actor/ActorInfo.product.byml") == "ActorInfo");
    REQUIRE(registry.MatchSchema("Ecosystem/AreaData.byml") == "AreaData");
    REQUIRE(registry.MatchSchema("Actor/ResidentActors.byml") == "ResidentActors");
    REQUIRE(registry.MatchSchema("Map/MainField/Static.mubin") == "MainFieldStatic");
    REQUIRE(registry.MatchSchema("Pack/Bootup.pack//GameData/gamedata.sarc") == "GameDataPack");
    REQUIRE_FALSE(registry.MatchSchema("Model/Enemy_Lynel.bfres").has_value());
}

TEST_CASE("Registry strips Yaz0 and keeps the source bytes", "[registry]") {
    const ResourceRegistry registry;
    const auto info = ActorInfo::FromByml(MakeActorInfoDocument({{"Enemy_Lynel", "Enemy"}}));
    const auto compressed = mm::formats::yaz0::Compress(info.ToBinary(Endian::Big));

    const auto data = registry.IdentifyAndParse("content/Actor/ActorInfo.product.sbyml", compressed);
    REQUIRE(data.KindName() == "ActorInfo");
    REQUIRE(data.AsMergeable()->As<ActorInfo>() != nullptr);
    REQUIRE(*data.AsMergeable()->As<ActorInfo>() == info);

    REQUIRE(data.Source().has_value());
    REQUIRE(data.Source()->compressed);
    REQUIRE(data.Source()->endian == Endian::Big);
    REQUIRE(data.Source()->data == compressed);
}

TEST_CASE("Registry falls back on magic for unmatched paths", "[registry]") {
    mm::formats::aamp::ParameterIO pio;
    pio.root.objects.insert_or_assign("Main", mm::formats::aamp::ParameterObject{}.Set(
                                                  "Value", mm::formats::aamp::Parameter::Int(1)));
    const auto aamp = pio.ToBinary();
    const auto byml = Byml(Byml::Hash{{"Key", Byml(std::int32_t{1})}}).ToBinary(Endian::Big);

    SECTION("opaque by default") {
        const ResourceRegistry registry;
        const auto params = registry.IdentifyAndParse("Actor/AIProgram/Lynel.baiprog", aamp);
        REQUIRE(params.AsBinary() != nullptr);
        REQUIRE(params.AsBinary()->IsAgnostic());

        const auto document = registry.IdentifyAndParse("Quest/QuestProduct.byml", byml);
        REQUIRE(document.AsBinary() != nullptr);
        REQUIRE_FALSE(document.AsBinary()->IsAgnostic());
        REQUIRE(document.AsBinary()->ToBinary(Endian::Big) == byml);
        REQUIRE_THROWS_AS(document.AsBinary()->ToBinary(Endian::Little), mm::core::MissingResourceError);
    }

    SECTION("typed when generic merging is enabled") {
        const ResourceRegistry registry(RegistryOptions{true});
        REQUIRE(registry.IdentifyAndParse("Actor/AIProgram/Lynel.baiprog", aamp).KindName() == "GenericParameters");
        REQUIRE(registry.IdentifyAndParse("Quest/QuestProduct.byml", byml).KindName() == "GenericDocument");
    }
}

TEST_CASE("Registry reports unsupported and malformed data", "[registry][errors]") {
    const ResourceRegistry registry;
    REQUIRE_THROWS_AS(registry.IdentifyAndParse("Model/Enemy_Lynel.bfres", BytesOf("FRES data")),
                      mm::core::UnsupportedFormatError);

    mm::formats::aamp::ParameterIO missingTarget;
    missingTarget.root.objects.insert_or_assign("Other", mm::formats::aamp::ParameterObject{});
    try {
        (void)registry.IdentifyAndParse("Actor/ActorLink/Broken.bxml", missingTarget.ToBinary());
        FAIL("expected a parse error");
    } catch (const mm::core::ParseError& e) {
        REQUIRE(e.resource() == "Actor/ActorLink/Broken.bxml");
        REQUIRE(e.field() == "LinkTarget");
        REQUIRE(e.kind() == mm::core::ParseErrorKind::MissingField);
    }
}
