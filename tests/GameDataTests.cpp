#include <catch2/catch_test_macros.hpp>

#include <string>

#include "TestFixtures.hpp"
#include "mm/content/GameData.hpp"
#include "mm/core/Error.hpp"
#include "mm/formats/Sarc.hpp"

using mm::core::Endian;
using mm::formats::Byml;
using mm::content::GameData;
using mm::content::GameDataPack;

TEST_CASE("Game data shards hold at most 4096 flags", "[gamedata][shards]") {
    REQUIRE(MakeS32Table(0).Divide().empty());

    const auto full = MakeS32Table(4096).Divide();
    REQUIRE(full.size() == 1);
    REQUIRE(full[0].Flags().Size() == 4096);

    const auto overflow = MakeS32Table(4097).Divide();
    REQUIRE(overflow.size() == 2);
    REQUIRE(overflow[0].Flags().Size() == 4096);
    REQUIRE(overflow[1].Flags().Size() == 1);
    REQUIRE(overflow[1].Flags().Contains(4097));
    REQUIRE(overflow[1].DataType() == "s32_data");
}

TEST_CASE("Game data shards rejoin into the logical table", "[gamedata][shards]") {
    for (const std::size_t count : {std::size_t{0}, std::size_t{4096}, std::size_t{4097}}) {
        GameDataPack pack;
        pack.Table("s32_data") = MakeS32Table(count);

        const auto bytes = pack.ToBinary(Endian::Little);
        const auto sarc = mm::formats::Sarc::FromBinary(bytes);
        const std::size_t shards = (count + GameData::kShardCapacity - 1) / GameData::kShardCapacity;
        REQUIRE(sarc.Size() == shards);
        if (shards > 0) {
            REQUIRE(sarc.GetFile("/s32_data_0.bgdata") != nullptr);
        }
        if (shards > 1) {
            REQUIRE(sarc.GetFile("/s32_data_1.bgdata") != nullptr);
        }

        const auto parsed = GameDataPack::FromBinary(bytes);
        REQUIRE(parsed == pack);
        REQUIRE(parsed.Table("s32_data").Flags().Size() == count);
    }
}

TEST_CASE("Game data tables map shard prefixes onto data types", "[gamedata]") {
    GameDataPack pack;
    REQUIRE(pack.Table("string32_data").DataType() == "string_data");
    REQUIRE(pack.Table("revival_bool_data").DataType() == "bool_data");
    REQUIRE(pack.Table("bool_array_data").DataType() == "bool_array_data");
    REQUIRE(GameDataPack::TableNames().size() == 18);
    REQUIRE_THROWS_AS(pack.Table("not_a_table"), mm::core::Error);

    const auto shard = GameData::FromByml(MakeS32Table(3).ToByml());
    const auto bytes = MakeSarc({
        {"/s32_data_0.bgdata", shard.ToByml().ToBinary(Endian::Big)},
        {"/readme.txt", BytesOf("ignored")},
    }, Endian::Big);
    const auto parsed = GameDataPack::FromBinary(bytes);
    REQUIRE(parsed.Table("s32_data").Flags().Size() == 3);
}

TEST_CASE("Game data diff and merge work on flags by hash", "[gamedata][merge]") {
    const auto base = MakeS32Table(10);

    auto modified = base;
    modified.Flags().Insert(3, MakeS32Flag(3, 99));
    modified.Flags().Remove(4);
    modified.Flags().Insert(5000, MakeS32Flag(5000, 1));

    const auto diff = base.Diff(modified);
    REQUIRE(diff.Flags().PresentCount() == 2);
    REQUIRE(diff.Flags().State(4) == mm::collections::EntryState::Deleted);
    REQUIRE(base.Merge(diff) == modified);
}

TEST_CASE("Game data of different types cannot be combined", "[gamedata][errors]") {
    const auto s32 = MakeS32Table(1);
    const GameData flags("bool_data");
    REQUIRE_THROWS_AS(s32.Diff(flags), mm::core::SchemaMismatchError);
    REQUIRE_THROWS_AS(flags.Merge(s32), mm::core::SchemaMismatchError);

    const auto bytes = MakeSarc({{"/bool_data_0.bgdata", MakeS32Table(2).ToByml().ToBinary(Endian::Little)}});
    REQUIRE_THROWS_AS(GameDataPack::FromBinary(bytes), mm::core::SchemaMismatchError);
}
