#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "TestFixtures.hpp"
#include "mm/core/Error.hpp"
#include "mm/formats/Sarc.hpp"
#include "mm/formats/Yaz0.hpp"

using mm::core::Endian;
using mm::formats::Sarc;

namespace {

std::uint32_t ReadU32(const std::vector<std::uint8_t>& data, std::size_t offset, Endian endian) {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        const std::size_t index = endian == Endian::Big ? offset + i : offset + 3 - i;
        value = (value << 8) | data[index];
    }
    return value;
}

} // namespace

TEST_CASE("SARC round-trips members in both byte orders", "[sarc]") {
    const std::map<std::string, std::vector<std::uint8_t>> files{
        {"Actor/ActorLink/Enemy_Lynel.bxml", BytesOf("link data")},
        {"Actor/Physics/Lynel.bphysics", BytesOf("physics")},
        {"Empty.txt", {}},
    };

    for (const auto endian : {Endian::Little, Endian::Big}) {
        const auto bytes = MakeSarc(files, endian);
        REQUIRE(Sarc::IsSarc(bytes));

        const auto parsed = Sarc::FromBinary(bytes);
        REQUIRE(parsed.GetEndian() == endian);
        REQUIRE(parsed.Files() == files);
        REQUIRE(parsed.ToBinary() == bytes);
    }
}

TEST_CASE("SARC lookup, add and remove", "[sarc]") {
    Sarc sarc(Endian::Little);
    sarc.AddFile("a.txt", BytesOf("A"));
    sarc.AddFile("b.txt", BytesOf("B"));
    REQUIRE(sarc.Size() == 2);
    REQUIRE(*sarc.GetFile("a.txt") == BytesOf("A"));
    REQUIRE(sarc.GetFile("missing") == nullptr);
    REQUIRE(sarc.RemoveFile("a.txt"));
    REQUIRE_FALSE(sarc.RemoveFile("a.txt"));
    REQUIRE(sarc.Size() == 1);
}

TEST_CASE("SARC aligns nested archives and compressed members", "[sarc]") {
    const auto inner = MakeSarc({{"inner.txt", BytesOf("inner")}});
    const auto outer = MakeSarc({{"Pack/Inner.pack", inner}, {"a.txt", BytesOf("a")}});
    REQUIRE(ReadU32(outer, 0x0C, Endian::Little) % 0x2000 == 0);

    const auto compressed = mm::formats::yaz0::Compress(BytesOf("compressed member"));
    const auto withYaz0 = MakeSarc({{"Actor/X.sbxml", compressed}});
    REQUIRE(ReadU32(withYaz0, 0x0C, Endian::Little) % 0x80 == 0);

    const auto nested = Sarc::FromBinary(outer);
    REQUIRE(*nested.GetFile("Pack/Inner.pack") == inner);
}

TEST_CASE("SARC name hashes follow the multiplier key", "[sarc]") {
    REQUIRE(Sarc::HashName("") == 0);
    REQUIRE(Sarc::HashName("a") == static_cast<std::uint32_t>('a'));
    REQUIRE(Sarc::HashName("ab") == static_cast<std::uint32_t>('a') * 0x65 + static_cast<std::uint32_t>('b'));
}

TEST_CASE("SARC rejects data without the archive magic", "[sarc][errors]") {
    const auto bytes = BytesOf("BYML is not an archive at all, sorry");
    REQUIRE_FALSE(Sarc::IsSarc(bytes));
    REQUIRE_THROWS_AS(Sarc::FromBinary(bytes), mm::core::ParseError);
}
