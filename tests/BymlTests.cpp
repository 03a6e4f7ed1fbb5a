#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "TestFixtures.hpp"
#include "mm/core/Error.hpp"
#include "mm/formats/Byml.hpp"
#include "mm/formats/BymlJson.hpp"

using mm::core::Endian;
using mm::formats::Byml;

namespace {

Byml MakeMixedDocument() {
    return Byml(Byml::Hash{
        {"bool", Byml(true)},
        {"int", Byml(std::int32_t{-12})},
        {"uint", Byml(std::uint32_t{0xDEADBEEF})},
        {"float", Byml(1.5f)},
        {"int64", Byml(std::int64_t{-5000000000})},
        {"uint64", Byml(std::uint64_t{0xFFFFFFFFFFull})},
        {"double", Byml(0.25)},
        {"string", Byml("Enemy_Lynel_Dark")},
        {"binary", Byml(Byml::Binary{0x00, 0x01, 0xFE})},
        {"null", Byml()},
        {"array", Byml(Byml::Array{Byml(std::int32_t{1}), Byml("two"), Byml(Byml::Hash{{"x", Byml(3.0f)}})})},
        {"nested", Byml(Byml::Hash{{"empty", Byml(Byml::Array{})}, {"name", Byml("Enemy_Lynel_Dark")}})},
    });
}

} // namespace

TEST_CASE("BYML round-trips every node type in both byte orders", "[byml]") {
    const auto document = MakeMixedDocument();

    for (const auto endian : {Endian::Little, Endian::Big}) {
        const auto bytes = document.ToBinary(endian);
        REQUIRE(Byml::IsByml(bytes));
        REQUIRE(Byml::DetectEndian(bytes) == endian);

        const auto parsed = Byml::FromBinary(bytes);
        REQUIRE(parsed == document);
        REQUIRE(parsed.ToBinary(endian) == bytes);
    }
}

TEST_CASE("BYML writes the requested version", "[byml]") {
    const Byml document(Byml::Hash{{"a", Byml(std::int32_t{1})}});
    const auto v3 = document.ToBinary(Endian::Little, 3);
    REQUIRE(v3[2] == 3);
    REQUIRE(Byml::FromBinary(v3) == document);
    REQUIRE_THROWS_AS(document.ToBinary(Endian::Little, 7), mm::core::Error);
}

TEST_CASE("BYML accessors report type mismatches and missing keys", "[byml][errors]") {
    const auto document = MakeMixedDocument();
    REQUIRE(document.At("int").AsInt() == -12);
    REQUIRE(document.At("uint").AsInteger() == 0xDEADBEEF);
    REQUIRE(document.Find("missing") == nullptr);
    REQUIRE_THROWS_AS(document.At("missing"), mm::core::ParseError);
    REQUIRE_THROWS_AS(document.At("string").AsInt(), mm::core::ParseError);

    try {
        (void)document.At("bool").AsString();
        FAIL("expected a type mismatch");
    } catch (const mm::core::ParseError& e) {
        REQUIRE(e.kind() == mm::core::ParseErrorKind::TypeMismatch);
    }
}

TEST_CASE("BYML rejects malformed input", "[byml][errors]") {
    REQUIRE_FALSE(Byml::IsByml(BytesOf("AAMP")));
    REQUIRE_THROWS_AS(Byml::FromBinary(BytesOf("XYZW\x02")), mm::core::ParseError);

    auto truncated = Byml(Byml::Hash{{"key", Byml("value")}}).ToBinary(Endian::Big);
    truncated.resize(truncated.size() - 6);
    REQUIRE_THROWS_AS(Byml::FromBinary(truncated), mm::core::ParseError);
}

TEST_CASE("BYML JSON conversion keeps numeric widths", "[byml][json]") {
    const auto document = MakeMixedDocument();
    const auto json = mm::formats::ToJson(document);

    REQUIRE(json["int"] == -12);
    REQUIRE(json["uint"]["@u32"] == 0xDEADBEEFu);
    REQUIRE(json["binary"]["@binary"] == "0001fe");
    REQUIRE(json["null"].is_null());

    REQUIRE(mm::formats::FromJson(json) == document);

    const auto parsed = mm::formats::FromJson(nlohmann::json::parse(R"({"big": 3000000000, "small": 7})"));
    REQUIRE(parsed.At("small").GetType() == Byml::Type::Int);
    REQUIRE(parsed.At("big").GetType() == Byml::Type::UInt);
}

TEST_CASE("BYML JSON rejects malformed tags", "[byml][json][errors]") {
    REQUIRE_THROWS_AS(mm::formats::FromJson(nlohmann::json::parse(R"({"@u32": -1})")), mm::core::ParseError);
    REQUIRE_THROWS_AS(mm::formats::FromJson(nlohmann::json::parse(R"({"@binary": "abc"})")), mm::core::ParseError);
}
