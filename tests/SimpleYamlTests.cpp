#include <catch2/catch_test_macros.hpp>

#include <string>

#include <nlohmann/json.hpp>

#include "TestFixtures.hpp"
#include "mm/formats/Byml.hpp"
#include "mm/formats/BymlJson.hpp"
#include "mm/formats/SimpleYaml.hpp"

namespace SimpleYaml = mm::formats::SimpleYaml;

TEST_CASE("SimpleYaml reads nested mappings and lists", "[yaml]") {
    const std::string source =
        "name: Lynel  # trailing comment\n"
        "count: 3\n"
        "ratio: 0.25\n"
        "enabled: true\n"
        "nothing: ~\n"
        "label: \"a # not a comment\"\n"
        "coords: [1.0, -2, x]\n"
        "drops:\n"
        "  - Item_Meat\n"
        "  - name: Arrow\n"
        "    amount: 5\n"
        "tags:\n"
        "- Enemy\n"
        "nested:\n"
        "  inner:\n"
        "    value: 7\n";

    nlohmann::json out;
    std::string error;
    REQUIRE(SimpleYaml::Parse(source, out, error));
    REQUIRE(out["name"] == "Lynel");
    REQUIRE(out["count"] == 3);
    REQUIRE(out["ratio"] == 0.25);
    REQUIRE(out["enabled"] == true);
    REQUIRE(out["nothing"].is_null());
    REQUIRE(out["label"] == "a # not a comment");
    REQUIRE(out["coords"] == nlohmann::json::array({1.0, -2, "x"}));
    REQUIRE(out["drops"].size() == 2);
    REQUIRE(out["drops"][0] == "Item_Meat");
    REQUIRE(out["drops"][1]["name"] == "Arrow");
    REQUIRE(out["drops"][1]["amount"] == 5);
    REQUIRE(out["tags"] == nlohmann::json::array({"Enemy"}));
    REQUIRE(out["nested"]["inner"]["value"] == 7);
}

TEST_CASE("SimpleYaml maps width tags onto BYML node types", "[yaml][byml]") {
    nlohmann::json out;
    std::string error;
    REQUIRE(SimpleYaml::Parse("flag: !u 0x10\nbig: !ul 7\nwide: !l -1\nprecise: !f64 0.5\nplain: 2\n", out, error));

    const auto node = mm::formats::FromJson(out);
    REQUIRE(node.At("flag").GetType() == mm::formats::Byml::Type::UInt);
    REQUIRE(node.At("flag").AsUInt() == 16);
    REQUIRE(node.At("big").AsUInt64() == 7);
    REQUIRE(node.At("wide").AsInt64() == -1);
    REQUIRE(node.At("precise").AsDouble() == 0.5);
    REQUIRE(node.At("plain").AsInt() == 2);
}

TEST_CASE("SimpleYaml reports malformed documents with line numbers", "[yaml][errors]") {
    nlohmann::json out;
    std::string error;

    REQUIRE_FALSE(SimpleYaml::Parse("a:\n   b: 1\n", out, error));
    REQUIRE(error.find("Line 2") != std::string::npos);

    REQUIRE_FALSE(SimpleYaml::Parse("a: 1\n- stray\n", out, error));
    REQUIRE(error.find("list item") != std::string::npos);

    REQUIRE_FALSE(SimpleYaml::Parse("flag: !u -3\n", out, error));
    REQUIRE_FALSE(SimpleYaml::Parse("flag: !x 3\n", out, error));
    REQUIRE(error.find("unsupported tag") != std::string::npos);
}

TEST_CASE("SimpleYaml loads JSON and YAML files by extension", "[yaml][io]") {
    const TempDirectory dir("simple_yaml_files");
    dir.WriteFile("log.json", BytesOf(R"({"1": {"AreaNumber": 1}})"));
    dir.WriteFile("log.yml", BytesOf("1:\n  AreaNumber: 1\n"));

    nlohmann::json fromJson;
    nlohmann::json fromYaml;
    std::string error;
    REQUIRE(SimpleYaml::LoadStructuredFile(dir.path / "log.json", fromJson, error));
    REQUIRE(SimpleYaml::LoadStructuredFile(dir.path / "log.yml", fromYaml, error));
    REQUIRE(fromJson == fromYaml);

    REQUIRE_FALSE(SimpleYaml::LoadStructuredFile(dir.path / "absent.yml", fromYaml, error));
    REQUIRE(error.find("absent.yml") != std::string::npos);
}
