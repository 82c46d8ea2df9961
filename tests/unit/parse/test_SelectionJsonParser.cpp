#include <doctest/doctest.h>

#include <iconvault/parse/SelectionJsonParser.hpp>

#include <string>

using namespace IV;

namespace {

constexpr char const* kHomeSelection = R"json({
  "icons": [
    {"properties": {"name": "home,house"}, "icon": {"paths": ["M0 0"], "width": 1024}}
  ],
  "height": 1024
})json";

constexpr char const* kRichSelection = R"json({
  "preferences": {"fontPref": {"prefix": "ico-"}},
  "height": 960,
  "icons": [
    {"properties": {"name": " arrow , chevron, ,next ", "code": 59648},
     "icon": {"tags": ["nav", 7, "direction"], "paths": ["M1 1", "M2 2"], "width": 1200,
              "attrs": [{"fill": "#000", "opacity": 0.5}, {}]}},
    {"properties": {"name": ""}, "icon": {"paths": ["M3 3"]}},
    {"properties": {"code": 1}, "icon": {"paths": ["M4 4"]}},
    {"properties": {"name": "star", "code": -3}},
    {"properties": {"name": "arrow"}, "icon": {"paths": ["M9 9"]}}
  ]
})json";

} // namespace

TEST_SUITE("parse.selection_json") {

TEST_CASE("Names split into primary and aliases under the default prefix") {
    auto catalog = Parse::ParseSelectionJson(kHomeSelection);
    REQUIRE(catalog);
    REQUIRE(catalog->size() == 1);
    auto const& icon = catalog->front();
    CHECK(icon.name == "home");
    CHECK(icon.css_class == "icon-home");
    REQUIRE(icon.aliases.size() == 1);
    CHECK(icon.aliases.front() == "house");
    CHECK_FALSE(icon.unicode.has_value());
    CHECK(icon.tags.empty());
}

TEST_CASE("Prefix, unicode, tags and skipped entries") {
    auto catalog = Parse::ParseSelectionJson(kRichSelection);
    REQUIRE(catalog);
    // Empty name and missing name are skipped; duplicates are preserved.
    REQUIRE(catalog->size() == 3);

    auto const& arrow = (*catalog)[0];
    CHECK(arrow.name == "arrow");
    CHECK(arrow.css_class == "ico-arrow");
    CHECK(arrow.aliases == std::vector<std::string>{"chevron", "next"});
    REQUIRE(arrow.unicode.has_value());
    CHECK(*arrow.unicode == "e900");
    CHECK(arrow.tags == std::vector<std::string>{"nav", "direction"});

    auto const& star = (*catalog)[1];
    CHECK(star.name == "star");
    CHECK_FALSE(star.unicode.has_value());

    CHECK((*catalog)[2].name == "arrow");
}

TEST_CASE("Parsing is pure and idempotent") {
    auto first  = Parse::ParseSelectionJson(kRichSelection);
    auto second = Parse::ParseSelectionJson(kRichSelection);
    REQUIRE(first);
    REQUIRE(second);
    CHECK(*first == *second);
}

TEST_CASE("Missing or non-array icons yields an empty catalog") {
    auto missing = Parse::ParseSelectionJson(R"({"height": 16})");
    REQUIRE(missing);
    CHECK(missing->empty());

    auto wrongType = Parse::ParseSelectionJson(R"({"icons": {"a": 1}})");
    REQUIRE(wrongType);
    CHECK(wrongType->empty());
}

TEST_CASE("Malformed documents are rejected") {
    for (char const* bad : {"{\"icons\": [", "[1, 2, 3]", "\"text\"", "", "{} trailing"}) {
        CAPTURE(bad);
        auto result = Parse::ParseSelectionJson(bad);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == Error::Code::MalformedJson);
    }
}

TEST_CASE("Path specs keep first-seen order and replace duplicates") {
    auto specs = Parse::ExtractPathSpecs(kRichSelection);
    REQUIRE(specs);
    REQUIRE(specs->size() == 1);

    auto const* arrow = specs->find("arrow");
    REQUIRE(arrow != nullptr);
    // The later "arrow" entry replaces the first one.
    CHECK(arrow->paths == std::vector<std::string>{"M9 9"});
    CHECK(arrow->width == doctest::Approx(960.0));
    CHECK(arrow->grid == doctest::Approx(960.0));
    CHECK(arrow->attrs.empty());
}

TEST_CASE("Path specs carry width and per-path attributes") {
    auto specs = Parse::ExtractPathSpecs(R"json({
      "icons": [
        {"properties": {"name": "dot"},
         "icon": {"paths": ["M0 0", 5, "M1 1"], "width": 512.5,
                  "attrs": [{"fill": "red", "stroke-width": 2}, "ignored"]}}
      ]
    })json");
    REQUIRE(specs);
    auto const* dot = specs->find("dot");
    REQUIRE(dot != nullptr);
    CHECK(dot->paths == std::vector<std::string>{"M0 0", "M1 1"});
    CHECK(dot->width == doctest::Approx(512.5));
    CHECK(dot->grid == doctest::Approx(1024.0));
    REQUIRE(dot->attrs.size() == 2);
    CHECK(dot->attrs[0] == PathAttributes{{"fill", "red"}, {"stroke-width", "2"}});
    CHECK(dot->attrs[1].empty());
}

TEST_CASE("Combined parse returns catalog and paths from one decode") {
    auto selection = Parse::ParseSelection(kHomeSelection);
    REQUIRE(selection);
    CHECK(selection->catalog.size() == 1);
    REQUIRE(selection->paths.find("home") != nullptr);
    CHECK(selection->paths.find("house") == nullptr);
}

} // TEST_SUITE
