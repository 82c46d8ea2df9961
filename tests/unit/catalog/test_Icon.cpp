#include <doctest/doctest.h>

#include <iconvault/catalog/Icon.hpp>

#include <nlohmann/json.hpp>

using namespace IV;

TEST_SUITE("catalog.icon") {

TEST_CASE("findIcon strips a leading icon- prefix from the query") {
    IconCatalog catalog{
        Icon{.name = "home", .css_class = "icon-home"},
        Icon{.name = "user", .css_class = "icon-user", .tags = {"person"}},
        Icon{.name = "home", .css_class = "icon-home", .unicode = "e901"},
    };

    auto const* home = findIcon(catalog, "icon-home");
    REQUIRE(home != nullptr);
    CHECK(home == &catalog[0]);
    CHECK(findIcon(catalog, "user") == &catalog[1]);
    CHECK(findIcon(catalog, "icon-icon-user") == nullptr);
    CHECK(iconExists(catalog, "user"));
    CHECK_FALSE(iconExists(catalog, "missing"));
    CHECK(stripIconPrefix("icon-") == "");
}

TEST_CASE("PathSpecMap keeps the first position of a reassigned name") {
    PathSpecMap specs;
    specs.assign("b", PathSpec{.paths = {"M0 0"}});
    specs.assign("a", PathSpec{.paths = {"M1 1"}});
    specs.assign("b", PathSpec{.paths = {"M2 2"}, .width = 16});

    REQUIRE(specs.size() == 2);
    CHECK(specs.begin()->name == "b");
    CHECK(specs.begin()->spec.width == doctest::Approx(16.0));
    REQUIRE(specs.find("b") != nullptr);
    CHECK(specs.find("b")->paths.front() == "M2 2");
    CHECK(specs.find("c") == nullptr);
}

TEST_CASE("Catalog JSON omits absent optional fields") {
    IconCatalog catalog{Icon{.name = "home", .css_class = "icon-home", .aliases = {"house"}}};
    auto        json = catalogToJson(catalog);
    REQUIRE(json.is_array());
    CHECK(json[0]["name"] == "home");
    CHECK(json[0]["aliases"][0] == "house");
    CHECK_FALSE(json[0].contains("unicode"));
    CHECK_FALSE(json[0].contains("viewBox"));
    CHECK(catalogFromJson(json) == catalog);
}

} // TEST_SUITE
