#include <doctest/doctest.h>

#include <iconvault/IngestOptions.hpp>
#include <iconvault/store/CatalogStore.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace IV;

namespace {

class TempDir {
public:
    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_      = std::filesystem::temp_directory_path() / ("iconvault-store-" + std::to_string(stamp));
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(TempDir const&)            = delete;
    TempDir& operator=(TempDir const&) = delete;

    auto path() const -> std::filesystem::path const& { return path_; }

private:
    std::filesystem::path path_;
};

auto sample_catalog() -> IconCatalog {
    Icon home{};
    home.name      = "home";
    home.css_class = "icon-home";
    home.unicode   = "e900";
    home.tags      = {"house", "building"};
    home.aliases   = {"house"};

    Icon user{};
    user.name      = "user";
    user.css_class = "icon-user";
    user.symbol_id = "icon-user";
    user.view_box  = "0 0 24 24";
    return {home, user};
}

auto read_file(std::filesystem::path const& path) -> std::string {
    std::ifstream      stream(path);
    std::ostringstream oss;
    oss << stream.rdbuf();
    return oss.str();
}

void exercise_store(CatalogStore& store) {
    CHECK(store.get_catalog().empty());
    CHECK_FALSE(store.has_sprite());

    auto catalog = sample_catalog();
    REQUIRE(store.save_catalog(catalog));
    CHECK(store.get_catalog() == catalog);

    REQUIRE(store.save_sprite("<svg/>"));
    CHECK(store.has_sprite());
    CHECK(store.get_sprite() == std::optional<std::string>{"<svg/>"});

    REQUIRE(store.clear_sprite());
    CHECK_FALSE(store.has_sprite());
    CHECK(store.get_catalog() == catalog);
    REQUIRE(store.save_sprite("<svg/>"));

    IconCatalog replacement{catalog.back()};
    REQUIRE(store.save_catalog(replacement));
    CHECK(store.get_catalog() == replacement);

    REQUIRE(store.clear_catalog());
    CHECK(store.get_catalog().empty());
    CHECK_FALSE(store.has_sprite());

    // Clearing an empty store is not an error.
    CHECK(store.clear_catalog());
}

} // namespace

TEST_SUITE("store.catalog") {

TEST_CASE("InMemoryCatalogStore saves, replaces and clears") {
    InMemoryCatalogStore store;
    exercise_store(store);
}

TEST_CASE("FileCatalogStore saves, replaces and clears") {
    TempDir          dir;
    FileCatalogStore store{dir.path()};
    exercise_store(store);
}

TEST_CASE("FileCatalogStore writes a versioned catalog document") {
    TempDir          dir;
    FileCatalogStore store{dir.path()};
    REQUIRE(store.save_catalog(sample_catalog()));

    auto payload = nlohmann::json::parse(read_file(store.catalog_path()), nullptr, false);
    REQUIRE(payload.is_object());
    CHECK(payload["version"].get<int>() == FileCatalogStore::kCatalogVersion);
    REQUIRE(payload["icons"].is_array());
    CHECK(payload["icons"][0]["class"].get<std::string>() == "icon-home");
    CHECK(payload["icons"][0]["unicode"].get<std::string>() == "e900");
    CHECK(payload["icons"][1]["viewBox"].get<std::string>() == "0 0 24 24");
    CHECK_FALSE(payload["icons"][0].contains("id"));
    CHECK_FALSE(std::filesystem::exists(store.catalog_path().string() + ".tmp"));

    FileCatalogStore reopened{dir.path()};
    CHECK(reopened.get_catalog() == sample_catalog());
}

TEST_CASE("FileCatalogStore reports the sprite from the file on disk") {
    TempDir          dir;
    FileCatalogStore store{dir.path()};
    CHECK_FALSE(store.has_sprite());

    REQUIRE(store.save_sprite("<svg/>"));
    CHECK(std::filesystem::exists(store.sprite_path()));
    CHECK_FALSE(std::filesystem::exists(store.sprite_path().string() + ".tmp"));

    std::filesystem::remove(store.sprite_path());
    CHECK_FALSE(store.has_sprite());

    std::ofstream(store.sprite_path()) << "";
    CHECK(store.has_sprite());
}

TEST_CASE("FileCatalogStore treats a corrupt catalog as empty") {
    TempDir dir;
    std::filesystem::create_directories(dir.path());
    FileCatalogStore store{dir.path()};

    for (char const* content : {"{not json", R"({"version": 99, "icons": []})", R"({"version": 1})", "[]"}) {
        CAPTURE(content);
        std::ofstream(store.catalog_path()) << content;
        CHECK(store.get_catalog().empty());
    }

    // A valid save replaces the corrupt file.
    REQUIRE(store.save_catalog(sample_catalog()));
    CHECK(store.get_catalog().size() == 2);
}

TEST_CASE("Catalog JSON skips entries without a name") {
    auto catalog = catalogFromJson(nlohmann::json::parse(
        R"([{"name": "a"}, {"class": "icon-b"}, 5, {"name": 3}, {"name": "c", "tags": ["x", 1]}])"));
    REQUIRE(catalog.size() == 2);
    CHECK(catalog[0].css_class == "icon-a");
    CHECK(catalog[1].tags == std::vector<std::string>{"x"});
    CHECK(catalogFromJson(nlohmann::json::object()).empty());
}

TEST_CASE("make_catalog_store selects the configured backend") {
    TempDir       dir;
    IngestOptions options{};
    options.store_backend = "memory";
    auto memory           = make_catalog_store(options);
    REQUIRE(memory != nullptr);
    CHECK(dynamic_cast<InMemoryCatalogStore*>(memory.get()) != nullptr);

    options.store_backend = "file";
    options.store_root    = dir.path().string();
    auto file             = make_catalog_store(options);
    REQUIRE(file != nullptr);
    auto* typed = dynamic_cast<FileCatalogStore*>(file.get());
    REQUIRE(typed != nullptr);
    CHECK(typed->catalog_path() == dir.path() / "catalog.json");
}

} // TEST_SUITE
