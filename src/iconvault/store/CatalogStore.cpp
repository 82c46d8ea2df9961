#include <iconvault/store/CatalogStore.hpp>

#include <iconvault/IngestOptions.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/FileUtils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <system_error>
#include <utility>

namespace IV {

namespace {

using json = nlohmann::json;

constexpr char const* kCatalogFile = "catalog.json";
constexpr char const* kSpriteFile  = "sprite.svg";

} // namespace

auto CatalogStore::get_catalog() -> IconCatalog {
    auto catalog = read_catalog();
    if (!catalog) {
        std::cerr << "[iconvault] failed to read catalog: " << describeError(catalog.error()) << "\n";
        return {};
    }
    if (!*catalog) {
        return {};
    }
    return std::move(**catalog);
}

auto CatalogStore::save_catalog(IconCatalog const& catalog) -> Expected<void> {
    auto result = write_catalog(catalog);
    if (!result) {
        std::cerr << "[iconvault] failed to persist catalog: " << describeError(result.error()) << "\n";
        return result;
    }
    iv_log("saved catalog with " + std::to_string(catalog.size()) + " icons", "Store");
    return {};
}

auto CatalogStore::clear_catalog() -> Expected<void> {
    if (auto result = erase_catalog(); !result) {
        std::cerr << "[iconvault] failed to clear catalog: " << describeError(result.error()) << "\n";
        return result;
    }
    if (auto result = erase_sprite(); !result) {
        std::cerr << "[iconvault] failed to clear sprite: " << describeError(result.error()) << "\n";
        return result;
    }
    iv_log("cleared catalog and sprite", "Store");
    return {};
}

auto CatalogStore::get_sprite() -> std::optional<std::string> {
    auto sprite = read_sprite();
    if (!sprite) {
        std::cerr << "[iconvault] failed to read sprite: " << describeError(sprite.error()) << "\n";
        return std::nullopt;
    }
    return std::move(*sprite);
}

auto CatalogStore::save_sprite(std::string const& svg) -> Expected<void> {
    auto result = write_sprite(svg);
    if (!result) {
        std::cerr << "[iconvault] failed to persist sprite: " << describeError(result.error()) << "\n";
        return result;
    }
    iv_log("saved sprite (" + std::to_string(svg.size()) + " bytes)", "Store");
    return {};
}

auto CatalogStore::clear_sprite() -> Expected<void> {
    if (auto result = erase_sprite(); !result) {
        std::cerr << "[iconvault] failed to clear sprite: " << describeError(result.error()) << "\n";
        return result;
    }
    return {};
}

auto CatalogStore::has_sprite() -> bool {
    auto exists = sprite_exists();
    if (!exists) {
        std::cerr << "[iconvault] failed to check sprite: " << describeError(exists.error()) << "\n";
        return false;
    }
    return *exists;
}

auto CatalogStore::sprite_exists() -> Expected<bool> {
    auto sprite = read_sprite();
    if (!sprite) {
        return std::unexpected(sprite.error());
    }
    return sprite->has_value();
}

auto InMemoryCatalogStore::read_catalog() -> Expected<std::optional<IconCatalog>> {
    std::lock_guard const lock{mutex_};
    return catalog_;
}

auto InMemoryCatalogStore::write_catalog(IconCatalog const& catalog) -> Expected<void> {
    std::lock_guard const lock{mutex_};
    catalog_ = catalog;
    return {};
}

auto InMemoryCatalogStore::erase_catalog() -> Expected<void> {
    std::lock_guard const lock{mutex_};
    catalog_.reset();
    return {};
}

auto InMemoryCatalogStore::read_sprite() -> Expected<std::optional<std::string>> {
    std::lock_guard const lock{mutex_};
    return sprite_;
}

auto InMemoryCatalogStore::write_sprite(std::string const& svg) -> Expected<void> {
    std::lock_guard const lock{mutex_};
    sprite_ = svg;
    return {};
}

auto InMemoryCatalogStore::erase_sprite() -> Expected<void> {
    std::lock_guard const lock{mutex_};
    sprite_.reset();
    return {};
}

auto InMemoryCatalogStore::sprite_exists() -> Expected<bool> {
    std::lock_guard const lock{mutex_};
    return sprite_.has_value();
}

FileCatalogStore::FileCatalogStore(std::filesystem::path root)
    : root_{std::move(root)} {}

auto FileCatalogStore::catalog_path() const -> std::filesystem::path {
    return root_ / kCatalogFile;
}

auto FileCatalogStore::sprite_path() const -> std::filesystem::path {
    return root_ / kSpriteFile;
}

auto FileCatalogStore::read_catalog() -> Expected<std::optional<IconCatalog>> {
    std::lock_guard const lock{mutex_};
    auto                  text = Utils::readTextFile(catalog_path());
    if (!text) {
        if (text.error().code == Error::Code::NotFound) {
            return std::optional<IconCatalog>{};
        }
        return std::unexpected(text.error());
    }

    auto payload = json::parse(*text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        std::cerr << "[iconvault] catalog file " << catalog_path().string() << " is invalid JSON\n";
        return std::optional<IconCatalog>{};
    }
    auto version = payload.find("version");
    if (version == payload.end() || !version->is_number_integer() || version->get<int>() != kCatalogVersion) {
        std::cerr << "[iconvault] catalog file " << catalog_path().string() << " has an unsupported version\n";
        return std::optional<IconCatalog>{};
    }
    auto icons = payload.find("icons");
    if (icons == payload.end() || !icons->is_array()) {
        std::cerr << "[iconvault] catalog file " << catalog_path().string() << " missing icons\n";
        return std::optional<IconCatalog>{};
    }
    return std::optional<IconCatalog>{catalogFromJson(*icons)};
}

auto FileCatalogStore::write_catalog(IconCatalog const& catalog) -> Expected<void> {
    std::lock_guard const lock{mutex_};
    json                  payload{{"version", kCatalogVersion}, {"icons", catalogToJson(catalog)}};
    auto                  serialized = payload.dump(2, ' ', false, json::error_handler_t::replace);
    return Utils::writeTextFileAtomic(catalog_path(), serialized, true);
}

auto FileCatalogStore::erase_catalog() -> Expected<void> {
    std::lock_guard const lock{mutex_};
    return Utils::removeFileIfExists(catalog_path());
}

auto FileCatalogStore::read_sprite() -> Expected<std::optional<std::string>> {
    std::lock_guard const lock{mutex_};
    auto                  text = Utils::readTextFile(sprite_path());
    if (!text) {
        if (text.error().code == Error::Code::NotFound) {
            return std::optional<std::string>{};
        }
        return std::unexpected(text.error());
    }
    return std::optional<std::string>{std::move(*text)};
}

auto FileCatalogStore::write_sprite(std::string const& svg) -> Expected<void> {
    std::lock_guard const lock{mutex_};
    return Utils::writeTextFileAtomic(sprite_path(), svg, true);
}

auto FileCatalogStore::erase_sprite() -> Expected<void> {
    std::lock_guard const lock{mutex_};
    return Utils::removeFileIfExists(sprite_path());
}

auto FileCatalogStore::sprite_exists() -> Expected<bool> {
    std::lock_guard const lock{mutex_};
    std::error_code       ec;
    auto const            exists = std::filesystem::is_regular_file(sprite_path(), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(Error{Error::Code::StorageFailed, "Failed to stat " + sprite_path().string()});
    }
    return exists;
}

auto make_catalog_store(IngestOptions const& options) -> std::unique_ptr<CatalogStore> {
    auto const& backend = options.store_backend;
    if (backend == "file") {
        return std::make_unique<FileCatalogStore>(options.store_root);
    }
    if (backend != "memory") {
        std::cerr << "[iconvault] unsupported catalog store backend '" << backend
                  << "', defaulting to in-memory\n";
    }
    return std::make_unique<InMemoryCatalogStore>();
}

} // namespace IV
