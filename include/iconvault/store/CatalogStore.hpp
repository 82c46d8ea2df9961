#pragma once

#include <iconvault/catalog/Icon.hpp>
#include <iconvault/core/Error.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace IV {

struct IngestOptions;

/*
 * Persists the current icon catalog and the stored sprite. Each public call is
 * one operation; implementations serialize concurrent writers per operation.
 */
class CatalogStore {
public:
    virtual ~CatalogStore() = default;

    // Empty when nothing is stored or the stored catalog is unreadable.
    auto get_catalog() -> IconCatalog;
    auto save_catalog(IconCatalog const& catalog) -> Expected<void>;
    // Removes the catalog and the stored sprite.
    auto clear_catalog() -> Expected<void>;

    auto get_sprite() -> std::optional<std::string>;
    auto save_sprite(std::string const& svg) -> Expected<void>;
    auto clear_sprite() -> Expected<void>;
    auto has_sprite() -> bool;

protected:
    virtual auto read_catalog() -> Expected<std::optional<IconCatalog>> = 0;
    virtual auto write_catalog(IconCatalog const& catalog) -> Expected<void> = 0;
    virtual auto erase_catalog() -> Expected<void>                           = 0;

    virtual auto read_sprite() -> Expected<std::optional<std::string>> = 0;
    virtual auto write_sprite(std::string const& svg) -> Expected<void> = 0;
    virtual auto erase_sprite() -> Expected<void>                       = 0;
    // Defaults to reading the sprite.
    virtual auto sprite_exists() -> Expected<bool>;
};

class InMemoryCatalogStore final : public CatalogStore {
private:
    auto read_catalog() -> Expected<std::optional<IconCatalog>> override;
    auto write_catalog(IconCatalog const& catalog) -> Expected<void> override;
    auto erase_catalog() -> Expected<void> override;

    auto read_sprite() -> Expected<std::optional<std::string>> override;
    auto write_sprite(std::string const& svg) -> Expected<void> override;
    auto erase_sprite() -> Expected<void> override;
    auto sprite_exists() -> Expected<bool> override;

    std::optional<IconCatalog> catalog_;
    std::optional<std::string> sprite_;
    mutable std::mutex         mutex_;
};

/*
 * <root>/catalog.json holds {"version": 1, "icons": [...]};
 * <root>/sprite.svg holds the sprite markup. Both are replaced atomically
 * and flushed to disk before the call returns.
 */
class FileCatalogStore final : public CatalogStore {
public:
    static constexpr int kCatalogVersion = 1;

    explicit FileCatalogStore(std::filesystem::path root);

    auto catalog_path() const -> std::filesystem::path;
    auto sprite_path() const -> std::filesystem::path;

private:
    auto read_catalog() -> Expected<std::optional<IconCatalog>> override;
    auto write_catalog(IconCatalog const& catalog) -> Expected<void> override;
    auto erase_catalog() -> Expected<void> override;

    auto read_sprite() -> Expected<std::optional<std::string>> override;
    auto write_sprite(std::string const& svg) -> Expected<void> override;
    auto erase_sprite() -> Expected<void> override;
    auto sprite_exists() -> Expected<bool> override;

    std::filesystem::path root_;
    mutable std::mutex    mutex_;
};

auto make_catalog_store(IngestOptions const& options) -> std::unique_ptr<CatalogStore>;

} // namespace IV
