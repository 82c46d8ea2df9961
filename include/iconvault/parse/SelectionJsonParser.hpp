#pragma once

#include <iconvault/catalog/Icon.hpp>
#include <iconvault/core/Error.hpp>

#include <string_view>

namespace IV::Parse {

inline constexpr std::string_view kDefaultClassPrefix = "icon-";
inline constexpr double           kDefaultGrid        = 1024.0;

// Catalog and path data read from one selection.json in a single decode.
struct Selection {
    IconCatalog catalog;
    PathSpecMap paths;
};

/*
 * Reads the icon list of an IcoMoon selection.json. Icons without a string
 * properties.name, or whose first name token is empty, are skipped. A missing
 * or non-array "icons" yields an empty catalog. Duplicate names are kept.
 */
[[nodiscard]] auto ParseSelectionJson(std::string_view bytes) -> Expected<IconCatalog>;

// Path data for sprite synthesis, keyed by primary name.
[[nodiscard]] auto ExtractPathSpecs(std::string_view bytes) -> Expected<PathSpecMap>;

[[nodiscard]] auto ParseSelection(std::string_view bytes) -> Expected<Selection>;

} // namespace IV::Parse
