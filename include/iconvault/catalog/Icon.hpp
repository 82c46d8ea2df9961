#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace IV {

struct Icon {
    std::string                name;
    std::string                css_class;
    std::optional<std::string> unicode;
    std::vector<std::string>   tags;
    std::vector<std::string>   aliases;
    // Set only for icons read from an uploaded sprite.
    std::optional<std::string> symbol_id;
    std::optional<std::string> view_box;

    bool operator==(Icon const&) const = default;
};

using IconCatalog = std::vector<Icon>;

using PathAttributes = std::vector<std::pair<std::string, std::string>>;

struct PathSpec {
    std::vector<std::string>    paths;
    double                      width{1024.0};
    double                      grid{1024.0};
    std::vector<PathAttributes> attrs;

    bool operator==(PathSpec const&) const = default;
};

struct NamedPathSpec {
    std::string name;
    PathSpec    spec;
};

/*
 * Insertion-ordered name -> PathSpec map. Assigning an existing name replaces
 * the spec but keeps the position where the name was first seen.
 */
class PathSpecMap {
public:
    void assign(std::string name, PathSpec spec);

    [[nodiscard]] auto find(std::string_view name) const -> PathSpec const*;
    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries_.empty(); }

    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

private:
    std::vector<NamedPathSpec> entries_;
};

inline constexpr std::string_view kSpriteIdPrefix = "icon-";

[[nodiscard]] auto stripIconPrefix(std::string_view name) -> std::string_view;

[[nodiscard]] auto findIcon(IconCatalog const& catalog, std::string_view name) -> Icon const*;
[[nodiscard]] auto iconExists(IconCatalog const& catalog, std::string_view name) -> bool;

[[nodiscard]] auto catalogToJson(IconCatalog const& catalog) -> nlohmann::json;
// Entries that are not objects or lack a string "name" are skipped.
[[nodiscard]] auto catalogFromJson(nlohmann::json const& value) -> IconCatalog;

} // namespace IV
