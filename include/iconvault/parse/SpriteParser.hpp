#pragma once

#include <iconvault/catalog/Icon.hpp>
#include <iconvault/core/Error.hpp>

#include <string_view>

namespace IV::Parse {

/*
 * Every <symbol> with a non-empty id, in document order at any depth. The
 * name is the id without a leading "icon-"; id and viewBox are kept verbatim.
 * Document type declarations are never parsed.
 */
[[nodiscard]] auto ParseSvgSprite(std::string_view bytes) -> Expected<IconCatalog>;

// An empty catalog adopts the sprite icons; a populated one is kept as is.
[[nodiscard]] auto MergeSpriteCatalog(IconCatalog const& existing, IconCatalog parsed) -> IconCatalog;

} // namespace IV::Parse
