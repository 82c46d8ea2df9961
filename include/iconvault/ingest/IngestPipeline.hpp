#pragma once

#include <iconvault/core/Error.hpp>
#include <iconvault/ingest/UploadValidator.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace IV {

class CatalogStore;
struct IngestOptions;

namespace Ingest {

struct IngestConfig {
    std::uint64_t max_upload_bytes{kMaxUploadBytes};
    // Refuse sprites whose raw bytes contain "<script" instead of sanitizing them.
    bool reject_script_uploads{true};
};

[[nodiscard]] auto MakeIngestConfig(IngestOptions const& options) -> IngestConfig;

struct IngestReport {
    AssetKind                kind{AssetKind::Json};
    std::size_t              icon_count{0};
    bool                     catalog_replaced{false};
    bool                     sprite_written{false};
    std::vector<std::string> warnings;
};

/*
 * Runs one upload through validation, parsing and sanitization. Nothing is
 * written to the store unless every step before the write succeeded. A sprite
 * upload whose catalog write fails restores the previously stored sprite.
 */
class IngestPipeline {
public:
    IngestPipeline(CatalogStore& store, IngestConfig config);

    auto ingest_selection(UploadedAsset const& asset) -> Expected<IngestReport>;
    auto ingest_sprite(UploadedAsset const& asset) -> Expected<IngestReport>;
    auto clear() -> Expected<void>;

private:
    CatalogStore& store_;
    IngestConfig  config_;
};

} // namespace Ingest
} // namespace IV
