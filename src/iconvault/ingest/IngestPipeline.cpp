#include <iconvault/ingest/IngestPipeline.hpp>

#include <iconvault/IngestOptions.hpp>
#include <iconvault/parse/SelectionJsonParser.hpp>
#include <iconvault/parse/SpriteParser.hpp>
#include <iconvault/store/CatalogStore.hpp>
#include <iconvault/svg/SpriteSynthesizer.hpp>
#include <iconvault/svg/SvgSanitizer.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <optional>

namespace IV::Ingest {

auto MakeIngestConfig(IngestOptions const& options) -> IngestConfig {
    IngestConfig config{};
    config.max_upload_bytes      = static_cast<std::uint64_t>(std::max<std::int64_t>(options.max_upload_bytes, 0));
    config.reject_script_uploads = options.reject_script_uploads;
    return config;
}

IngestPipeline::IngestPipeline(CatalogStore& store, IngestConfig config)
    : store_{store}
    , config_{config} {}

auto IngestPipeline::ingest_selection(UploadedAsset const& asset) -> Expected<IngestReport> {
    if (auto valid = ValidateUpload(asset, AssetKind::Json, config_.max_upload_bytes); !valid) {
        return std::unexpected(valid.error());
    }
    auto selection = Parse::ParseSelection(asset.bytes);
    if (!selection) {
        iv_log("selection rejected: " + describeError(selection.error()), "Ingest");
        return std::unexpected(selection.error());
    }

    IngestReport report{};
    report.kind       = AssetKind::Json;
    report.icon_count = selection->catalog.size();

    if (auto saved = store_.save_catalog(selection->catalog); !saved) {
        return std::unexpected(saved.error());
    }
    report.catalog_replaced = true;

    if (!selection->paths.empty() && !store_.has_sprite()) {
        auto sprite = Svg::RenderSprite(Svg::BuildSprite(selection->paths));
        if (auto written = store_.save_sprite(sprite); written) {
            report.sprite_written = true;
        } else {
            report.warnings.push_back("sprite not generated: " + describeError(written.error()));
        }
    }
    iv_log("ingested selection " + asset.filename + " with " + std::to_string(report.icon_count) + " icons", "Ingest");
    return report;
}

auto IngestPipeline::ingest_sprite(UploadedAsset const& asset) -> Expected<IngestReport> {
    if (auto valid = ValidateUpload(asset, AssetKind::Svg, config_.max_upload_bytes); !valid) {
        return std::unexpected(valid.error());
    }
    if (config_.reject_script_uploads && Utils::containsIcase(asset.bytes, "<script")) {
        iv_log("sprite " + asset.filename + " contains a script element", "Ingest", "Security");
        return std::unexpected(Error{Error::Code::ScriptNotAllowed, "Script elements are not allowed in SVG uploads"});
    }

    auto sanitized = Svg::SanitizeSvg(asset.bytes);
    if (!sanitized) {
        iv_log("sprite rejected: " + describeError(sanitized.error()), "Ingest");
        return std::unexpected(sanitized.error());
    }
    auto icons = Parse::ParseSvgSprite(*sanitized);
    if (!icons) {
        return std::unexpected(icons.error());
    }

    IngestReport report{};
    report.kind       = AssetKind::Svg;
    report.icon_count = icons->size();

    auto existing = store_.get_catalog();
    auto previous = existing.empty() ? store_.get_sprite() : std::nullopt;

    if (auto written = store_.save_sprite(*sanitized); !written) {
        return std::unexpected(written.error());
    }
    report.sprite_written = true;

    if (existing.empty()) {
        auto merged = Parse::MergeSpriteCatalog(existing, std::move(*icons));
        if (auto saved = store_.save_catalog(merged); !saved) {
            // Put back the sprite that was stored before this upload.
            auto restored = previous ? store_.save_sprite(*previous) : store_.clear_sprite();
            if (!restored) {
                iv_log("sprite rollback failed: " + describeError(restored.error()), "Ingest");
            }
            return std::unexpected(saved.error());
        }
        report.catalog_replaced = true;
    }
    iv_log("ingested sprite " + asset.filename + " with " + std::to_string(report.icon_count) + " symbols", "Ingest");
    return report;
}

auto IngestPipeline::clear() -> Expected<void> {
    return store_.clear_catalog();
}

} // namespace IV::Ingest
