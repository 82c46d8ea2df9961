#include <iconvault/IngestOptions.hpp>
#include <iconvault/ingest/IngestPipeline.hpp>
#include <iconvault/store/CatalogStore.hpp>

#include "utils/FileUtils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace {

auto load_asset(std::string const& path) -> IV::Expected<IV::Ingest::UploadedAsset> {
    auto bytes = IV::Utils::readTextFile(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    IV::Ingest::UploadedAsset asset{};
    asset.filename      = std::filesystem::path{path}.filename().string();
    asset.declared_size = bytes->size();
    asset.bytes         = std::move(*bytes);
    return asset;
}

void print_report(std::string const& path, IV::Ingest::IngestReport const& report) {
    std::cout << "[iconvault] " << path << ": " << IV::Ingest::AssetKindName(report.kind) << ", "
              << report.icon_count << " icons"
              << (report.catalog_replaced ? ", catalog replaced" : ", catalog kept")
              << (report.sprite_written ? ", sprite written" : "") << "\n";
    for (auto const& warning : report.warnings) {
        std::cout << "[iconvault] warning: " << warning << "\n";
    }
}

using IngestFn = IV::Expected<IV::Ingest::IngestReport> (IV::Ingest::IngestPipeline::*)(
    IV::Ingest::UploadedAsset const&);

bool run_upload(IV::Ingest::IngestPipeline& pipeline, std::string const& path, IngestFn ingest) {
    auto asset = load_asset(path);
    if (!asset) {
        std::cerr << "[iconvault] " << path << ": " << IV::describeError(asset.error()) << "\n";
        return false;
    }
    auto report = (pipeline.*ingest)(*asset);
    if (!report) {
        std::cerr << "[iconvault] " << path << ": " << IV::describeError(report.error()) << "\n";
        return false;
    }
    print_report(path, *report);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    auto options_opt = IV::ParseIngestArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        IV::PrintIngestUsage();
        return EXIT_SUCCESS;
    }

    auto store = IV::make_catalog_store(options);
    IV::Ingest::IngestPipeline pipeline{*store, IV::Ingest::MakeIngestConfig(options)};

    if (options.clear) {
        if (auto cleared = pipeline.clear(); !cleared) {
            std::cerr << "[iconvault] clear failed: " << IV::describeError(cleared.error()) << "\n";
            return EXIT_FAILURE;
        }
    }

    bool ok = true;
    if (options.selection_path) {
        ok = run_upload(pipeline, *options.selection_path, &IV::Ingest::IngestPipeline::ingest_selection) && ok;
    }
    if (options.sprite_path) {
        ok = run_upload(pipeline, *options.sprite_path, &IV::Ingest::IngestPipeline::ingest_sprite) && ok;
    }

    if (options.print_catalog) {
        auto catalog = IV::catalogToJson(store->get_catalog());
        std::cout << catalog.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    }
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
