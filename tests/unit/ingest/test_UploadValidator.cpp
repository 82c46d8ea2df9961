#include <doctest/doctest.h>

#include <iconvault/ingest/UploadValidator.hpp>

#include <string>

using namespace IV;
using namespace IV::Ingest;

namespace {

auto make_asset(std::string filename, std::string bytes) -> UploadedAsset {
    UploadedAsset asset{};
    asset.filename      = std::move(filename);
    asset.declared_size = bytes.size();
    asset.bytes         = std::move(bytes);
    return asset;
}

} // namespace

TEST_SUITE("ingest.validator") {

TEST_CASE("Sniffer recognises text formats from content") {
    CHECK(SniffMimeType("{\"icons\": []}") == "application/json");
    CHECK(SniffMimeType("  \n[1, 2]") == "application/json");
    CHECK(SniffMimeType("<svg xmlns=\"http://www.w3.org/2000/svg\"></svg>") == "image/svg+xml");
    CHECK(SniffMimeType("<?xml version=\"1.0\"?>\n<!-- sprite -->\n<SVG>") == "image/svg+xml");
    CHECK(SniffMimeType("\xEF\xBB\xBF<svg/>") == "image/svg+xml");
    CHECK(SniffMimeType("<svgfoo/>") == "text/xml");
    CHECK(SniffMimeType("<html><body/></html>") == "text/xml");
    CHECK(SniffMimeType("just some words") == "text/plain");
}

TEST_CASE("Sniffer recognises binary signatures") {
    CHECK(SniffMimeType(std::string{"\x89PNG\r\n\x1a\n....", 12}) == "image/png");
    CHECK(SniffMimeType("GIF89a....") == "image/gif");
    CHECK(SniffMimeType("%PDF-1.7") == "application/pdf");
    CHECK(SniffMimeType(std::string{"PK\x03\x04rest", 8}) == "application/zip");
    CHECK(SniffMimeType("wOF2data") == "font/woff2");
    CHECK(SniffMimeType(std::string{"abc\0def", 7}) == "application/octet-stream");
}

TEST_CASE("Extension is taken from the last path component, lowercased") {
    CHECK(FileExtension("selection.JSON") == "json");
    CHECK(FileExtension("dir.v2/sprite.svg") == "svg");
    CHECK(FileExtension("C:\\icons\\symbol-defs.Svg") == "svg");
    CHECK(FileExtension("README") == "");
    CHECK(FileExtension(".svg") == "");
    CHECK(FileExtension("trailing.") == "");
}

TEST_CASE("Valid uploads pass") {
    CHECK(ValidateUpload(make_asset("selection.json", "{\"icons\":[]}"), AssetKind::Json));
    CHECK(ValidateUpload(make_asset("sprite.svg", "<svg></svg>"), AssetKind::Svg));
    // text/plain is accepted for both kinds.
    CHECK(ValidateUpload(make_asset("sprite.svg", "not really svg"), AssetKind::Svg));
}

TEST_CASE("Oversized uploads are rejected before any other check") {
    std::string big(static_cast<std::size_t>(kMaxUploadBytes) + 1, '{');
    auto        result = ValidateUpload(make_asset("selection.txt", big), AssetKind::Json);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::FileTooLarge);

    SUBCASE("declared size alone can exceed the limit") {
        auto asset          = make_asset("selection.json", "{}");
        asset.declared_size = kMaxUploadBytes + 10;
        auto declared       = ValidateUpload(asset, AssetKind::Json);
        REQUIRE_FALSE(declared);
        CHECK(declared.error().code == Error::Code::FileTooLarge);
    }

    SUBCASE("configured ceiling lowers but never raises the limit") {
        auto lowered = ValidateUpload(make_asset("selection.json", "{\"a\":1}"), AssetKind::Json, 4);
        REQUIRE_FALSE(lowered);
        CHECK(lowered.error().code == Error::Code::FileTooLarge);

        auto raised = ValidateUpload(make_asset("selection.json", big), AssetKind::Json, kMaxUploadBytes * 4);
        REQUIRE_FALSE(raised);
        CHECK(raised.error().code == Error::Code::FileTooLarge);
    }
}

TEST_CASE("Empty, mislabelled and binary uploads are rejected") {
    auto empty = ValidateUpload(make_asset("selection.json", ""), AssetKind::Json);
    REQUIRE_FALSE(empty);
    CHECK(empty.error().code == Error::Code::EmptyFile);

    auto wrongExt = ValidateUpload(make_asset("selection.svg", "{}"), AssetKind::Json);
    REQUIRE_FALSE(wrongExt);
    CHECK(wrongExt.error().code == Error::Code::ExtensionMismatch);

    auto svgAsJson = ValidateUpload(make_asset("selection.json", "<svg></svg>"), AssetKind::Json);
    REQUIRE_FALSE(svgAsJson);
    CHECK(svgAsJson.error().code == Error::Code::MimeMismatch);

    auto pngAsSvg = ValidateUpload(make_asset("sprite.svg", std::string{"\x89PNG\r\n\x1a\n", 8}), AssetKind::Svg);
    REQUIRE_FALSE(pngAsSvg);
    CHECK(pngAsSvg.error().code == Error::Code::MimeMismatch);
}

} // TEST_SUITE
