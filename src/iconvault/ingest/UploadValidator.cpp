#include <iconvault/ingest/UploadValidator.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace IV::Ingest {

namespace {

constexpr std::array<std::string_view, 2> kJsonMimeTypes{"application/json", "text/plain"};
constexpr std::array<std::string_view, 3> kSvgMimeTypes{"image/svg+xml",
                                                        "text/plain",
                                                        "application/octet-stream"};

struct Signature {
    std::string_view magic;
    std::string_view mime;
};

constexpr std::array<Signature, 11> kBinarySignatures{{
    {std::string_view{"\x89PNG\r\n\x1a\n", 8}, "image/png"},
    {"GIF87a", "image/gif"},
    {"GIF89a", "image/gif"},
    {"\xFF\xD8\xFF", "image/jpeg"},
    {"%PDF-", "application/pdf"},
    {"PK\x03\x04", "application/zip"},
    {"\x1F\x8B", "application/gzip"},
    {"wOFF", "font/woff"},
    {"wOF2", "font/woff2"},
    {std::string_view{"\x00\x01\x00\x00", 4}, "font/ttf"},
    {"OTTO", "font/otf"},
}};

void skip_whitespace(std::string_view& text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
}

// Skips leading markup that may precede the root element: the XML
// declaration, processing instructions, comments and a document type.
bool skip_prolog_item(std::string_view& text) {
    auto skip_past = [&](std::string_view terminator) {
        auto pos = text.find(terminator);
        if (pos == std::string_view::npos) {
            text = {};
        } else {
            text.remove_prefix(pos + terminator.size());
        }
        return true;
    };
    if (text.starts_with("<?")) {
        return skip_past("?>");
    }
    if (text.starts_with("<!--")) {
        return skip_past("-->");
    }
    if (Utils::startsWithIcase(text, "<!doctype")) {
        // An internal subset may contain '>' before the declaration ends.
        auto const bracket = text.find('[');
        if (bracket != std::string_view::npos && bracket < text.find('>')) {
            skip_past("]");
        }
        return skip_past(">");
    }
    return false;
}

bool looks_like_text(std::string_view bytes) {
    return bytes.find('\0') == std::string_view::npos;
}

} // namespace

auto AssetKindName(AssetKind kind) -> std::string_view {
    switch (kind) {
    case AssetKind::Json:
        return "json";
    case AssetKind::Svg:
        return "svg";
    }
    return "json";
}

auto AllowedMimeTypes(AssetKind kind) -> std::span<std::string_view const> {
    if (kind == AssetKind::Svg) {
        return kSvgMimeTypes;
    }
    return kJsonMimeTypes;
}

auto SniffMimeType(std::string_view bytes) -> std::string_view {
    for (auto const& signature : kBinarySignatures) {
        if (bytes.starts_with(signature.magic)) {
            return signature.mime;
        }
    }

    auto text = bytes;
    if (text.starts_with("\xEF\xBB\xBF")) {
        text.remove_prefix(3);
    }
    if (!looks_like_text(text)) {
        return "application/octet-stream";
    }

    skip_whitespace(text);
    if (text.starts_with("{") || text.starts_with("[")) {
        return "application/json";
    }
    if (text.starts_with("<")) {
        while (skip_prolog_item(text)) {
            skip_whitespace(text);
        }
        if (Utils::startsWithIcase(text, "<svg")) {
            auto const next = text.size() > 4 ? static_cast<unsigned char>(text[4]) : '>';
            if (next == '>' || next == '/' || std::isspace(next) != 0) {
                return "image/svg+xml";
            }
        }
        return "text/xml";
    }
    return "text/plain";
}

auto FileExtension(std::string_view filename) -> std::string {
    auto const slash = filename.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        filename.remove_prefix(slash + 1);
    }
    auto const dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == filename.size()) {
        return {};
    }
    return Utils::toLower(filename.substr(dot + 1));
}

auto ValidateUpload(UploadedAsset const& asset, AssetKind expected, std::uint64_t max_bytes)
    -> Expected<void> {
    auto const ceiling = std::min(max_bytes, kMaxUploadBytes);
    auto const size    = std::max<std::uint64_t>(asset.declared_size, asset.bytes.size());
    if (size > ceiling) {
        iv_log("rejecting " + asset.filename + ": " + std::to_string(size) + " bytes", "Validator");
        return std::unexpected(Error{Error::Code::FileTooLarge,
                                     "The file is too large. Maximum size is "
                                         + std::to_string(ceiling) + " bytes."});
    }
    if (asset.bytes.empty()) {
        return std::unexpected(Error{Error::Code::EmptyFile, "The uploaded file is empty."});
    }

    auto const kind_name = AssetKindName(expected);
    if (FileExtension(asset.filename) != kind_name) {
        return std::unexpected(Error{Error::Code::ExtensionMismatch,
                                     "Please upload a valid ." + std::string{kind_name} + " file."});
    }

    auto const mime    = SniffMimeType(asset.bytes);
    auto const allowed = AllowedMimeTypes(expected);
    if (std::find(allowed.begin(), allowed.end(), mime) == allowed.end()) {
        iv_log("rejecting " + asset.filename + ": sniffed " + std::string{mime}, "Validator");
        return std::unexpected(Error{Error::Code::MimeMismatch,
                                     "Content type " + std::string{mime} + " is not accepted for ."
                                         + std::string{kind_name} + " uploads."});
    }
    return {};
}

} // namespace IV::Ingest
