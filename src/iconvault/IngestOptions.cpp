#include <iconvault/IngestOptions.hpp>

#include <iconvault/ingest/UploadValidator.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>

namespace IV {

namespace {

constexpr std::int64_t kMaxUploadLimit = static_cast<std::int64_t>(Ingest::kMaxUploadBytes);

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidStoreBackend(std::string_view backend) {
    return backend == "memory" || backend == "file";
}

auto ValidateIngestOptions(IngestOptions const& options) -> std::optional<std::string> {
    if (!IsValidStoreBackend(options.store_backend)) {
        return std::string{"Unsupported catalog store backend: " + options.store_backend};
    }
    if (options.store_backend == "file" && options.store_root.empty()) {
        return std::string{"File catalog store requires a non-empty --store-root"};
    }
    if (options.max_upload_bytes < 1 || options.max_upload_bytes > kMaxUploadLimit) {
        return std::string{"--max-upload-bytes must be within 1-" + std::to_string(kMaxUploadLimit)};
    }
    if (options.selection_path && options.selection_path->empty()) {
        return std::string{"--selection must not be empty"};
    }
    if (options.sprite_path && options.sprite_path->empty()) {
        return std::string{"--sprite must not be empty"};
    }
    return std::nullopt;
}

bool ApplyIngestEnvOverrides(IngestOptions& options) {
    if (!apply_env("ICONVAULT_STORE", [&](std::string_view value) {
            if (!IsValidStoreBackend(value)) {
                std::cerr << "ICONVAULT_STORE must be memory or file\n";
                return false;
            }
            options.store_backend = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("ICONVAULT_STORE_ROOT", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "ICONVAULT_STORE_ROOT must not be empty\n";
                return false;
            }
            options.store_root = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("ICONVAULT_MAX_UPLOAD_BYTES", [&](std::string_view value) {
            std::int64_t parsed = options.max_upload_bytes;
            if (!parse_integer_in_range<std::int64_t>(value, 1, kMaxUploadLimit, parsed)) {
                std::cerr << "ICONVAULT_MAX_UPLOAD_BYTES must be within 1-" << kMaxUploadLimit << "\n";
                return false;
            }
            options.max_upload_bytes = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("ICONVAULT_REJECT_SCRIPT_UPLOADS", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "ICONVAULT_REJECT_SCRIPT_UPLOADS must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.reject_script_uploads = *parsed;
            return true;
        })) {
        return false;
    }
    return true;
}

void PrintIngestUsage() {
    std::cout << "Usage: iconvault_ingest [options]\n"
              << "  --selection <file>         IcoMoon selection.json to ingest\n"
              << "  --sprite <file>            SVG sprite to sanitize and store\n"
              << "  --store <backend>          Catalog store backend (memory|file, default file)\n"
              << "  --store-root <dir>         Directory for the file store (default iconvault-data)\n"
              << "  --max-upload-bytes <n>     Upload ceiling in bytes (1-" << kMaxUploadLimit << ")\n"
              << "  --allow-script-uploads     Sanitize sprites containing <script instead of rejecting them\n"
              << "  --clear                    Remove the stored catalog and sprite first\n"
              << "  --print-catalog            Print the stored catalog as JSON\n"
              << "  --help                     Show this message\n"
              << "Environment: ICONVAULT_STORE, ICONVAULT_STORE_ROOT, ICONVAULT_MAX_UPLOAD_BYTES,\n"
              << "             ICONVAULT_REJECT_SCRIPT_UPLOADS, ICONVAULT_LOG_ENABLED\n";
}

auto ParseIngestArguments(int argc, char** argv) -> std::optional<IngestOptions> {
    IngestOptions options{};
    if (!ApplyIngestEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--selection") {
            if (auto value = require_value(i, "--selection")) {
                options.selection_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--sprite") {
            if (auto value = require_value(i, "--sprite")) {
                options.sprite_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--store") {
            if (auto value = require_value(i, "--store")) {
                if (!IsValidStoreBackend(*value)) {
                    std::cerr << "--store must be memory or file\n";
                    return std::nullopt;
                }
                options.store_backend = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--store-root") {
            if (auto value = require_value(i, "--store-root")) {
                if (value->empty()) {
                    std::cerr << "--store-root must not be empty\n";
                    return std::nullopt;
                }
                options.store_root = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--max-upload-bytes") {
            if (auto value = require_value(i, "--max-upload-bytes")) {
                std::int64_t parsed = options.max_upload_bytes;
                if (!parse_integer_in_range<std::int64_t>(*value, 1, kMaxUploadLimit, parsed)) {
                    std::cerr << "--max-upload-bytes must be within 1-" << kMaxUploadLimit << "\n";
                    return std::nullopt;
                }
                options.max_upload_bytes = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--allow-script-uploads") {
            options.reject_script_uploads = false;
        } else if (arg == "--clear") {
            options.clear = true;
        } else if (arg == "--print-catalog") {
            options.print_catalog = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateIngestOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

} // namespace IV
