#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace IV {

struct IngestOptions {
    std::optional<std::string> selection_path;
    std::optional<std::string> sprite_path;
    std::string                store_backend{"file"};
    std::string                store_root{"iconvault-data"};
    std::int64_t               max_upload_bytes{5 * 1024 * 1024};
    bool                       reject_script_uploads{true};
    bool                       clear{false};
    bool                       print_catalog{false};
    bool                       show_help{false};
};

auto ParseIngestArguments(int argc, char** argv) -> std::optional<IngestOptions>;

void PrintIngestUsage();

bool ApplyIngestEnvOverrides(IngestOptions& options);

auto ValidateIngestOptions(IngestOptions const& options) -> std::optional<std::string>;

bool IsValidStoreBackend(std::string_view backend);

} // namespace IV
