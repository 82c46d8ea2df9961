#pragma once

#include <iconvault/core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace IV::Ingest {

enum class AssetKind {
    Json,
    Svg
};

// One upload as handed over by the HTTP layer. Never persisted directly.
struct UploadedAsset {
    std::string   filename;
    std::uint64_t declared_size{0};
    std::string   bytes;
};

inline constexpr std::uint64_t kMaxUploadBytes = 5ull * 1024ull * 1024ull;

[[nodiscard]] auto AssetKindName(AssetKind kind) -> std::string_view;

[[nodiscard]] auto AllowedMimeTypes(AssetKind kind) -> std::span<std::string_view const>;

// Content-based MIME detection; the declared Content-Type is never consulted.
[[nodiscard]] auto SniffMimeType(std::string_view bytes) -> std::string_view;

[[nodiscard]] auto FileExtension(std::string_view filename) -> std::string;

/*
 * Checks, in order: size ceiling, empty content, filename extension, sniffed
 * MIME type. max_bytes is clamped to kMaxUploadBytes.
 */
[[nodiscard]] auto ValidateUpload(UploadedAsset const& asset,
                                  AssetKind            expected,
                                  std::uint64_t        max_bytes = kMaxUploadBytes) -> Expected<void>;

} // namespace IV::Ingest
