#pragma once

#include <iconvault/core/Error.hpp>

#include <filesystem>
#include <string>

namespace IV::Utils {

[[nodiscard]] auto fsyncFileDescriptor(int fd) -> Expected<void>;
[[nodiscard]] auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void>;

// Writes `<path>.tmp` then renames it over `path`; parent directories are created.
[[nodiscard]] auto writeTextFileAtomic(std::filesystem::path const& path,
                                       std::string const& text,
                                       bool fsyncData) -> Expected<void>;

// NotFound when the file does not exist.
[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

// Succeeds when the file is already absent.
[[nodiscard]] auto removeFileIfExists(std::filesystem::path const& path) -> Expected<void>;

} // namespace IV::Utils
