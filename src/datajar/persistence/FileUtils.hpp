#pragma once

#include "core/Error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace DJ::FileUtils {

// Writes through a sibling ".tmp" file and renames it over `path`.
[[nodiscard]] auto writeTextFileAtomic(std::filesystem::path const& path, std::string_view text, bool fsyncData) -> Expected<void>;

// NotFound when the file does not exist, IoError when it cannot be read.
[[nodiscard]] auto readTextFile(std::filesystem::path const& path) -> Expected<std::string>;

void removePathIfExists(std::filesystem::path const& path);

} // namespace DJ::FileUtils
