/**
 * @file FileUtils.hpp
 * @brief Small filesystem helpers.
 *
 * Whole-file reads and atomic whole-file writes used by the codec layer and
 * the config loader. All failures are reported as ErrorCode::Io.
 *
 * @section Dependencies
 * - std::filesystem
 */

#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include "util/Result.hpp"

namespace pa::file {

namespace fs = std::filesystem;

Result<std::string> readText(const fs::path& path);

// Writes to "<path>.tmp" and renames over the target
Result<void> writeText(const fs::path& path, std::string_view content);

bool ensureDir(const fs::path& dir);

// Extension without the leading dot, lower-cased ("TextGrid" -> "textgrid")
std::string extensionOf(const fs::path& path);

std::string toLower(std::string_view s);

} // namespace pa::file
