/**
 * @file ConfigLoader.hpp
 * @brief TOML <-> Config transfer.
 *
 * Reads settings from a TOML file or an in-memory TOML string into the Config
 * singleton and writes the current settings back. Files are replaced through
 * a temporary file so a failed save leaves the previous file intact. A TOML
 * syntax error is reported as ErrorCode::Format, an unwritable target as
 * ErrorCode::Io.
 *
 * @section Dependencies
 * - toml++
 * - ConfigParsers
 */

#pragma once
#include <toml++/toml.h>
#include <filesystem>
#include <string_view>
#include "util/Result.hpp"

namespace pa {

class Config;

class ConfigLoader {
public:
    static Result<void> load(Config& config, const std::filesystem::path& path);
    static Result<void> loadFromString(Config& config, std::string_view text);
    static Result<void> save(const Config& config,
                             const std::filesystem::path& path);

private:
    // Copies every known section of tbl into config and marks it clean
    static void apply(Config& config, const toml::table& tbl);
};

} // namespace pa
