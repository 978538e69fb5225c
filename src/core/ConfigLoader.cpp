#include "ConfigLoader.hpp"
#include <sstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace pa {

void ConfigLoader::apply(Config& config, const toml::table& tbl) {
    if (auto gen = tbl["general"].as_table()) {
        config.setDebug((*gen)["debug"].value_or(false));
    }

    ConfigParsers::parseAlignment(tbl, config.alignment());
    ConfigParsers::parseFrames(tbl, config.frames());
    ConfigParsers::parseTextGrid(tbl, config.textgrid());
    ConfigParsers::parseJson(tbl, config.json());
    ConfigParsers::parseLog(tbl, config.log());

    config.markClean();
}

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());
        apply(config, tbl);
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(ErrorCode::Format,
                                 std::string("Config parse error: ") +
                                         err.what());
    }
}

Result<void> ConfigLoader::loadFromString(Config& config, std::string_view text) {
    try {
        auto tbl = toml::parse(text);
        apply(config, tbl);
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(ErrorCode::Format,
                                 std::string("Config parse error: ") +
                                         err.what());
    }
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    try {
        auto tbl = ConfigParsers::serialize(config.alignment(),
                                            config.frames(),
                                            config.textgrid(),
                                            config.json(),
                                            config.log(),
                                            config.debug());
        std::ostringstream ss;
        ss << tbl;

        auto written = file::writeText(path, ss.str());
        if (!written) {
            LOG_ERROR("Failed to save config: {}", written.error().message);
            return written;
        }
        LOG_DEBUG("Config saved to: {}", path.string());
        return Result<void>::ok();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save config: {}", e.what());
        return Result<void>::err(ErrorCode::Io,
                                 std::string("Failed to save config: ") +
                                         e.what());
    }
}

} // namespace pa
