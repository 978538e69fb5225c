#include "Config.hpp"
#include "ConfigLoader.hpp"

namespace pa {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<void> Config::load(const fs::path& path) {
    std::lock_guard lock(mutex_);
    configPath_ = path;
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadFromString(std::string_view text) {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadFromString(*this, text);
}

Result<void> Config::save(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    return ConfigLoader::save(*this, path);
}

void Config::reset() {
    std::lock_guard lock(mutex_);
    configPath_.clear();
    debug_ = false;
    alignment_ = {};
    frames_ = {};
    textgrid_ = {};
    json_ = {};
    log_ = {};
    dirty_ = false;
}

std::string_view toString(FrameRounding rounding) {
    switch (rounding) {
    case FrameRounding::HalfUp:
        return "half_up";
    case FrameRounding::HalfEven:
        return "half_even";
    case FrameRounding::Floor:
        return "floor";
    }
    return "half_up";
}

std::optional<FrameRounding> frameRoundingFromString(std::string_view name) {
    if (name == "half_up")
        return FrameRounding::HalfUp;
    if (name == "half_even")
        return FrameRounding::HalfEven;
    if (name == "floor")
        return FrameRounding::Floor;
    return std::nullopt;
}

} // namespace pa
