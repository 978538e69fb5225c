#include "ConfigParsers.hpp"
#include <algorithm>
#include <cstdlib>
#include "Logger.hpp"

namespace pa {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto val = node.value<double>())
                return static_cast<T>(*val);
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>())
                return static_cast<T>(*val);
        }
    }
    return defaultVal;
}

fs::path expandPath(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            p = std::string(home) + p.substr(1);
        }
    }
    return fs::path(p);
}
} // namespace

void ConfigParsers::parseAlignment(const toml::table& tbl,
                                   AlignmentConfig& cfg) {
    if (auto align = tbl["alignment"].as_table()) {
        cfg.contiguityTolerance =
                std::clamp(get(*align, "contiguity_tolerance", 1e-4), 0.0, 1e-2);
    }
}

void ConfigParsers::parseFrames(const toml::table& tbl, FrameConfig& cfg) {
    if (auto frames = tbl["frames"].as_table()) {
        auto name = get(*frames, "rounding", std::string(toString(cfg.rounding)));
        if (auto rounding = frameRoundingFromString(name)) {
            cfg.rounding = *rounding;
        } else {
            LOG_WARN("Unknown frame rounding '{}', keeping '{}'",
                     name,
                     toString(cfg.rounding));
        }
    }
}

void ConfigParsers::parseTextGrid(const toml::table& tbl, TextGridConfig& cfg) {
    if (auto tg = tbl["textgrid"].as_table()) {
        cfg.silenceMark = get(*tg, "silence_mark", std::string("sil"));
    }
}

void ConfigParsers::parseJson(const toml::table& tbl, JsonConfig& cfg) {
    if (auto json = tbl["json"].as_table()) {
        cfg.indent = get(*json, "indent", true);
    }
}

void ConfigParsers::parseLog(const toml::table& tbl, LogConfig& cfg) {
    if (auto log = tbl["log"].as_table()) {
        auto path = get(*log, "file", std::string());
        cfg.file = path.empty() ? fs::path() : expandPath(path);
    }
}

toml::table ConfigParsers::serialize(const AlignmentConfig& alignment,
                                     const FrameConfig& frames,
                                     const TextGridConfig& textgrid,
                                     const JsonConfig& json,
                                     const LogConfig& log,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});

    root.insert("alignment",
                toml::table{{"contiguity_tolerance",
                             (double)alignment.contiguityTolerance}});

    root.insert("frames",
                toml::table{{"rounding", std::string(toString(frames.rounding))}});

    root.insert("textgrid",
                toml::table{{"silence_mark", textgrid.silenceMark}});

    root.insert("json", toml::table{{"indent", json.indent}});

    root.insert("log", toml::table{{"file", log.file.string()}});

    return root;
}

} // namespace pa
