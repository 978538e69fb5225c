/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * This file defines the Config class which provides a singleton for accessing
 * and modifying library settings. It delegates parsing to ConfigParsers and
 * file I/O to ConfigLoader. Settings only change when the host loads a file
 * or edits a section; the library itself never writes them.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 * - Thread-Safe: Mutex-protected load and save.
 */

#pragma once
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace pa {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> loadFromString(std::string_view text);
    Result<void> save(const fs::path& path) const;

    // Restores built-in defaults
    void reset();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    // Section accessors (const)
    const AlignmentConfig& alignment() const {
        return alignment_;
    }
    const FrameConfig& frames() const {
        return frames_;
    }
    const TextGridConfig& textgrid() const {
        return textgrid_;
    }
    const JsonConfig& json() const {
        return json_;
    }
    const LogConfig& log() const {
        return log_;
    }

    // Section accessors (mutable)
    AlignmentConfig& alignment() {
        markDirty();
        return alignment_;
    }
    FrameConfig& frames() {
        markDirty();
        return frames_;
    }
    TextGridConfig& textgrid() {
        markDirty();
        return textgrid_;
    }
    JsonConfig& json() {
        markDirty();
        return json_;
    }
    LogConfig& log() {
        markDirty();
        return log_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    AlignmentConfig alignment_;
    FrameConfig frames_;
    TextGridConfig textgrid_;
    JsonConfig json_;
    LogConfig log_;

    mutable std::mutex mutex_;
};

#define CONFIG pa::Config::instance()

} // namespace pa
