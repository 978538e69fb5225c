#include "Logger.hpp"
#include <utility>
#include <vector>
#include "Config.hpp"
#include "util/FileUtils.hpp"

namespace pa {

namespace {

constexpr std::size_t kMaxLogBytes = 2 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 2;

spdlog::level::level_enum levelFor(bool debug) {
    return debug ? spdlog::level::debug : spdlog::level::info;
}

} // namespace

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::init(std::string_view appName,
                  bool debug,
                  const std::filesystem::path& logFile) {
    const std::string name(appName);
    shutdown();
    spdlog::drop(name);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("%^[%l]%$ %v");
        sinks.push_back(console);

        if (!logFile.empty()) {
            if (!file::ensureDir(logFile.parent_path()))
                throw spdlog::spdlog_ex("cannot create " +
                                        logFile.parent_path().string());
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile.string(), kMaxLogBytes, kMaxLogFiles);
            sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
            sinks.push_back(sink);
        }

        logger_ = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger_->set_level(levelFor(debug));
        logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger_);

        LOG_DEBUG("Logger: {} ready (debug: {}, file: '{}')",
                  name,
                  debug,
                  logFile.string());
    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop(name);
        logger_ = spdlog::stderr_color_mt(name);
        logger_->set_level(levelFor(debug));
        logger_->warn("Logger: file sink unavailable, using stderr only: {}",
                      ex.what());
    }
}

void Logger::initFromConfig() {
    const auto& cfg = std::as_const(Config::instance());
    init("phonalign", cfg.debug(), cfg.log().file);
}

void Logger::shutdown() {
    if (!logger_)
        return;
    logger_->flush();
    spdlog::drop(logger_->name());
    logger_.reset();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_)
        initFromConfig();
    return logger_;
}

} // namespace pa
