#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace wledbackup {

// Installs the process-wide default logger. Synchronous on purpose: progress lines of a
// one-shot run have to come out in program order.
class Logger {
public:
    using Level = spdlog::level::level_enum;

    explicit Logger(Level level, const std::filesystem::path& filepath = {}) {
        auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        /* more about pattern:
         * https://github.com/gabime/spdlog/wiki/3.-Custom-formatting
         */
        stdout_sink->set_pattern("%^[%l]%$ %v");

        std::vector<spdlog::sink_ptr> sinks{stdout_sink};
        if (!filepath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filepath.string(),
                                                                                 false);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [thread %t] %v");
            sinks.push_back(file_sink);
        }

        logger_ = std::make_shared<spdlog::logger>("wled-backup", sinks.begin(), sinks.end());
        logger_->set_level(level);
        logger_->flush_on(Level::warn);
        logger_->set_error_handler(
            [](const std::string& msg) { std::fprintf(stderr, "*** LOGGER ERROR ***: %s\n", msg.c_str()); });
        spdlog::set_default_logger(logger_);
    }

    // Unknown names map to info.
    static Level ParseLevel(const std::string& name) {
        if (name == "warning") {
            return Level::warn;
        }
        auto level = spdlog::level::from_str(name);
        if (level == Level::off && name != "off") {
            return Level::info;
        }
        return level;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger() {
        logger_->flush();
        spdlog::shutdown();
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace wledbackup
