#include "Logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace b2core {

void setup_logging(const LoggingConfig& cfg) {
    const auto level = spdlog::level::from_str(cfg.level);
    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    // B. Rotating File Sink (Max 5MB, 3 files)
    if (!cfg.file.empty()) {
        constexpr size_t MAX_SIZE = 1024 * 1024 * 5;
        constexpr size_t MAX_FILES = 3;
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file, MAX_SIZE, MAX_FILES);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    // C. Register Logger
    auto logger = std::make_shared<spdlog::logger>("b2core", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::flush_on(level);
}

}  // namespace b2core
