#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace lotledger::core {

/// Install the "lotledger" logger as spdlog's default. Console output goes
/// to stderr so stdout stays free for the summary table. An empty
/// `log_file` disables the rotating file sink.
inline void init_logging(const std::string& log_level = "info",
                         const std::string& log_file = "logs/lotledger.log") {
    auto level = spdlog::level::from_str(log_level);

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if (!log_file.empty()) {
        auto parent = std::filesystem::path(log_file).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 10 * 1024 * 1024, 3);  // 10MB, 3 rotations
        file_sink->set_level(level);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("lotledger", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(level);

    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}

}  // namespace lotledger::core
