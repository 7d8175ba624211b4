#include "Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>

namespace fs = std::filesystem;

namespace {
constexpr const char* kLoggerName = "landfall";
std::shared_ptr<spdlog::logger> g_logger;

void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%n][%l] %v");
    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);
    g_logger = std::move(logger);
}
}

void landfall::logsys::init_console_logs(spdlog::level::level_enum level) {
    // stderr keeps stdout clean for tool output
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    install(std::make_shared<spdlog::logger>(kLoggerName, sink), level);
}

void landfall::logsys::init_file_logs(const fs::path& dir, spdlog::level::level_enum level) {
    std::error_code ec; fs::create_directories(dir, ec);
    auto file = (dir / "landfall.log").string();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4); // 1MB * 4
    // warnings and errors still reach the terminal
    auto errSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    errSink->set_level(spdlog::level::warn);
    const spdlog::sinks_init_list sinks{fileSink, errSink};
    install(std::make_shared<spdlog::logger>(kLoggerName, sinks), level);
    g_logger->info("Logging started");
}

std::shared_ptr<spdlog::logger> landfall::logsys::get() {
    if (!g_logger)
        init_console_logs(spdlog::level::warn);
    return g_logger;
}
