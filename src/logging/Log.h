#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace landfall::logsys {
    void init_console_logs(spdlog::level::level_enum level = spdlog::level::info);
    void init_file_logs(const std::filesystem::path& dir,
                        spdlog::level::level_enum level = spdlog::level::debug); // rotates landfall.log in `dir`, warnings also to stderr
    std::shared_ptr<spdlog::logger> get();  // "landfall", created on first use if no init ran
}
