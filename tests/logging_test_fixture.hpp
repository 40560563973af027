#pragma once

#include "drill_link/logging.hpp"

#include <filesystem>
#include <memory>

namespace drill_link::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "drill_link_tests_logs";
        auto logger = drill_link::initialize_logger(log_dir.string());
        logger->set_level(spdlog::level::warn);
        return logger;
    }();
    (void)logger_handle;
}

}  // namespace drill_link::test
