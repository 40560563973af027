// === Logging =================================================================
//
// Process-wide spdlog logger shared by every component. The transport and
// worker threads log through the same instance, so all sinks are the *_mt
// variants.

#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace drill_link {

/** @brief Create the shared logger once; later calls return the same instance. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief Shared logger; throws std::runtime_error before initialize_logger(). */
std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

}  // namespace drill_link
