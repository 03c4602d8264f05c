#pragma once

/// @file log.hpp
/// @brief Logging utilities for sonance

#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>

// =============================================================================
// Logging Macros
// =============================================================================

#define SONANCE_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define SONANCE_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define SONANCE_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define SONANCE_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define SONANCE_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define SONANCE_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace sonance_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the logging system (basic)
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the core module logger
std::shared_ptr<spdlog::logger> core_logger();

/// Get the audio module logger
std::shared_ptr<spdlog::logger> audio_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace sonance_core
