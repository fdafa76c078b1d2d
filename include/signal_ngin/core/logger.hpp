// include/signal_ngin/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Warnings that don't affect operation
    ERR,      // Errors that affect operation but don't stop system
    FATAL     // Critical errors that require system shutdown
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse "TRACE" .. "FATAL"; "WARN" is accepted for WARNING
 */
std::optional<LogLevel> log_level_from_string(const std::string& name);

inline std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
    }
    return "UNKNOWN";
}

std::optional<LogDestination> log_destination_from_string(const std::string& name);

/**
 * @brief Configuration for the logger
 *
 * component_levels overrides min_level for lines tagged with a component,
 * e.g. {"JobQueue": "DEBUG", "PostgresDatabase": "WARNING"}.
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"signal_ngin"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};
    std::map<std::string, LogLevel> component_levels;

    bool writes_file() const {
        return destination == LogDestination::FILE || destination == LogDestination::BOTH;
    }

    nlohmann::json to_json() const override;

    /**
     * @throws std::invalid_argument on an unknown level or destination
     */
    void from_json(const nlohmann::json& j) override;

    Result<void> validate() const override;

    std::string section_name() const override {
        return "logging";
    }
};

/**
 * @brief Thread-safe logging singleton
 *
 * Component names and context are thread-local: each worker thread tags its
 * lines with the component that last called register_component() on it and
 * with the context of the innermost ScopedLogContext, e.g.
 * "[JobQueue] [job=rt:HOSE:1] ...".
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    /**
     * @brief Log a message with specified level
     */
    void log(LogLevel level, const std::string& message);

    /**
     * @brief Whether a line at this level from the calling thread's
     *        component would be written
     */
    bool should_log(LogLevel level) const;

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    void set_component_level(const std::string& component, LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.component_levels[component] = level;
    }

    LogLevel get_min_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Path of the file currently written, empty for console only
     */
    std::filesystem::path current_file() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_path_;
    }

    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    static const std::string& current_component() {
        return current_component_;
    }

    static const std::string& current_context() {
        return current_context_;
    }

private:
    friend class ScopedLogContext;

    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LogLevel threshold_unsafe() const;
    void enforce_retention(const std::filesystem::path& log_dir);
    void open_log_file();
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message);

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::filesystem::path current_path_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;
    static thread_local std::string current_context_;

    std::string current_session_timestamp_;  // YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

/**
 * @brief Tags the calling thread's log lines with a context for its lifetime
 *
 * Nested scopes join with a space: "job=bf:HOSE:VNM instrument=HOSE:VNM".
 */
class ScopedLogContext {
public:
    explicit ScopedLogContext(const std::string& context);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
    std::string previous_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                      \
    do {                                                                         \
        if (::signal_ngin::Logger::instance().should_log(level)) {               \
            std::ostringstream os;                                               \
            os << message;                                                       \
            ::signal_ngin::Logger::instance().log(level, os.str());              \
        }                                                                        \
    } while (0)

#define TRACE(message) LOG(::signal_ngin::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::signal_ngin::LogLevel::DEBUG, message)
#define INFO(message) LOG(::signal_ngin::LogLevel::INFO, message)
#define WARN(message) LOG(::signal_ngin::LogLevel::WARNING, message)
#define ERROR(message) LOG(::signal_ngin::LogLevel::ERR, message)
#define FATAL(message) LOG(::signal_ngin::LogLevel::FATAL, message)
}  // namespace signal_ngin
