// src/core/logger.cpp

#include "signal_ngin/core/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>
#include "signal_ngin/core/time_utils.hpp"

namespace signal_ngin {

thread_local std::string Logger::current_component_;
thread_local std::string Logger::current_context_;

namespace {

std::string format_local_time(const char* format) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm time_info;
    core::safe_localtime(&now_c, &time_info);

    char time_str[32];
    std::strftime(time_str, sizeof(time_str), format, &time_info);
    return std::string(time_str);
}

LogLevel parse_level(const std::string& name) {
    auto level = log_level_from_string(name);
    if (!level) {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return *level;
}

}  // namespace

std::optional<LogLevel> log_level_from_string(const std::string& name) {
    static const std::map<std::string, LogLevel> lookup = {
        {"TRACE", LogLevel::TRACE}, {"DEBUG", LogLevel::DEBUG},     {"INFO", LogLevel::INFO},
        {"WARN", LogLevel::WARNING}, {"WARNING", LogLevel::WARNING}, {"ERROR", LogLevel::ERR},
        {"FATAL", LogLevel::FATAL}};

    auto it = lookup.find(name);
    if (it == lookup.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<LogDestination> log_destination_from_string(const std::string& name) {
    if (name == "CONSOLE")
        return LogDestination::CONSOLE;
    if (name == "FILE")
        return LogDestination::FILE;
    if (name == "BOTH")
        return LogDestination::BOTH;
    return std::nullopt;
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;

    nlohmann::json levels = nlohmann::json::object();
    for (const auto& [component, level] : component_levels) {
        levels[component] = level_to_string(level);
    }
    j["component_levels"] = levels;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    std::string name;
    if (read_field(j, "min_level", name)) {
        min_level = parse_level(name);
    }
    if (read_field(j, "destination", name)) {
        auto dest = log_destination_from_string(name);
        if (!dest) {
            throw std::invalid_argument("Unknown log destination: " + name);
        }
        destination = *dest;
    }
    read_field(j, "log_directory", log_directory);
    read_field(j, "filename_prefix", filename_prefix);
    read_field(j, "include_timestamp", include_timestamp);
    read_field(j, "include_level", include_level);
    read_field(j, "max_file_size", max_file_size);
    read_field(j, "max_files", max_files);

    std::map<std::string, std::string> levels;
    if (read_field(j, "component_levels", levels)) {
        component_levels.clear();
        for (const auto& [component, level] : levels) {
            component_levels[component] = parse_level(level);
        }
    }
}

Result<void> LoggerConfig::validate() const {
    if (writes_file()) {
        if (log_directory.empty() || filename_prefix.empty()) {
            return invalid("file logging needs log_directory and filename_prefix");
        }
        if (max_file_size == 0 || max_files == 0) {
            return invalid("max_file_size and max_files must be positive");
        }
    }
    return Result<void>();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_ = false;
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.config_ = LoggerConfig();
    logger.current_path_.clear();
    logger.current_session_timestamp_.clear();
    logger.current_part_number_ = 1;
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }
    current_path_.clear();

    if (config_.writes_file()) {
        std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory: " + log_dir.string() +
                                     " - " + ec.message());
        }

        enforce_retention(log_dir);

        current_session_timestamp_ = format_local_time("%Y%m%d_%H%M%S");
        current_part_number_ = 1;
        open_log_file();

        if (!log_file_.is_open()) {
            throw std::runtime_error("Failed to open log file " + current_path_.string());
        }
    }

    initialized_.store(true, std::memory_order_release);
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

bool Logger::should_log(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= threshold_unsafe();
}

LogLevel Logger::threshold_unsafe() const {
    if (!current_component_.empty()) {
        auto it = config_.component_levels.find(current_component_);
        if (it != config_.component_levels.end()) {
            return it->second;
        }
    }
    return config_.min_level;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (level < threshold_unsafe()) {
        return;
    }

    std::string formatted_message = format_message(level, message);

    if (config_.destination != LogDestination::FILE) {
        write_to_console_unsafe(formatted_message);
    }
    if (config_.writes_file()) {
        write_to_file_unsafe(formatted_message);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << format_local_time("%Y-%m-%d %H:%M:%S") << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    if (!current_context_.empty()) {
        ss << "[" << current_context_ << "] ";
    }

    ss << message;
    return ss.str();
}

void Logger::write_to_console_unsafe(const std::string& message) {
    std::cout << message << std::endl;
}

void Logger::write_to_file_unsafe(const std::string& message) {
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << message << std::endl;

    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        rotate_log_files();
    }
}

void Logger::enforce_retention(const std::filesystem::path& log_dir) {
    // Only this process's files count; other prefixes in a shared directory stay
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        const auto filename = entry.path().filename().string();
        if (entry.is_regular_file() && entry.path().extension() == ".log" &&
            filename.rfind(config_.filename_prefix + "_", 0) == 0) {
            log_files.push_back(entry.path());
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::error_code ec;
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

void Logger::open_log_file() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

    // prefix_YYYYMMDD_HHMMSS_partN.log
    current_path_ = log_dir / (config_.filename_prefix + "_" + current_session_timestamp_ +
                               "_part" + std::to_string(current_part_number_) + ".log");

    log_file_.open(current_path_, std::ios::app);
}

void Logger::rotate_log_files() {
    log_file_.close();
    enforce_retention(std::filesystem::absolute(config_.log_directory));
    current_part_number_++;
    open_log_file();
}

ScopedLogContext::ScopedLogContext(const std::string& context)
    : previous_(Logger::current_context_) {
    Logger::current_context_ =
        previous_.empty() ? context : previous_ + " " + context;
}

ScopedLogContext::~ScopedLogContext() {
    Logger::current_context_ = previous_;
}

}  // namespace signal_ngin
