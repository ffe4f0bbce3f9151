#include "Logger.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <thread>
#include <fmt/chrono.h>

namespace slicecodec {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files,
                        WriteMode write_mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_.load()) {
        return;
    }

    current_level_.store(level);
    enable_console_.store(enable_console);
    log_file_path_ = log_file_path;
    max_file_size_ = max_file_size;
    max_files_ = max_files == 0 ? 1 : max_files;
    shutting_down_.store(false);

    if (!log_file_path_.empty()) {
        std::error_code ec;
        std::filesystem::path log_dir = std::filesystem::path(log_file_path_).parent_path();
        if (!log_dir.empty()) {
            std::filesystem::create_directories(log_dir, ec);
        }
        if (ec) {
            std::cerr << "Logger: cannot create log directory " << log_dir << ": " << ec.message() << std::endl;
        }

        std::ios::openmode open_mode = (write_mode == WriteMode::APPEND)
                                           ? (std::ios::out | std::ios::app)
                                           : (std::ios::out | std::ios::trunc);
        file_stream_.open(log_file_path_, open_mode);
        current_file_size_ = 0;
        if (file_stream_.is_open() && write_mode == WriteMode::APPEND) {
            file_stream_.seekp(0, std::ios::end);
            current_file_size_ = static_cast<size_t>(file_stream_.tellp());
        }
        if (!file_stream_.is_open()) {
            std::cerr << "Logger: cannot open log file " << log_file_path_ << std::endl;
        }
    }

    initialized_.store(true);
}

void Logger::setLevel(Level level) {
    current_level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return current_level_.load();
}

bool Logger::shouldLog(Level level) const {
    return level != Level::OFF &&
           static_cast<int>(level) >= static_cast<int>(current_level_.load()) &&
           !shutting_down_.load();
}

void Logger::log(Level level, const std::string& message) {
    if (!shouldLog(level)) return;

    if (!initialized_.load()) {
        initialize();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;

    std::string formatted_message = formatMessage(level, message);
    if (enable_console_.load()) {
        logToConsole(level, formatted_message);
    }
    logToFile(formatted_message);

    // 错误级别立即落盘
    if (level >= Level::ERROR && file_stream_.is_open()) {
        file_stream_.flush();
    }
}

void Logger::logToConsole(Level level, const std::string& message) {
    const char* color_code = "\033[0m";
    switch (level) {
        case Level::TRACE:    color_code = "\033[37m"; break; // 白色
        case Level::DEBUG:    color_code = "\033[36m"; break; // 青色
        case Level::INFO:     color_code = "\033[32m"; break; // 绿色
        case Level::WARN:     color_code = "\033[33m"; break; // 黄色
        case Level::ERROR:    color_code = "\033[31m"; break; // 红色
        case Level::CRITICAL: color_code = "\033[35m"; break; // 紫色
        default: break;
    }
    std::cerr << color_code << message << "\033[0m" << '\n';
}

void Logger::logToFile(const std::string& message) {
    if (!file_stream_.is_open()) {
        return;
    }

    rotateFileIfNeeded();

    file_stream_ << message << '\n';
    current_file_size_ += message.length() + 1;
}

void Logger::rotateFileIfNeeded() {
    if (current_file_size_ < max_file_size_) {
        return;
    }

    file_stream_.close();

    std::error_code ec;
    for (size_t i = max_files_ - 1; i > 0; --i) {
        std::string old_file = rotatedFilename(i - 1);
        if (std::filesystem::exists(old_file, ec)) {
            std::filesystem::rename(old_file, rotatedFilename(i), ec);
        }
    }

    file_stream_.open(log_file_path_, std::ios::out | std::ios::trunc);
    current_file_size_ = 0;
}

std::string Logger::rotatedFilename(size_t index) const {
    if (index == 0) {
        return log_file_path_;
    }
    return fmt::format("{}.{}", log_file_path_, index);
}

std::string Logger::formatMessage(Level level, const std::string& message) const {
    std::ostringstream thread_id;
    thread_id << std::this_thread::get_id();
    auto now = std::chrono::system_clock::now();
    return fmt::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}",
                       now, levelToString(level), thread_id.str(), message);
}

const char* Logger::levelToString(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO ";
        case Level::WARN:     return "WARN ";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT ";
        default:              return "UNKN ";
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::cerr.flush();
}

void Logger::shutdown() {
    shutting_down_.store(true);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
    initialized_.store(false);
}

Logger::~Logger() {
    shutdown();
}

} // namespace slicecodec
