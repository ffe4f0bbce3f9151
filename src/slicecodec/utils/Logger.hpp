#pragma once

#include <atomic>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace slicecodec {

/**
 * @brief 进程级日志器
 *
 * 控制台输出到 stderr，可选文件输出并按大小轮转。
 * 未显式初始化时首次写日志会以默认参数（仅控制台、WARN 级别）初始化。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志器（只生效一次，shutdown() 后可重新初始化）
     * @param log_file_path 日志文件路径，空字符串表示不写文件
     * @param level 最低输出级别
     * @param enable_console 是否输出到 stderr
     * @param max_file_size 单个文件最大字节数，超过后轮转
     * @param max_files 保留的轮转文件数量
     * @param write_mode 覆盖或追加
     */
    void initialize(const std::string& log_file_path = "",
                    Level level = Level::WARN,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;

    bool shouldLog(Level level) const;

    /**
     * @brief 写一条已格式化的日志
     */
    void log(Level level, const std::string& message);

    template<typename... Args>
    void logf(Level level, const char* file, int line, const char* func,
              const std::string& fmt_str, const Args&... args) {
        if (!shouldLog(level)) return;
        std::string body;
        try {
            body = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            // 格式串与参数不匹配时保留原始格式串，避免丢日志
            body = fmt_str + " <format error: " + e.what() + ">";
        }
        log(level, fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func, body));
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logToConsole(Level level, const std::string& message);
    void logToFile(const std::string& message);
    std::string formatMessage(Level level, const std::string& message) const;
    static const char* levelToString(Level level);
    void rotateFileIfNeeded();
    std::string rotatedFilename(size_t index) const;

    // 提取文件名（去除路径）
    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash = std::strrchr(path, '/');
        return slash ? slash + 1 : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::WARN};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
};

} // namespace slicecodec

// 统一日志宏（带源码位置信息）
#define SLICECODEC_LOG_AT(level, fmt, ...) \
    ::slicecodec::Logger::getInstance().logf(level, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define SLICECODEC_LOG_TRACE(fmt, ...)    SLICECODEC_LOG_AT(::slicecodec::Logger::Level::TRACE, fmt, ##__VA_ARGS__)
#define SLICECODEC_LOG_DEBUG(fmt, ...)    SLICECODEC_LOG_AT(::slicecodec::Logger::Level::DEBUG, fmt, ##__VA_ARGS__)
#define SLICECODEC_LOG_INFO(fmt, ...)     SLICECODEC_LOG_AT(::slicecodec::Logger::Level::INFO, fmt, ##__VA_ARGS__)
#define SLICECODEC_LOG_WARN(fmt, ...)     SLICECODEC_LOG_AT(::slicecodec::Logger::Level::WARN, fmt, ##__VA_ARGS__)
#define SLICECODEC_LOG_ERROR(fmt, ...)    SLICECODEC_LOG_AT(::slicecodec::Logger::Level::ERROR, fmt, ##__VA_ARGS__)
#define SLICECODEC_LOG_CRITICAL(fmt, ...) SLICECODEC_LOG_AT(::slicecodec::Logger::Level::CRITICAL, fmt, ##__VA_ARGS__)
