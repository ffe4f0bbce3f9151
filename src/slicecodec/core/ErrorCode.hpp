#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace slicecodec {
namespace core {

/**
 * @brief SliceCodec统一错误码
 *
 * 双通道模型：
 * - 单个值被拒绝（类型、范围、解析失败）通过 Result<> 返回，可恢复
 * - I/O、压缩等致命错误通过异常抛出，对当前文件不可恢复
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    OutOfMemory = 2,
    InternalError = 3,
    InvalidState = 4,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileCorrupted = 22,
    FileWriteError = 23,
    FileReadError = 24,

    // 值错误 (40-59)
    TypeMismatch = 40,
    ValueRejected = 41,
    Overflow = 42,
    NoneNotAllowed = 43,
    InvalidEncoding = 44,

    // 压缩错误 (60-79)
    CompressionError = 60,
    UnknownCompression = 61,

    // 功能实现状态 (80-89)
    NotImplemented = 80
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    /**
     * @brief 是否属于单值错误（可被默认值掩盖）
     */
    bool isValueError() const noexcept {
        return code == ErrorCode::TypeMismatch || code == ErrorCode::ValueRejected ||
               code == ErrorCode::Overflow || code == ErrorCode::NoneNotAllowed ||
               code == ErrorCode::InvalidEncoding;
    }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 成功结果
 */
inline Error success() {
    return Error(ErrorCode::Ok);
}

/**
 * @brief 将错误转换为对应的异常并抛出（定义见 Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

}} // namespace slicecodec::core
