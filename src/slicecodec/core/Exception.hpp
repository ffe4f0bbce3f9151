/**
 * @file Exception.hpp
 * @brief SliceCodec异常类定义
 */

#ifndef SLICECODEC_EXCEPTION_HPP
#define SLICECODEC_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace slicecodec {
namespace core {

/**
 * @brief SliceCodec基础异常类
 */
class SliceCodecException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    SliceCodecException(const std::string& message,
                        ErrorCode code = ErrorCode::InternalError,
                        const char* file = nullptr,
                        int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息（错误码、位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常（打开、读写、刷新、压缩流）
 *
 * 对写入端是致命错误：写入器进入失败状态，不再接受写入。
 */
class FileException : public SliceCodecException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常（未知选项、非法类型名、非法默认值）
 */
class ParameterException : public SliceCodecException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 单值异常 - Result<> 中的值错误经 valueOrThrow() 转换而来
 */
class ValueException : public SliceCodecException {
public:
    ValueException(const std::string& message,
                   ErrorCode code = ErrorCode::ValueRejected,
                   const char* file = nullptr, int line = 0);
};

/**
 * @brief 操作相关异常（在错误状态下调用）
 */
class OperationException : public SliceCodecException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidState,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

} // namespace core
} // namespace slicecodec

// 便捷宏定义（自动附带源码位置）
#define SLICECODEC_THROW_PARAM(message, parameter) \
    throw ::slicecodec::core::ParameterException(message, parameter, __FILE__, __LINE__)

#define SLICECODEC_THROW_FILE(message, filename, code) \
    throw ::slicecodec::core::FileException(message, filename, code, __FILE__, __LINE__)

#define SLICECODEC_THROW_OP(message, operation) \
    throw ::slicecodec::core::OperationException(message, operation, \
                                                 ::slicecodec::core::ErrorCode::InvalidState, __FILE__, __LINE__)

#endif // SLICECODEC_EXCEPTION_HPP
