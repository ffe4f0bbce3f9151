/**
 * @file Exception.cpp
 * @brief SliceCodec异常类实现
 */

#include "Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace slicecodec {
namespace core {

// SliceCodecException 实现
SliceCodecException::SliceCodecException(const std::string& message,
                                         ErrorCode code,
                                         const char* file,
                                         int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string SliceCodecException::getErrorCodeString() const {
    switch (error_code_) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileAccessDenied: return "FileAccessDenied";
        case ErrorCode::FileCorrupted: return "FileCorrupted";
        case ErrorCode::FileWriteError: return "FileWriteError";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::TypeMismatch: return "TypeMismatch";
        case ErrorCode::ValueRejected: return "ValueRejected";
        case ErrorCode::Overflow: return "Overflow";
        case ErrorCode::NoneNotAllowed: return "NoneNotAllowed";
        case ErrorCode::InvalidEncoding: return "InvalidEncoding";
        case ErrorCode::CompressionError: return "CompressionError";
        case ErrorCode::UnknownCompression: return "UnknownCompression";
        case ErrorCode::NotImplemented: return "NotImplemented";
        default: return "Unknown";
    }
}

std::string SliceCodecException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void SliceCodecException::addContext(const std::string& context) {
    context_.push_back(context);
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : SliceCodecException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : SliceCodecException(parameter_name.empty()
                              ? message
                              : fmt::format("{} (parameter: {})", message, parameter_name),
                          ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// ValueException 实现
ValueException::ValueException(const std::string& message,
                               ErrorCode code, const char* file, int line)
    : SliceCodecException(message, code, file, line) {
}

// OperationException 实现
OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : SliceCodecException(fmt::format("{} (operation: {})", message, operation), code, file, line)
    , operation_(operation) {
}

// Expected::valueOrThrow() 使用的错误到异常映射
void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::UnknownCompression:
            throw ParameterException(error.fullMessage());
        case ErrorCode::FileNotFound:
        case ErrorCode::FileAccessDenied:
        case ErrorCode::FileCorrupted:
        case ErrorCode::FileWriteError:
        case ErrorCode::FileReadError:
        case ErrorCode::CompressionError:
            throw FileException(error.message, error.context, error.code);
        case ErrorCode::InvalidState:
            throw OperationException(error.message, error.context, error.code);
        default:
            if (error.isValueError()) {
                throw ValueException(error.fullMessage(), error.code);
            }
            throw SliceCodecException(error.fullMessage(), error.code);
    }
}

} // namespace core
} // namespace slicecodec
