#include "slicecodec/core/ErrorCode.hpp"

namespace slicecodec {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::OutOfMemory:
            return "Out of memory";
        case ErrorCode::InternalError:
            return "Internal error";
        case ErrorCode::InvalidState:
            return "Invalid state";

        // 文件操作错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileAccessDenied:
            return "File access denied";
        case ErrorCode::FileCorrupted:
            return "File corrupted";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";

        // 值错误
        case ErrorCode::TypeMismatch:
            return "Type mismatch";
        case ErrorCode::ValueRejected:
            return "Value rejected";
        case ErrorCode::Overflow:
            return "Value out of range";
        case ErrorCode::NoneNotAllowed:
            return "None not allowed";
        case ErrorCode::InvalidEncoding:
            return "Invalid text encoding";

        // 压缩错误
        case ErrorCode::CompressionError:
            return "Compression error";
        case ErrorCode::UnknownCompression:
            return "Unknown compression";

        case ErrorCode::NotImplemented:
            return "Feature not implemented";

        default:
            return "Unknown error";
    }
}

}} // namespace slicecodec::core
