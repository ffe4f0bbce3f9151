#include "ZlibEngine.hpp"
#include "slicecodec/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>

namespace slicecodec {
namespace archive {

using core::ErrorCode;
using core::makeError;

namespace {

// windowBits 15 + 16：gzip 头尾
constexpr int kGzipWindowBits = 15 + 16;

std::string zlibMessage(const z_stream* stream, int ret) {
    return fmt::format("{} (zlib code {})", stream->msg ? stream->msg : "no message", ret);
}

} // namespace

// ========== ZlibEngine ==========

ZlibEngine::ZlibEngine(int compression_level)
    : stream_(std::make_unique<z_stream>())
    , compression_level_(std::clamp(compression_level, 1, 9)) {
}

ZlibEngine::~ZlibEngine() {
    cleanupStream();
}

VoidResult ZlibEngine::initialize() {
    if (initialized_) {
        cleanupStream();
    }

    std::memset(stream_.get(), 0, sizeof(z_stream));

    int ret = deflateInit2(stream_.get(), compression_level_, Z_DEFLATED,
                           kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return makeError(ErrorCode::CompressionError, "Failed to initialize zlib deflate: " + std::to_string(ret));
    }

    initialized_ = true;
    finished_ = false;
    return core::success();
}

void ZlibEngine::cleanupStream() {
    if (initialized_ && stream_) {
        deflateEnd(stream_.get());
        initialized_ = false;
    }
}

VoidResult ZlibEngine::pump(int flush, std::string& out) {
    unsigned char buffer[core::Constants::kIOBufferSize];
    int ret = Z_OK;
    do {
        stream_->next_out = buffer;
        stream_->avail_out = static_cast<uInt>(sizeof(buffer));
        ret = deflate(stream_.get(), flush);
        if (ret == Z_STREAM_ERROR) {
            return makeError(ErrorCode::CompressionError, "Deflate failed: " + zlibMessage(stream_.get(), ret));
        }
        size_t produced = sizeof(buffer) - stream_->avail_out;
        out.append(reinterpret_cast<const char*>(buffer), produced);
        stats_.total_output_bytes += produced;
    } while (stream_->avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));
    return core::success();
}

VoidResult ZlibEngine::compress(const void* input, size_t input_size, std::string& out) {
    if (!initialized_ || finished_) {
        return makeError(ErrorCode::InvalidState, "Deflate stream not open");
    }
    if (input_size == 0) {
        return core::success();
    }

    auto start_time = std::chrono::steady_clock::now();

    stream_->next_in = static_cast<Bytef*>(const_cast<void*>(input));
    stream_->avail_in = static_cast<uInt>(input_size);
    auto result = pump(Z_NO_FLUSH, out);
    if (!result) {
        return result;
    }

    auto duration = std::chrono::steady_clock::now() - start_time;
    stats_.total_input_bytes += input_size;
    stats_.block_count++;
    stats_.total_time_ms += std::chrono::duration<double, std::milli>(duration).count();
    return core::success();
}

VoidResult ZlibEngine::finish(std::string& out) {
    if (!initialized_) {
        return makeError(ErrorCode::InvalidState, "Deflate stream not open");
    }
    if (finished_) {
        return core::success();
    }
    stream_->next_in = nullptr;
    stream_->avail_in = 0;
    auto result = pump(Z_FINISH, out);
    if (!result) {
        return result;
    }
    finished_ = true;
    ARCHIVE_DEBUG("gzip stream finished: {} -> {} bytes", stats_.total_input_bytes, stats_.total_output_bytes);
    return core::success();
}

// ========== ZlibDecompressor ==========

ZlibDecompressor::ZlibDecompressor()
    : stream_(std::make_unique<z_stream>()) {
}

ZlibDecompressor::~ZlibDecompressor() {
    cleanupStream();
}

VoidResult ZlibDecompressor::initialize() {
    if (initialized_) {
        cleanupStream();
    }

    std::memset(stream_.get(), 0, sizeof(z_stream));

    int ret = inflateInit2(stream_.get(), kGzipWindowBits);
    if (ret != Z_OK) {
        return makeError(ErrorCode::CompressionError, "Failed to initialize zlib inflate: " + std::to_string(ret));
    }

    initialized_ = true;
    member_open_ = false;
    return core::success();
}

void ZlibDecompressor::cleanupStream() {
    if (initialized_ && stream_) {
        inflateEnd(stream_.get());
        initialized_ = false;
    }
}

VoidResult ZlibDecompressor::decompress(const void* input, size_t input_size, std::string& out) {
    if (!initialized_) {
        return makeError(ErrorCode::InvalidState, "Inflate stream not open");
    }

    unsigned char buffer[core::Constants::kIOBufferSize];
    stream_->next_in = static_cast<Bytef*>(const_cast<void*>(input));
    stream_->avail_in = static_cast<uInt>(input_size);

    while (stream_->avail_in > 0) {
        if (!member_open_) {
            // 新的 gzip 成员（首个或前一个已结束）
            int reset = inflateReset(stream_.get());
            if (reset != Z_OK) {
                return makeError(ErrorCode::CompressionError, "Inflate reset failed: " + zlibMessage(stream_.get(), reset));
            }
            member_open_ = true;
        }

        stream_->next_out = buffer;
        stream_->avail_out = static_cast<uInt>(sizeof(buffer));
        int ret = inflate(stream_.get(), Z_NO_FLUSH);
        out.append(reinterpret_cast<const char*>(buffer), sizeof(buffer) - stream_->avail_out);

        if (ret == Z_STREAM_END) {
            member_open_ = false;
        } else if (ret == Z_BUF_ERROR) {
            // 没有进展：输出缓冲区已清空，需要更多输入
            if (stream_->avail_in > 0 && stream_->avail_out != 0) {
                return makeError(ErrorCode::FileCorrupted, "Inflate made no progress");
            }
        } else if (ret != Z_OK) {
            return makeError(ErrorCode::FileCorrupted, "Corrupt gzip data: " + zlibMessage(stream_.get(), ret));
        }
    }

    // 输入耗尽后继续排空 zlib 内部缓冲的输出
    while (member_open_) {
        stream_->next_out = buffer;
        stream_->avail_out = static_cast<uInt>(sizeof(buffer));
        int ret = inflate(stream_.get(), Z_NO_FLUSH);
        size_t produced = sizeof(buffer) - stream_->avail_out;
        out.append(reinterpret_cast<const char*>(buffer), produced);
        if (ret == Z_STREAM_END) {
            member_open_ = false;
            break;
        }
        if (ret == Z_BUF_ERROR || produced == 0) {
            break;
        }
        if (ret != Z_OK) {
            return makeError(ErrorCode::FileCorrupted, "Corrupt gzip data: " + zlibMessage(stream_.get(), ret));
        }
    }
    return core::success();
}

VoidResult ZlibDecompressor::finish() {
    if (member_open_) {
        return makeError(ErrorCode::FileCorrupted, "Truncated gzip stream");
    }
    return core::success();
}

}} // namespace slicecodec::archive
