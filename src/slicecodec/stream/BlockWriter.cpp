#include "slicecodec/stream/BlockWriter.hpp"
#include "slicecodec/core/Exception.hpp"
#include "slicecodec/utils/ModuleLoggers.hpp"

#include <algorithm>

namespace slicecodec {
namespace stream {

namespace {

std::unique_ptr<archive::CompressionEngine> makeEngine(archive::CompressionEngine::Backend backend, int level) {
    auto engine = archive::CompressionEngine::create(backend, level);
    if (!engine) {
        core::throwError(engine.error());
    }
    return std::move(engine).value();
}

} // namespace

BlockWriter::BlockWriter(const std::string& path,
                         archive::CompressionEngine::Backend backend,
                         int compression_level)
    : file_(path, "wb")
    , engine_(makeEngine(backend, compression_level)) {
    block_.reserve(core::Constants::kBlockSize);
    STREAM_DEBUG("Opened block writer {} ({})", path, engine_->name());
}

BlockWriter::~BlockWriter() {
    if (failed_ || closed_) {
        return;
    }
    try {
        close();
    } catch (const core::SliceCodecException& e) {
        STREAM_ERROR("Failed to close {} during destruction: {}", file_.path(), e.what());
    }
}

void BlockWriter::fail() {
    failed_ = true;
    closed_ = true;
    block_.clear();
    compressed_.clear();
    file_.discard();
}

void BlockWriter::write(const void* data, size_t size) {
    if (failed_) {
        SLICECODEC_THROW_OP("Write to failed block stream " + file_.path(), "write");
    }
    if (closed_) {
        SLICECODEC_THROW_OP("Write to closed block stream " + file_.path(), "write");
    }
    const auto* in = static_cast<const char*>(data);
    try {
        while (size > 0) {
            size_t take = std::min(size, core::Constants::kBlockSize - block_.size());
            block_.append(in, take);
            in += take;
            size -= take;
            bytes_written_ += take;
            if (block_.size() == core::Constants::kBlockSize) {
                flushBlock();
            }
        }
    } catch (const core::FileException& e) {
        STREAM_ERROR("Block stream {} failed: {}", file_.path(), e.what());
        fail();
        throw;
    }
}

void BlockWriter::flushBlock() {
    if (block_.empty()) {
        return;
    }
    auto result = engine_->compress(block_.data(), block_.size(), compressed_);
    if (!result) {
        SLICECODEC_THROW_FILE("Compression failed: " + result.error().message, file_.path(),
                              core::ErrorCode::CompressionError);
    }
    SLICECODEC_LOG_BLOCK_DEBUG("Flushed block of {} bytes to {}", block_.size(), file_.path());
    block_.clear();
    writeOut();
}

void BlockWriter::writeOut() {
    file_.write(compressed_.data(), compressed_.size());
    compressed_.clear();
}

void BlockWriter::close() {
    if (failed_) {
        SLICECODEC_THROW_OP("Close of failed block stream " + file_.path(), "close");
    }
    if (closed_) {
        return;
    }
    // 无论成功与否都不再接受写入
    closed_ = true;
    try {
        finishStream();
    } catch (const core::FileException& e) {
        STREAM_ERROR("Closing block stream {} failed: {}", file_.path(), e.what());
        fail();
        throw;
    }
    STREAM_DEBUG("Closed block writer {}: {} bytes", file_.path(), bytes_written_);
}

void BlockWriter::finishStream() {
    flushBlock();
    auto result = engine_->finish(compressed_);
    if (!result) {
        SLICECODEC_THROW_FILE("Compression finish failed: " + result.error().message, file_.path(),
                              core::ErrorCode::CompressionError);
    }
    writeOut();
    file_.close();
}

}} // namespace slicecodec::stream
