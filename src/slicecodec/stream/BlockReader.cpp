#include "slicecodec/stream/BlockReader.hpp"
#include "slicecodec/core/Exception.hpp"
#include "slicecodec/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cstring>

namespace slicecodec {
namespace stream {

namespace {

std::unique_ptr<archive::DecompressionEngine> makeEngine(archive::CompressionEngine::Backend backend) {
    auto engine = archive::DecompressionEngine::create(backend);
    if (!engine) {
        core::throwError(engine.error());
    }
    return std::move(engine).value();
}

} // namespace

BlockReader::BlockReader(const std::string& path,
                         archive::CompressionEngine::Backend backend,
                         uint64_t seek)
    : file_(path, "rb")
    , engine_(makeEngine(backend)) {
    if (seek) {
        file_.seek(seek);
    }
    raw_.resize(core::Constants::kIOBufferSize);
    STREAM_DEBUG("Opened block reader {} ({}, seek {})", path, engine_->name(), seek);
}

bool BlockReader::refill() {
    block_.clear();
    pos_ = 0;
    while (block_.empty() && !eof_) {
        size_t got = file_.read(&raw_[0], raw_.size());
        if (got == 0) {
            eof_ = true;
            auto result = engine_->finish();
            if (!result) {
                SLICECODEC_THROW_FILE(result.error().message, file_.path(), result.error().code);
            }
            break;
        }
        auto result = engine_->decompress(raw_.data(), got, block_);
        if (!result) {
            SLICECODEC_THROW_FILE(result.error().message, file_.path(), result.error().code);
        }
    }
    SLICECODEC_LOG_BLOCK_DEBUG("Refilled {} bytes from {}", block_.size(), file_.path());
    return !block_.empty();
}

size_t BlockReader::read(void* buffer, size_t size) {
    auto* out = static_cast<char*>(buffer);
    size_t copied = 0;
    while (copied < size) {
        if (pos_ == block_.size() && !refill()) {
            break;
        }
        size_t take = std::min(size - copied, block_.size() - pos_);
        std::memcpy(out + copied, block_.data() + pos_, take);
        pos_ += take;
        copied += take;
    }
    bytes_read_ += copied;
    return copied;
}

}} // namespace slicecodec::stream
