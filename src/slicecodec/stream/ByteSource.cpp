#include "slicecodec/stream/ByteSource.hpp"
#include "slicecodec/core/Constants.hpp"
#include "slicecodec/core/Exception.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/format.h>

namespace slicecodec {
namespace stream {

bool ByteSource::readExact(void* buffer, size_t size) {
    auto* out = static_cast<char*>(buffer);
    size_t got = 0;
    while (got < size) {
        size_t n = read(out + got, size - got);
        if (n == 0) {
            break;
        }
        got += n;
    }
    if (got == 0 && size != 0) {
        return false;
    }
    if (got != size) {
        SLICECODEC_THROW_FILE(fmt::format("Truncated value: wanted {} bytes, got {}", size, got),
                              name(), core::ErrorCode::FileCorrupted);
    }
    return true;
}

void ByteSource::require(void* buffer, size_t size) {
    if (size != 0 && !readExact(buffer, size)) {
        SLICECODEC_THROW_FILE(fmt::format("Truncated value: wanted {} more bytes at end of stream", size),
                              name(), core::ErrorCode::FileCorrupted);
    }
}

void ByteSource::requireAppend(std::string& out, size_t size) {
    size_t wanted = size;
    while (size > 0) {
        size_t chunk = std::min(size, core::Constants::kIOBufferSize);
        size_t start = out.size();
        out.resize(start + chunk);
        size_t got = 0;
        while (got < chunk) {
            size_t n = read(&out[start + got], chunk - got);
            if (n == 0) {
                out.resize(start + got);
                SLICECODEC_THROW_FILE(fmt::format("Truncated value: wanted {} bytes, got {}",
                                                  wanted, wanted - size + got),
                                      name(), core::ErrorCode::FileCorrupted);
            }
            got += n;
        }
        size -= chunk;
    }
}

size_t MemorySource::read(void* buffer, size_t size) {
    size_t n = std::min(size, data_.size() - pos_);
    if (n) {
        std::memcpy(buffer, data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

}} // namespace slicecodec::stream
