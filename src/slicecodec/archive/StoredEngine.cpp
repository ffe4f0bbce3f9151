#include "StoredEngine.hpp"

namespace slicecodec {
namespace archive {

VoidResult StoredEngine::compress(const void* input, size_t input_size, std::string& out) {
    out.append(static_cast<const char*>(input), input_size);
    stats_.total_input_bytes += input_size;
    stats_.total_output_bytes += input_size;
    stats_.block_count++;
    return core::success();
}

VoidResult StoredEngine::finish(std::string&) {
    return core::success();
}

VoidResult StoredDecompressor::decompress(const void* input, size_t input_size, std::string& out) {
    out.append(static_cast<const char*>(input), input_size);
    return core::success();
}

}} // namespace slicecodec::archive
