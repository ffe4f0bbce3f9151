#pragma once

#include "CompressionEngine.hpp"

namespace slicecodec {
namespace archive {

/**
 * @brief "none" 后端：数据原样写出
 */
class StoredEngine : public CompressionEngine {
public:
    VoidResult compress(const void* input, size_t input_size, std::string& out) override;
    VoidResult finish(std::string& out) override;
    const char* name() const override { return "none"; }
    Statistics getStatistics() const override { return stats_; }

private:
    Statistics stats_;
};

class StoredDecompressor : public DecompressionEngine {
public:
    VoidResult decompress(const void* input, size_t input_size, std::string& out) override;
    VoidResult finish() override { return core::success(); }
    const char* name() const override { return "none"; }
};

}} // namespace slicecodec::archive
