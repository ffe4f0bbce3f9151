#pragma once

#include "CompressionEngine.hpp"
#include <zlib.h>
#include <memory>

namespace slicecodec {
namespace archive {

/**
 * @brief 基于 zlib 的 gzip 压缩引擎
 *
 * 输出为单个标准 gzip 成员，可直接用 gzip -d 解压。
 */
class ZlibEngine : public CompressionEngine {
public:
    /**
     * @brief 构造函数
     * @param compression_level 压缩级别 (1-9)
     */
    explicit ZlibEngine(int compression_level = core::Constants::kDefaultCompressionLevel);

    ~ZlibEngine() override;

    /**
     * @brief 初始化 deflate 流，create() 负责调用
     */
    VoidResult initialize();

    VoidResult compress(const void* input, size_t input_size, std::string& out) override;
    VoidResult finish(std::string& out) override;
    const char* name() const override { return "gzip"; }
    int getCompressionLevel() const { return compression_level_; }
    Statistics getStatistics() const override { return stats_; }

private:
    VoidResult pump(int flush, std::string& out);
    void cleanupStream();

    std::unique_ptr<z_stream> stream_;
    int compression_level_;
    bool initialized_ = false;
    bool finished_ = false;
    Statistics stats_;
};

/**
 * @brief gzip 解压引擎，支持多个首尾相接的 gzip 成员
 */
class ZlibDecompressor : public DecompressionEngine {
public:
    ZlibDecompressor();
    ~ZlibDecompressor() override;

    VoidResult initialize();

    VoidResult decompress(const void* input, size_t input_size, std::string& out) override;
    VoidResult finish() override;
    const char* name() const override { return "gzip"; }

private:
    void cleanupStream();

    std::unique_ptr<z_stream> stream_;
    bool initialized_ = false;
    bool member_open_ = false;   // 当前成员已开始但尚未结束
};

}} // namespace slicecodec::archive
