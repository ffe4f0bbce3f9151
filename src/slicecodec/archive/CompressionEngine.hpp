#pragma once

#include "slicecodec/core/Constants.hpp"
#include "slicecodec/core/Expected.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace slicecodec {
namespace archive {

using core::Result;
using core::VoidResult;

/**
 * @brief 压缩引擎抽象接口（流式）
 *
 * 块流按块调用 compress()，关闭时调用 finish() 写出尾部。
 * 同一引擎实例只服务一个文件。
 */
class CompressionEngine {
public:
    /**
     * @brief 支持的压缩后端
     */
    enum class Backend {
        NONE,   // 不压缩，原样存储
        GZIP    // zlib 实现的标准 gzip 流
    };

    /**
     * @brief 引擎统计信息
     */
    struct Statistics {
        size_t total_input_bytes = 0;
        size_t total_output_bytes = 0;
        size_t block_count = 0;
        double total_time_ms = 0.0;

        double getCompressionRatio() const {
            return total_input_bytes > 0 ?
                static_cast<double>(total_output_bytes) / total_input_bytes : 0.0;
        }
    };

    /**
     * @brief 创建压缩引擎实例
     * @param backend 压缩后端类型
     * @param compression_level 压缩级别 (1-9)，NONE 忽略
     */
    static Result<std::unique_ptr<CompressionEngine>> create(
        Backend backend, int compression_level = core::Constants::kDefaultCompressionLevel);

    static std::vector<Backend> getAvailableBackends();

    /**
     * @brief 后端名称转换："none" / "gzip"（大小写不敏感）
     */
    static std::string backendToString(Backend backend);
    static Result<Backend> stringToBackend(const std::string& name);

    virtual ~CompressionEngine() = default;

    /**
     * @brief 压缩一块数据，输出追加到 out
     */
    virtual VoidResult compress(const void* input, size_t input_size, std::string& out) = 0;

    /**
     * @brief 结束压缩流，尾部追加到 out；之后不能再调用 compress()
     */
    virtual VoidResult finish(std::string& out) = 0;

    virtual const char* name() const = 0;
    virtual Statistics getStatistics() const = 0;

protected:
    CompressionEngine() = default;
};

/**
 * @brief 解压引擎抽象接口（流式）
 */
class DecompressionEngine {
public:
    static Result<std::unique_ptr<DecompressionEngine>> create(CompressionEngine::Backend backend);

    virtual ~DecompressionEngine() = default;

    /**
     * @brief 解压全部输入，输出追加到 out
     */
    virtual VoidResult decompress(const void* input, size_t input_size, std::string& out) = 0;

    /**
     * @brief 输入结束时检查流是否完整
     * @return 流被截断时返回 FileCorrupted
     */
    virtual VoidResult finish() = 0;

    virtual const char* name() const = 0;

protected:
    DecompressionEngine() = default;
};

}} // namespace slicecodec::archive
