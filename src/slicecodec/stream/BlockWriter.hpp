#pragma once

#include "slicecodec/archive/CompressionEngine.hpp"
#include "slicecodec/utils/FileWrapper.hpp"

#include <memory>
#include <string>

namespace slicecodec {
namespace stream {

/**
 * @brief 追加式块写入流
 *
 * 数据先写入固定大小（Constants::kBlockSize）的未压缩块，块满后交给压缩引擎并写入文件。
 * 单个值可以跨越块边界，调用方无需关心块的划分。
 * 所有 I/O 与压缩错误以 FileException 抛出。
 */
class BlockWriter {
public:
    /**
     * @brief 创建（截断）目标文件
     * @throws FileException 无法创建文件
     * @throws ParameterException 压缩引擎无法创建
     */
    BlockWriter(const std::string& path,
                archive::CompressionEngine::Backend backend,
                int compression_level = core::Constants::kDefaultCompressionLevel);

    /**
     * @brief 未关闭时尝试关闭，失败只记录日志；曾经失败的流直接丢弃目标文件
     */
    ~BlockWriter();

    BlockWriter(const BlockWriter&) = delete;
    BlockWriter& operator=(const BlockWriter&) = delete;

    void write(const void* data, size_t size);

    void write(const std::string& data) {
        write(data.data(), data.size());
    }

    /**
     * @brief 刷新剩余数据、写出压缩尾部并关闭文件，重复调用无副作用
     * @throws FileException I/O 或压缩失败（流进入失败状态，目标文件被删除）
     * @throws OperationException 流已经失败
     */
    void close();

    bool isClosed() const noexcept { return closed_; }
    bool hasFailed() const noexcept { return failed_; }

    /**
     * @brief 已写入的未压缩字节数
     */
    uint64_t bytesWritten() const noexcept { return bytes_written_; }

    const std::string& path() const noexcept { return file_.path(); }

    archive::CompressionEngine::Statistics getStatistics() const { return engine_->getStatistics(); }

private:
    void flushBlock();
    void writeOut();
    void finishStream();
    void fail();

    utils::FileWrapper file_;
    std::unique_ptr<archive::CompressionEngine> engine_;
    std::string block_;
    std::string compressed_;
    uint64_t bytes_written_ = 0;
    bool closed_ = false;
    bool failed_ = false;   // 部分数据可能已落盘，不能再补写尾部
};

}} // namespace slicecodec::stream
