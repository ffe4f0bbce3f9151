#pragma once

#include "slicecodec/archive/CompressionEngine.hpp"
#include "slicecodec/stream/ByteSource.hpp"
#include "slicecodec/utils/FileWrapper.hpp"

#include <memory>
#include <string>

namespace slicecodec {
namespace stream {

/**
 * @brief 块读取流：读文件、解压，对编解码器表现为连续字节源
 */
class BlockReader : public ByteSource {
public:
    /**
     * @param path 文件路径
     * @param backend 压缩后端
     * @param seek 压缩流在文件中的起始字节偏移
     * @throws FileException 文件不存在或无法定位
     */
    BlockReader(const std::string& path,
                archive::CompressionEngine::Backend backend,
                uint64_t seek = 0);

    size_t read(void* buffer, size_t size) override;
    std::string name() const override { return file_.path(); }

    /**
     * @brief 已交给调用方的未压缩字节数
     */
    uint64_t bytesRead() const noexcept { return bytes_read_; }

private:
    bool refill();

    utils::FileWrapper file_;
    std::unique_ptr<archive::DecompressionEngine> engine_;
    std::string block_;
    std::string raw_;
    size_t pos_ = 0;
    uint64_t bytes_read_ = 0;
    bool eof_ = false;
};

}} // namespace slicecodec::stream
