#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace slicecodec {
namespace stream {

/**
 * @brief 顺序字节源，编解码器只依赖这个接口
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief 读取最多 size 字节，仅在数据耗尽时返回少于 size
     * @return 实际读取的字节数，0 表示没有更多数据
     */
    virtual size_t read(void* buffer, size_t size) = 0;

    /**
     * @brief 错误消息里使用的来源名称
     */
    virtual std::string name() const = 0;

    /**
     * @brief 读取一个值的开头
     * @return 一个字节都没有时返回 false（正常结束）
     * @throws FileException 只读到部分数据（FileCorrupted）
     */
    bool readExact(void* buffer, size_t size);

    /**
     * @brief 读取一个值的剩余部分，数据不足即为截断
     * @throws FileException 数据不足（FileCorrupted）
     */
    void require(void* buffer, size_t size);

    /**
     * @brief 追加读取 size 字节到 out，按 I/O 缓冲大小分段增长
     *
     * 长度来自文件本身，截断的数据在分配前就会被发现。
     * @throws FileException 数据不足（FileCorrupted）
     */
    void requireAppend(std::string& out, size_t size);
};

/**
 * @brief 内存字节源（测试与小数据）
 */
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::string data) : data_(std::move(data)) {}

    size_t read(void* buffer, size_t size) override;
    std::string name() const override { return "<memory>"; }

    size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::string data_;
    size_t pos_ = 0;
};

}} // namespace slicecodec::stream
