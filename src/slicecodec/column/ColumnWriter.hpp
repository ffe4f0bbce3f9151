#pragma once

#include "slicecodec/codec/TypeCodec.hpp"
#include "slicecodec/column/ColumnOptions.hpp"
#include "slicecodec/column/ColumnStats.hpp"
#include "slicecodec/core/Expected.hpp"
#include "slicecodec/stream/BlockWriter.hpp"

#include <memory>
#include <string>

namespace slicecodec {
namespace column {

/**
 * @brief 单个 (列, 切片) 文件的写入器
 *
 * 值错误（类型不符、无法解析、越界）通过 Result 返回，不影响已写入的数据；
 * I/O 错误抛出 FileException，写入器随即进入 Failed 状态，之后的任何调用都会抛出。
 *
 * 使用示例：
 * @code
 * ColumnWriter writer("col.0", ColumnType::Int64, options);
 * auto kept = writer.write(core::Value(int64_t{42}));
 * ColumnStats stats = writer.finish();
 * @endcode
 */
class ColumnWriter {
public:
    enum class State {
        Open,
        Finished,
        Failed
    };

    /**
     * @throws ParameterException 非法配置（未知压缩、非法默认值、hashfilter）
     * @throws FileException 无法创建文件
     */
    ColumnWriter(const std::string& path, codec::ColumnType type, WriterOptions options = WriterOptions());

    /**
     * @brief 未完成的写入器在析构时关闭，失败只记录日志
     */
    ~ColumnWriter();

    ColumnWriter(const ColumnWriter&) = delete;
    ColumnWriter& operator=(const ColumnWriter&) = delete;

    /**
     * @brief 写入一个值
     * @return true 已写入；false 不属于本切片（无副作用）；错误表示值被拒绝
     * @throws FileException I/O 失败
     * @throws OperationException 写入器已完成或已失败
     */
    core::Result<bool> write(const core::Value& value);

    /**
     * @brief 与 write() 相同的切片判定，但不写入
     */
    core::Result<bool> hashcheck(const core::Value& value) const;

    /**
     * @brief 刷新并关闭文件，返回统计信息；重复调用返回同一结果
     * @throws FileException I/O 失败（写入器进入 Failed 状态）
     */
    ColumnStats finish();

    void close() { finish(); }

    int64_t count() const noexcept { return count_; }
    const core::Value& min() const noexcept { return min_; }
    const core::Value& max() const noexcept { return max_; }
    const std::string& compression() const noexcept { return options_.compression; }
    codec::ColumnType type() const noexcept { return codec_->type(); }
    State state() const noexcept { return state_; }
    const std::string& path() const noexcept { return path_; }

    /**
     * @brief 指定列类型的哈希（先转换，None 为 0）
     */
    static core::Result<uint64_t> hash(codec::ColumnType type, const core::Value& value);

private:
    core::Result<core::Value> effectiveValue(const core::Value& value) const;
    bool keeps(const core::Value& effective) const;
    void updateMinMax(const core::Value& value);
    void ensureOpen(const char* operation) const;
    core::Error withExtra(core::Error error) const;

    std::string path_;
    WriterOptions options_;
    std::unique_ptr<codec::TypeCodec> codec_;
    std::optional<core::Value> default_;   // 已转换的默认值
    std::unique_ptr<stream::BlockWriter> stream_;
    std::string scratch_;
    State state_ = State::Open;
    int64_t count_ = 0;
    core::Value min_;
    core::Value max_;
    ColumnStats stats_;
};

}} // namespace slicecodec::column
