#pragma once

#include "slicecodec/codec/TypeCodec.hpp"
#include "slicecodec/column/ColumnOptions.hpp"
#include "slicecodec/stream/BlockReader.hpp"

#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace slicecodec {
namespace column {

/**
 * @brief 单个列文件的惰性读取器
 *
 * 按文件顺序产出值，不可重新开始（需要重新读取时新建读取器）。
 * 可选：切片过滤（与写入端规则一致）、want_count 上限、起始偏移、进度回调。
 *
 * 状态：Opened → Iterating → (Exhausted | StoppedByCallback | Aborted) → Closed，
 * 终止状态不会回到 Iterating。
 */
class ColumnReader {
public:
    enum class State {
        Opened,
        Iterating,
        Exhausted,
        StoppedByCallback,
        Aborted,
        Closed
    };

    /**
     * @brief 单遍输入迭代器
     */
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = core::Value;
        using difference_type = std::ptrdiff_t;
        using pointer = const core::Value*;
        using reference = const core::Value&;

        Iterator() = default;
        explicit Iterator(ColumnReader* reader) : reader_(reader) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const Iterator& other) const { return atEnd() == other.atEnd(); }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        void advance() {
            current_ = reader_ ? reader_->next() : std::nullopt;
        }
        bool atEnd() const { return !current_.has_value(); }

        ColumnReader* reader_ = nullptr;
        std::optional<core::Value> current_;
    };

    /**
     * @throws FileException 文件不存在或无法定位
     * @throws ParameterException 非法配置
     */
    ColumnReader(const std::string& path, codec::ColumnType type, ReaderOptions options = ReaderOptions());

    ColumnReader(const ColumnReader&) = delete;
    ColumnReader& operator=(const ColumnReader&) = delete;

    /**
     * @brief 下一个值，结束（或被回调停止、达到 want_count）时返回 std::nullopt
     * @throws FileException 数据损坏或读取失败（读取器进入 Aborted）
     * 回调抛出的异常原样传播（读取器进入 Aborted）
     */
    std::optional<core::Value> next();

    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

    /**
     * @brief 读取剩余全部值
     */
    std::vector<core::Value> readAll();

    void close();

    /**
     * @brief 已产出的值数
     */
    int64_t count() const noexcept { return yielded_; }

    State state() const noexcept { return state_; }
    codec::ColumnType type() const noexcept { return codec_->type(); }
    const std::string& path() const noexcept { return path_; }

private:
    bool isTerminal() const noexcept;
    bool runCallback();

    std::string path_;
    ReaderOptions options_;
    std::unique_ptr<codec::TypeCodec> codec_;
    std::unique_ptr<stream::BlockReader> stream_;
    State state_ = State::Opened;
    int64_t yielded_ = 0;
    int64_t next_callback_at_ = 0;
};

const char* toString(ColumnReader::State state) noexcept;

}} // namespace slicecodec::column
