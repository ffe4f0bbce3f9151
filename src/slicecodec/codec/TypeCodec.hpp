#pragma once

#include "slicecodec/codec/ColumnType.hpp"
#include "slicecodec/core/Expected.hpp"
#include "slicecodec/core/Value.hpp"
#include "slicecodec/stream/ByteSource.hpp"

#include <memory>
#include <optional>
#include <string>

namespace slicecodec {
namespace codec {

/**
 * @brief 单一列类型的编解码器接口
 *
 * 每种 ColumnType 对应一个实现，通过 create() 获取。编解码器本身无状态，
 * 可被多个读写器共享。
 *
 * 规范值：convert() 的输出。例如 int32/int64 统一为 int64_t，float32 已舍入到
 * float32 精度，ascii 列的字节串输入转为 std::string。encode()/hashCanonical()/
 * compare() 只接受规范值或 None。
 */
class TypeCodec {
public:
    explicit TypeCodec(ColumnType type) : type_(type) {}
    virtual ~TypeCodec() = default;

    TypeCodec(const TypeCodec&) = delete;
    TypeCodec& operator=(const TypeCodec&) = delete;

    /**
     * @brief 创建指定类型的编解码器
     */
    static std::unique_ptr<TypeCodec> create(ColumnType type);

    ColumnType type() const noexcept { return type_; }
    const char* name() const noexcept { return columnTypeName(type_); }

    /**
     * @brief 接受/解析/截断：把输入转换为规范值
     *
     * None 不属于任何类型（TypeMismatch），由调用方按 none_support 处理。
     * 失败码：TypeMismatch（类型不对）、ValueRejected（无法解析、编码非法）、
     * Overflow（整数越界）。
     */
    virtual core::Result<core::Value> convert(const core::Value& value) const = 0;

    bool accepts(const core::Value& value) const {
        return convert(value).hasValue();
    }

    /**
     * @brief 追加规范值（或 None 标记）的编码
     */
    virtual void encode(const core::Value& value, std::string& out) const = 0;

    /**
     * @brief 读取一个值
     * @return 数据正常结束时返回 std::nullopt
     * @throws FileException 值被截断或标签非法（FileCorrupted）
     */
    virtual std::optional<core::Value> decode(stream::ByteSource& source) const = 0;

    /**
     * @brief 规范值的哈希，None 为 0
     */
    virtual uint64_t hashCanonical(const core::Value& value) const = 0;

    /**
     * @brief 先转换再哈希；None 为 0，无法转换时返回转换错误
     */
    core::Result<uint64_t> hash(const core::Value& value) const;

    /**
     * @brief 是否有自然顺序（决定是否统计 min/max）
     */
    virtual bool ordered() const noexcept { return false; }

    /**
     * @brief 比较两个非 None 规范值
     * @return -1/0/1，无序（NaN）时返回 2
     */
    virtual int compare(const core::Value& a, const core::Value& b) const;

protected:
    core::Error mismatch(const core::Value& value) const;
    core::Error rejected(const core::Value& value, const std::string& reason) const;

private:
    ColumnType type_;
};

/**
 * @brief parsed: 类型可解析的文本（std::string 或 Bytes 的内容）
 */
const std::string* textOf(const core::Value& value) noexcept;

}} // namespace slicecodec::codec
