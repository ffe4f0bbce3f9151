#pragma once

#include "slicecodec/codec/TypeCodec.hpp"

namespace slicecodec {
namespace codec {

/**
 * @brief number / parsed:number：无界整数或浮点
 *
 * 编码（标签字节）：
 * - 0            None
 * - 128..255     小整数 -5..122（标签 = 值 + 133）
 * - 2 / 4 / 8    后跟 int16 / int32 / int64
 * - 1            后跟 float64
 * - 9..126       即长度，后跟该长度的小端补码
 * - 127          后跟 u32 长度与小端补码（更长的整数）
 */
class NumberCodec : public TypeCodec {
public:
    explicit NumberCodec(ColumnType type) : TypeCodec(type), parsed_(isParsed(type)) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    void encode(const core::Value& value, std::string& out) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;
    bool ordered() const noexcept override { return true; }
    int compare(const core::Value& a, const core::Value& b) const override;

private:
    bool parsed_;
};

}} // namespace slicecodec::codec
