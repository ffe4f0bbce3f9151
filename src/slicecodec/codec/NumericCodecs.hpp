#pragma once

#include "slicecodec/codec/TypeCodec.hpp"

namespace slicecodec {
namespace codec {

/**
 * @brief int32 / int64（含 parsed: 变体）
 *
 * 规范值 int64_t；最小值保留为 None 标记，不可写入。
 * parsed 变体接受文本，浮点输入向零截断。
 */
template<typename T>
class IntegerCodec : public TypeCodec {
public:
    explicit IntegerCodec(ColumnType type) : TypeCodec(type), parsed_(isParsed(type)) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    void encode(const core::Value& value, std::string& out) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;
    bool ordered() const noexcept override { return true; }
    int compare(const core::Value& a, const core::Value& b) const override;

private:
    core::Result<core::Value> checkRange(int64_t value, const core::Value& original) const;
    core::Result<core::Value> fromDouble(double value, const core::Value& original) const;

    bool parsed_;
};

/**
 * @brief float32 / float64（含 parsed: 变体）
 *
 * 规范值 double（float32 已舍入），溢出截断为 ±inf。
 */
template<typename T>
class FloatCodec : public TypeCodec {
public:
    explicit FloatCodec(ColumnType type) : TypeCodec(type), parsed_(isParsed(type)) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    void encode(const core::Value& value, std::string& out) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;
    bool ordered() const noexcept override { return true; }
    int compare(const core::Value& a, const core::Value& b) const override;

private:
    static double narrow(double value) noexcept;

    bool parsed_;
};

/**
 * @brief complex32 / complex64（含 parsed: 变体），无序
 */
template<typename T>
class ComplexCodec : public TypeCodec {
public:
    explicit ComplexCodec(ColumnType type) : TypeCodec(type), parsed_(isParsed(type)) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    void encode(const core::Value& value, std::string& out) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;

private:
    static core::Complex narrow(const core::Complex& value) noexcept;

    bool parsed_;
};

/**
 * @brief bool，按真值转换；1 字节，255 为 None
 */
class BoolCodec : public TypeCodec {
public:
    BoolCodec() : TypeCodec(ColumnType::Bool) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    void encode(const core::Value& value, std::string& out) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;
    bool ordered() const noexcept override { return true; }
    int compare(const core::Value& a, const core::Value& b) const override;
};

extern template class IntegerCodec<int32_t>;
extern template class IntegerCodec<int64_t>;
extern template class FloatCodec<float>;
extern template class FloatCodec<double>;
extern template class ComplexCodec<float>;
extern template class ComplexCodec<double>;

}} // namespace slicecodec::codec
