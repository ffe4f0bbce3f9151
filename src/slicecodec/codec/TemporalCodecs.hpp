#pragma once

#include "slicecodec/codec/TypeCodec.hpp"

namespace slicecodec {
namespace codec {

/**
 * @brief date / parsed:date：4 字节打包，0 为 None；接受 DateTime（截断为日期）
 */
class DateCodec : public TypeCodec {
public:
    explicit DateCodec(ColumnType type) : TypeCodec(type), parsed_(isParsed(type)) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    void encode(const core::Value& value, std::string& out) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;
    bool ordered() const noexcept override { return true; }
    int compare(const core::Value& a, const core::Value& b) const override;

private:
    bool parsed_;
};

/**
 * @brief time / parsed:time：8 字节打包（日期部分固定为 1970-01-01），保留 fold
 */
class TimeCodec : public TypeCodec {
public:
    explicit TimeCodec(ColumnType type) : TypeCodec(type), parsed_(isParsed(type)) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    void encode(const core::Value& value, std::string& out) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;
    bool ordered() const noexcept override { return true; }
    int compare(const core::Value& a, const core::Value& b) const override;

private:
    bool parsed_;
};

/**
 * @brief datetime / parsed:datetime：8 字节打包，保留 fold
 */
class DateTimeCodec : public TypeCodec {
public:
    explicit DateTimeCodec(ColumnType type) : TypeCodec(type), parsed_(isParsed(type)) {}

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
