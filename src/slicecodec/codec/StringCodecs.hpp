#pragma once

#include "slicecodec/codec/TypeCodec.hpp"

namespace slicecodec {
namespace codec {

/**
 * @brief 字符串族的公共编码
 *
 * 长度 < 255 时 1 字节长度前缀，否则 255 + u32 长度；None 为 255 + 0xFFFFFFFF。
 * 字符串类型无序，不统计 min/max。
 */
class StringCodecBase : public TypeCodec {
public:
    using TypeCodec::TypeCodec;

    void encode(const core::Value& value, std::string& out) const override;

protected:
    /**
     * @brief 读取一条原始字节串
     * @return 结束时为 std::nullopt；None 时 is_none 置为 true
     */
    std::optional<std::string> decodeRaw(stream::ByteSource& source, bool& is_none) const;

    core::Result<core::Value> checkLength(const std::string& data, core::Value converted,
                                          const core::Value& original) const;
};

/**
 * @brief bytes：只接受字节串，原样存储
 */
class BytesCodec : public StringCodecBase {
public:
    BytesCodec() : StringCodecBase(ColumnType::Bytes) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;
};

/**
 * @brief ascii：7 位干净的文本或字节串，读出为文本
 */
class AsciiCodec : public StringCodecBase {
public:
    AsciiCodec() : StringCodecBase(ColumnType::Ascii) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;
};

/**
 * @brief unicode：合法 UTF-8 文本，不接受字节串
 */
class UnicodeCodec : public StringCodecBase {
public:
    UnicodeCodec() : StringCodecBase(ColumnType::Unicode) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;
};

/**
 * @brief json：以紧凑 UTF-8 JSON 文本存储，线格式与 unicode 相同
 *
 * 接受 Json 文档以及可直接表示为 JSON 标量的值（bool、整数、有限浮点、文本）。
 * parsed:json 将文本或字节串内容解析为 JSON 文档。读出为 core::Json。
 */
class JsonCodec : public StringCodecBase {
public:
    explicit JsonCodec(ColumnType type) : StringCodecBase(type) {}

    core::Result<core::Value> convert(const core::Value& value) const override;
    std::optional<core::Value> decode(stream::ByteSource& source) const override;
    uint64_t hashCanonical(const core::Value& value) const override;
};

}} // namespace slicecodec::codec
