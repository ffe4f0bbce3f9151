#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace slicecodec {
namespace codec {

/**
 * @brief 列类型
 *
 * Parsed* 变体额外接受文本（以及内容为文本的字节串）并解析为目标类型。
 */
enum class ColumnType : uint8_t {
    Int32,
    Int64,
    Float32,
    Float64,
    Complex32,
    Complex64,
    Bool,
    Number,
    Bytes,
    Ascii,
    Unicode,
    Date,
    Time,
    DateTime,
    Json,
    ParsedInt32,
    ParsedInt64,
    ParsedFloat32,
    ParsedFloat64,
    ParsedComplex32,
    ParsedComplex64,
    ParsedNumber,
    ParsedDate,
    ParsedTime,
    ParsedDateTime,
    ParsedJson
};

/**
 * @brief 类型名，例如 "int32"、"parsed:number"
 */
const char* columnTypeName(ColumnType type) noexcept;

/**
 * @brief 按名称查找类型
 * @throws ParameterException 未知类型名
 */
ColumnType columnTypeFromName(std::string_view name);

/**
 * @brief 所有类型（按声明顺序）
 */
const std::vector<ColumnType>& allColumnTypes();

bool isParsed(ColumnType type) noexcept;

/**
 * @brief 去掉 parsed: 前缀后的基础类型
 */
ColumnType baseType(ColumnType type) noexcept;

/**
 * @brief 基础类型的 parsed: 变体；没有变体的类型（bool、字符串）返回自身
 */
ColumnType parsedVariant(ColumnType type) noexcept;

bool isStringType(ColumnType type) noexcept;

}} // namespace slicecodec::codec
