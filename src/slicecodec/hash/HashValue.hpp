#pragma once

#include "slicecodec/core/Expected.hpp"
#include "slicecodec/core/Value.hpp"
#include <cstdint>
#include <string_view>

namespace slicecodec {
namespace hash {

/**
 * @file HashValue.hpp
 * @brief 跨类型一致的值哈希（用于切片划分）
 *
 * 规则：
 * - 假值（None、0、0.0、-0.0、False、空串）哈希为 0
 * - int64 范围内的整数哈希其 8 字节小端补码
 * - 整数值的浮点数与同值整数哈希相同，其余浮点数哈希 8 字节 IEEE 表示
 * - NaN 统一为规范静默 NaN
 * - 虚部为 0 的复数按实部哈希，否则哈希实部+虚部 16 字节
 * - 超出 int64 的整数哈希最短小端补码字节
 * - 文本哈希其 UTF-8 字节，字节串哈希原始字节
 */

uint64_t hashInt64(int64_t value) noexcept;
uint64_t hashDouble(double value);

/**
 * @brief 先舍入到 float32 精度再按 double 哈希
 */
uint64_t hashFloat32(double value);

uint64_t hashComplex(const core::Complex& value);
uint64_t hashComplex32(const core::Complex& value);
uint64_t hashBool(bool value) noexcept;
uint64_t hashBigInt(const core::BigInt& value);
uint64_t hashNumber(const core::Number& value);

uint64_t hashBytes(std::string_view bytes) noexcept;

/**
 * @brief 文本按 UTF-8 字节哈希（与相同内容的字节串一致）
 */
uint64_t hashText(std::string_view utf8) noexcept;

/**
 * @brief ASCII 文本哈希，含 0x80 以上字节时返回 InvalidEncoding
 */
core::Result<uint64_t> hashAscii(std::string_view text);

// 时间类型哈希其规范编码，fold 位清零
uint64_t hashDate(const core::Date& value) noexcept;
uint64_t hashTime(const core::Time& value) noexcept;
uint64_t hashDateTime(const core::DateTime& value) noexcept;

/**
 * @brief 通用哈希：按值本身的种类选择规则
 */
uint64_t hashValue(const core::Value& value);

}} // namespace slicecodec::hash
