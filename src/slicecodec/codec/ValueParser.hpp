#pragma once

#include "slicecodec/core/Expected.hpp"
#include "slicecodec/core/Value.hpp"
#include <string_view>

namespace slicecodec {
namespace codec {

/**
 * @file ValueParser.hpp
 * @brief parsed: 列类型使用的文本解析
 *
 * 所有函数容忍首尾空白；无法解析返回 ValueRejected，整数越界返回 Overflow。
 */

std::string_view trimWhitespace(std::string_view text) noexcept;

/**
 * @brief 十进制整数，可带 +/- 号；"0.1"、"" 等均拒绝
 */
core::Result<int64_t> parseInt64(std::string_view text);

/**
 * @brief 浮点数，接受指数形式以及 inf / nan
 */
core::Result<double> parseDouble(std::string_view text);

/**
 * @brief 整数文本得到无界整数，否则按浮点解析（"0.0" 为浮点）
 */
core::Result<core::Number> parseNumber(std::string_view text);

/**
 * @brief 复数："1", "2j", "1+2j", "(1-2.5e3j)"
 */
core::Result<core::Complex> parseComplex(std::string_view text);

/**
 * @brief ISO 日期 "YYYY-MM-DD"
 */
core::Result<core::Date> parseDate(std::string_view text);

/**
 * @brief ISO 时间 "HH:MM[:SS[.ffffff]]"
 */
core::Result<core::Time> parseTime(std::string_view text);

/**
 * @brief ISO 日期时间，日期与时间以 'T' 或空格分隔；只有日期时时间为 00:00
 */
core::Result<core::DateTime> parseDateTime(std::string_view text);

}} // namespace slicecodec::codec
