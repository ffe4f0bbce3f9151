#pragma once

#include "slicecodec/core/BigInt.hpp"
#include <complex>
#include <cstdint>
#include <string>
#include <variant>

namespace slicecodec {
namespace core {

/**
 * @file Value.hpp
 * @brief 逻辑值类型定义
 *
 * 所有列类型共用同一个封闭的 Value 变体：
 * - int32/int64 均以 int64_t 表示
 * - float32/float64 均以 double 表示
 * - complex32/complex64 均以 std::complex<double> 表示
 * - ascii/unicode 文本以 UTF-8 std::string 表示，字节串使用 Bytes
 * - json 列的文档以 Json 表示（紧凑的 UTF-8 JSON 文本）
 */

/**
 * @brief None 哨兵
 */
struct NoneType {
    bool operator==(const NoneType&) const noexcept { return true; }
    bool operator!=(const NoneType&) const noexcept { return false; }
};

inline constexpr NoneType None{};

/**
 * @brief 字节串（与文本区分，哈希按原始字节计算）
 */
struct Bytes {
    std::string data;

    Bytes() = default;
    explicit Bytes(std::string bytes) : data(std::move(bytes)) {}
    explicit Bytes(const char* bytes) : data(bytes) {}

    bool operator==(const Bytes& other) const { return data == other.data; }
    bool operator!=(const Bytes& other) const { return data != other.data; }
};

/**
 * @brief 任意精度数值：整数（无界）或浮点
 *
 * operator== 为严格相等：整数 1 与浮点 1.0 不相等，数值比较使用 compare()。
 */
class Number {
public:
    Number() : value_(BigInt()) {}
    Number(int64_t value) : value_(BigInt(value)) {}
    Number(int value) : value_(BigInt(static_cast<int64_t>(value))) {}
    Number(const BigInt& value) : value_(value) {}
    Number(double value) : value_(value) {}

    bool isInteger() const noexcept { return std::holds_alternative<BigInt>(value_); }
    bool isFloat() const noexcept { return std::holds_alternative<double>(value_); }

    const BigInt& integer() const { return std::get<BigInt>(value_); }
    double floating() const { return std::get<double>(value_); }

    /**
     * @brief 是否为零（整数 0、0.0 或 -0.0）
     */
    bool isZero() const noexcept;

    /**
     * @brief 转换为 double（整数过大时为 ±inf）
     */
    double toDouble() const noexcept;

    /**
     * @brief 数值比较：-1/0/1，任一侧为 NaN 时返回 2
     */
    int compare(const Number& other) const;

    std::string toString() const;

    bool operator==(const Number& other) const;
    bool operator!=(const Number& other) const { return !(*this == other); }

private:
    std::variant<BigInt, double> value_;
};

/**
 * @brief 日期（公历，年份 1..9999）
 */
struct Date {
    int32_t year = 1970;
    uint8_t month = 1;
    uint8_t day = 1;

    Date() = default;
    Date(int32_t y, int m, int d) : year(y), month(static_cast<uint8_t>(m)), day(static_cast<uint8_t>(d)) {}

    bool isValid() const noexcept;
    int compare(const Date& other) const noexcept;
    std::string toString() const;

    bool operator==(const Date& other) const noexcept { return compare(other) == 0; }
    bool operator!=(const Date& other) const noexcept { return compare(other) != 0; }
};

/**
 * @brief 一天中的时间，fold 区分夏令时切换时重复出现的本地时间
 */
struct Time {
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t second = 0;
    uint32_t microsecond = 0;
    uint8_t fold = 0;

    Time() = default;
    Time(int h, int m, int s, uint32_t us = 0, int f = 0)
        : hour(static_cast<uint8_t>(h)), minute(static_cast<uint8_t>(m)),
          second(static_cast<uint8_t>(s)), microsecond(us), fold(static_cast<uint8_t>(f)) {}

    bool isValid() const noexcept;

    // 排序时忽略 fold
    int compare(const Time& other) const noexcept;
    std::string toString() const;

    // 相等比较包含 fold
    bool operator==(const Time& other) const noexcept { return compare(other) == 0 && fold == other.fold; }
    bool operator!=(const Time& other) const noexcept { return !(*this == other); }
};

/**
 * @brief 日期时间
 */
struct DateTime {
    Date date;
    Time time;

    DateTime() = default;
    DateTime(const Date& d, const Time& t) : date(d), time(t) {}
    DateTime(int32_t y, int mo, int d, int h = 0, int mi = 0, int s = 0, uint32_t us = 0, int f = 0)
        : date(y, mo, d), time(h, mi, s, us, f) {}

    bool isValid() const noexcept { return date.isValid() && time.isValid(); }
    int compare(const DateTime& other) const noexcept;
    std::string toString() const;

    bool operator==(const DateTime& other) const noexcept { return date == other.date && time == other.time; }
    bool operator!=(const DateTime& other) const noexcept { return !(*this == other); }
};

using Complex = std::complex<double>;

/**
 * @brief 逻辑值
 *
 * std::string 表示文本（ascii/unicode），Bytes 表示字节串。
 */
/**
 * @brief JSON 文档，text 为紧凑序列化形式
 */
struct Json {
    std::string text;

    Json() = default;
    explicit Json(std::string document) : text(std::move(document)) {}

    bool operator==(const Json& other) const { return text == other.text; }
    bool operator!=(const Json& other) const { return text != other.text; }
};

using Value = std::variant<NoneType, bool, int64_t, double, Complex, Number,
                           Bytes, std::string, Date, Time, DateTime, Json>;

inline bool isNone(const Value& value) noexcept {
    return std::holds_alternative<NoneType>(value);
}

/**
 * @brief 值的种类名称（用于错误消息）
 */
const char* valueKindName(const Value& value) noexcept;

/**
 * @brief 可读表示（CLI 输出与错误消息）
 */
std::string describe(const Value& value);

/**
 * @brief 按 IEEE 就近舍入到 float32 精度再扩展回 double，超出范围得到 ±inf
 */
double roundToFloat32(double value) noexcept;

// ========== 时间类型的规范 32/64 位打包 ==========
// date:     year << 9 | month << 5 | day，0 保留给 None
// time/datetime 两个 32 位字：
//   hi = fold << 31 | year << 14 | month << 10 | day << 5 | hour
//   lo = minute << 26 | second << 20 | microsecond
// time 使用 1970-01-01 作为日期部分，因此 hi 永远非零。

struct PackedDateTime {
    uint32_t hi = 0;
    uint32_t lo = 0;
};

constexpr uint32_t kFoldBit = 0x80000000u;

uint32_t packDate(const Date& date) noexcept;
Date unpackDate(uint32_t packed) noexcept;

PackedDateTime packDateTime(const DateTime& datetime) noexcept;
DateTime unpackDateTime(const PackedDateTime& packed) noexcept;

PackedDateTime packTime(const Time& time) noexcept;
Time unpackTime(const PackedDateTime& packed) noexcept;

}} // namespace slicecodec::core
