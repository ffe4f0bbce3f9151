#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slicecodec {
namespace core {

/**
 * @brief 任意精度整数
 *
 * 符号 + 幅值表示，幅值为小端 32 位字，不保留高位零字。
 * 零永远是非负的（不存在 -0）。
 */
class BigInt {
public:
    BigInt() = default;
    BigInt(int64_t value);

    /**
     * @brief 解析十进制整数文本
     * @param text 可选符号（+/-）后跟至少一位数字，不允许空白
     * @return 解析失败时返回 std::nullopt
     */
    static std::optional<BigInt> parse(std::string_view text);

    /**
     * @brief 由小端补码字节构造
     */
    static BigInt fromTwosComplement(const uint8_t* data, size_t size);

    /**
     * @brief 取浮点数的整数部分（向零截断）
     * @return NaN 或无穷大时返回 std::nullopt
     */
    static std::optional<BigInt> fromDouble(double value);

    /**
     * @brief 最短小端补码字节，长度为 bitLength() / 8 + 1
     */
    std::vector<uint8_t> toTwosComplement() const;

    std::string toString() const;

    bool isZero() const noexcept { return limbs_.empty(); }
    bool isNegative() const noexcept { return negative_; }

    /**
     * @brief 幅值的有效位数（0 的位数为 0）
     */
    size_t bitLength() const noexcept;

    bool fitsInt64() const noexcept;
    int64_t toInt64() const noexcept;  // 调用前需确认 fitsInt64()

    /**
     * @brief 转换为 double，超出范围时得到 ±inf
     */
    double toDouble() const noexcept;

    int compare(const BigInt& other) const noexcept;

    /**
     * @brief 与浮点数精确比较
     * @return -1/0/1；NaN 时返回 2（无序）
     */
    int compareDouble(double value) const;

    BigInt operator-() const;

    bool operator==(const BigInt& other) const noexcept { return compare(other) == 0; }
    bool operator!=(const BigInt& other) const noexcept { return compare(other) != 0; }
    bool operator<(const BigInt& other) const noexcept { return compare(other) < 0; }
    bool operator>(const BigInt& other) const noexcept { return compare(other) > 0; }
    bool operator<=(const BigInt& other) const noexcept { return compare(other) <= 0; }
    bool operator>=(const BigInt& other) const noexcept { return compare(other) >= 0; }

private:
    bool negative_ = false;
    std::vector<uint32_t> limbs_;

    void trim() noexcept;
    void mulAddSmall(uint32_t multiplier, uint32_t addend);
    uint32_t divModSmall(uint32_t divisor);
    void shiftLeft(size_t bits);
    int compareMagnitude(const BigInt& other) const noexcept;
};

}} // namespace slicecodec::core
