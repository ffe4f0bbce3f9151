#include "slicecodec/core/BigInt.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace slicecodec {
namespace core {

BigInt::BigInt(int64_t value) {
    if (value == 0) {
        return;
    }
    negative_ = value < 0;
    // 先转为无符号再取反，避免 INT64_MIN 溢出
    uint64_t magnitude = negative_ ? (~static_cast<uint64_t>(value) + 1) : static_cast<uint64_t>(value);
    limbs_.push_back(static_cast<uint32_t>(magnitude));
    limbs_.push_back(static_cast<uint32_t>(magnitude >> 32));
    trim();
}

std::optional<BigInt> BigInt::parse(std::string_view text) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    if (pos == text.size()) {
        return std::nullopt;
    }

    BigInt result;
    // 每次吃进最多 9 位十进制数字
    while (pos < text.size()) {
        uint32_t chunk = 0;
        uint32_t scale = 1;
        size_t taken = 0;
        while (pos < text.size() && taken < 9) {
            char c = text[pos];
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            chunk = chunk * 10 + static_cast<uint32_t>(c - '0');
            scale *= 10;
            ++pos;
            ++taken;
        }
        result.mulAddSmall(scale, chunk);
    }
    result.negative_ = negative && !result.isZero();
    return result;
}

BigInt BigInt::fromTwosComplement(const uint8_t* data, size_t size) {
    BigInt result;
    if (size == 0) {
        return result;
    }
    bool negative = (data[size - 1] & 0x80) != 0;

    std::vector<uint8_t> magnitude(data, data + size);
    if (negative) {
        // 取反加一得到幅值
        for (auto& byte : magnitude) {
            byte = static_cast<uint8_t>(~byte);
        }
        for (auto& byte : magnitude) {
            if (++byte != 0) {
                break;
            }
        }
    }

    result.limbs_.assign((size + 3) / 4, 0);
    for (size_t i = 0; i < size; ++i) {
        result.limbs_[i / 4] |= static_cast<uint32_t>(magnitude[i]) << (8 * (i % 4));
    }
    result.trim();
    result.negative_ = negative && !result.isZero();
    return result;
}

std::optional<BigInt> BigInt::fromDouble(double value) {
    if (std::isnan(value) || std::isinf(value)) {
        return std::nullopt;
    }
    value = std::trunc(value);
    if (value == 0.0) {
        return BigInt();
    }

    int exponent = 0;
    double mantissa = std::frexp(std::fabs(value), &exponent);
    // mantissa 位于 [0.5, 1)，放大为 53 位整数
    auto bits = static_cast<int64_t>(std::ldexp(mantissa, 53));
    exponent -= 53;

    BigInt result(bits);
    if (exponent > 0) {
        result.shiftLeft(static_cast<size_t>(exponent));
    } else if (exponent < 0) {
        // 已截断为整数，右移不会丢失有效位
        result = BigInt(bits >> (-exponent));
    }
    result.negative_ = value < 0 && !result.isZero();
    return result;
}

std::vector<uint8_t> BigInt::toTwosComplement() const {
    size_t length = bitLength() / 8 + 1;
    std::vector<uint8_t> bytes(length, 0);
    for (size_t i = 0; i < length && i / 4 < limbs_.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(limbs_[i / 4] >> (8 * (i % 4)));
    }
    if (negative_) {
        for (auto& byte : bytes) {
            byte = static_cast<uint8_t>(~byte);
        }
        for (auto& byte : bytes) {
            if (++byte != 0) {
                break;
            }
        }
    }
    return bytes;
}

std::string BigInt::toString() const {
    if (isZero()) {
        return "0";
    }
    BigInt work = *this;
    std::vector<uint32_t> chunks;
    while (!work.isZero()) {
        chunks.push_back(work.divModSmall(1000000000u));
    }

    std::string result = negative_ ? "-" : "";
    result += std::to_string(chunks.back());
    for (size_t i = chunks.size() - 1; i-- > 0;) {
        std::string part = std::to_string(chunks[i]);
        result.append(9 - part.size(), '0');
        result += part;
    }
    return result;
}

size_t BigInt::bitLength() const noexcept {
    if (limbs_.empty()) {
        return 0;
    }
    uint32_t top = limbs_.back();
    size_t bits = 0;
    while (top) {
        ++bits;
        top >>= 1;
    }
    return (limbs_.size() - 1) * 32 + bits;
}

bool BigInt::fitsInt64() const noexcept {
    size_t bits = bitLength();
    if (bits < 64) {
        return true;
    }
    // 仅 -2^63 恰好 64 位仍可表示
    if (bits == 64 && negative_) {
        return limbs_[0] == 0 && limbs_[1] == 0x80000000u;
    }
    return false;
}

int64_t BigInt::toInt64() const noexcept {
    uint64_t magnitude = 0;
    if (!limbs_.empty()) {
        magnitude = limbs_[0];
    }
    if (limbs_.size() > 1) {
        magnitude |= static_cast<uint64_t>(limbs_[1]) << 32;
    }
    return negative_ ? static_cast<int64_t>(~magnitude + 1) : static_cast<int64_t>(magnitude);
}

double BigInt::toDouble() const noexcept {
    double result = 0.0;
    for (size_t i = limbs_.size(); i-- > 0;) {
        result = result * 4294967296.0 + static_cast<double>(limbs_[i]);
        if (std::isinf(result)) {
            break;
        }
    }
    return negative_ ? -result : result;
}

int BigInt::compare(const BigInt& other) const noexcept {
    if (negative_ != other.negative_) {
        return negative_ ? -1 : 1;
    }
    int magnitude = compareMagnitude(other);
    return negative_ ? -magnitude : magnitude;
}

int BigInt::compareDouble(double value) const {
    if (std::isnan(value)) {
        return 2;
    }
    if (std::isinf(value)) {
        return value > 0 ? -1 : 1;
    }
    auto truncated = fromDouble(value);
    int cmp = compare(*truncated);
    if (cmp != 0) {
        return cmp;
    }
    double fraction = value - std::trunc(value);
    if (fraction > 0) {
        return -1;
    }
    if (fraction < 0) {
        return 1;
    }
    return 0;
}

BigInt BigInt::operator-() const {
    BigInt result = *this;
    result.negative_ = !negative_ && !isZero();
    return result;
}

void BigInt::trim() noexcept {
    while (!limbs_.empty() && limbs_.back() == 0) {
        limbs_.pop_back();
    }
    if (limbs_.empty()) {
        negative_ = false;
    }
}

void BigInt::mulAddSmall(uint32_t multiplier, uint32_t addend) {
    uint64_t carry = addend;
    for (auto& limb : limbs_) {
        uint64_t product = static_cast<uint64_t>(limb) * multiplier + carry;
        limb = static_cast<uint32_t>(product);
        carry = product >> 32;
    }
    if (carry) {
        limbs_.push_back(static_cast<uint32_t>(carry));
    }
    trim();
}

uint32_t BigInt::divModSmall(uint32_t divisor) {
    uint64_t remainder = 0;
    for (size_t i = limbs_.size(); i-- > 0;) {
        uint64_t current = (remainder << 32) | limbs_[i];
        limbs_[i] = static_cast<uint32_t>(current / divisor);
        remainder = current % divisor;
    }
    bool negative = negative_;
    trim();
    negative_ = negative && !isZero();
    return static_cast<uint32_t>(remainder);
}

void BigInt::shiftLeft(size_t bits) {
    if (isZero() || bits == 0) {
        return;
    }
    size_t limb_shift = bits / 32;
    unsigned bit_shift = static_cast<unsigned>(bits % 32);

    std::vector<uint32_t> shifted(limbs_.size() + limb_shift + 1, 0);
    for (size_t i = 0; i < limbs_.size(); ++i) {
        uint64_t value = static_cast<uint64_t>(limbs_[i]) << bit_shift;
        shifted[i + limb_shift] |= static_cast<uint32_t>(value);
        shifted[i + limb_shift + 1] |= static_cast<uint32_t>(value >> 32);
    }
    bool negative = negative_;
    limbs_ = std::move(shifted);
    trim();
    negative_ = negative;
}

int BigInt::compareMagnitude(const BigInt& other) const noexcept {
    if (limbs_.size() != other.limbs_.size()) {
        return limbs_.size() < other.limbs_.size() ? -1 : 1;
    }
    for (size_t i = limbs_.size(); i-- > 0;) {
        if (limbs_[i] != other.limbs_[i]) {
            return limbs_[i] < other.limbs_[i] ? -1 : 1;
        }
    }
    return 0;
}

}} // namespace slicecodec::core
