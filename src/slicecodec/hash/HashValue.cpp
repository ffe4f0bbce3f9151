#include "slicecodec/hash/HashValue.hpp"
#include "slicecodec/hash/SipHash.hpp"

#include <cmath>
#include <cstring>

namespace slicecodec {
namespace hash {

namespace {

constexpr uint64_t kCanonicalNaN = 0x7ff8000000000000ULL;

void storeLE64(uint64_t value, uint8_t* out) noexcept {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

void storeLE32(uint32_t value, uint8_t* out) noexcept {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

uint64_t doubleBits(double value) noexcept {
    if (std::isnan(value)) {
        return kCanonicalNaN;
    }
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

// 有整数值且可无损表示为 int64
bool integralInInt64(double value) noexcept {
    return value >= -9223372036854775808.0 && value < 9223372036854775808.0 &&
           std::trunc(value) == value;
}

uint64_t hashPacked(const core::PackedDateTime& packed) noexcept {
    uint8_t buf[8];
    storeLE32(packed.hi & ~core::kFoldBit, buf);
    storeLE32(packed.lo, buf + 4);
    return siphash24(buf, sizeof(buf));
}

} // namespace

uint64_t hashInt64(int64_t value) noexcept {
    if (value == 0) {
        return 0;
    }
    uint8_t buf[8];
    storeLE64(static_cast<uint64_t>(value), buf);
    return siphash24(buf, sizeof(buf));
}

uint64_t hashDouble(double value) {
    if (value == 0.0) {
        return 0;
    }
    if (integralInInt64(value)) {
        return hashInt64(static_cast<int64_t>(value));
    }
    // int64 范围外的整数值与同值的 Number 整数一致
    if (std::isfinite(value) && std::trunc(value) == value) {
        if (auto integer = core::BigInt::fromDouble(value)) {
            return hashBigInt(*integer);
        }
    }
    uint8_t buf[8];
    storeLE64(doubleBits(value), buf);
    return siphash24(buf, sizeof(buf));
}

uint64_t hashFloat32(double value) {
    return hashDouble(core::roundToFloat32(value));
}

uint64_t hashComplex(const core::Complex& value) {
    if (value.imag() == 0.0) {
        return hashDouble(value.real());
    }
    uint8_t buf[16];
    storeLE64(doubleBits(value.real()), buf);
    storeLE64(doubleBits(value.imag()), buf + 8);
    return siphash24(buf, sizeof(buf));
}

uint64_t hashComplex32(const core::Complex& value) {
    return hashComplex(core::Complex(core::roundToFloat32(value.real()),
                                     core::roundToFloat32(value.imag())));
}

uint64_t hashBool(bool value) noexcept {
    return value ? hashInt64(1) : 0;
}

uint64_t hashBigInt(const core::BigInt& value) {
    if (value.fitsInt64()) {
        return hashInt64(value.toInt64());
    }
    std::vector<uint8_t> bytes = value.toTwosComplement();
    return siphash24(bytes.data(), bytes.size());
}

uint64_t hashNumber(const core::Number& value) {
    if (value.isInteger()) {
        return hashBigInt(value.integer());
    }
    return hashDouble(value.floating());
}

uint64_t hashBytes(std::string_view bytes) noexcept {
    if (bytes.empty()) {
        return 0;
    }
    return siphash24(bytes);
}

uint64_t hashText(std::string_view utf8) noexcept {
    return hashBytes(utf8);
}

core::Result<uint64_t> hashAscii(std::string_view text) {
    for (size_t i = 0; i < text.size(); ++i) {
        if (static_cast<unsigned char>(text[i]) > 0x7f) {
            return core::makeError(core::ErrorCode::InvalidEncoding,
                                   fmt::format("Non-ASCII byte 0x{:02x} at offset {}",
                                               static_cast<unsigned char>(text[i]), i));
        }
    }
    return hashBytes(text);
}

uint64_t hashDate(const core::Date& value) noexcept {
    uint8_t buf[4];
    storeLE32(core::packDate(value), buf);
    return siphash24(buf, sizeof(buf));
}

uint64_t hashTime(const core::Time& value) noexcept {
    return hashPacked(core::packTime(value));
}

uint64_t hashDateTime(const core::DateTime& value) noexcept {
    return hashPacked(core::packDateTime(value));
}

uint64_t hashValue(const core::Value& value) {
    return std::visit([](const auto& v) -> uint64_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, core::NoneType>) {
            return 0;
        } else if constexpr (std::is_same_v<T, bool>) {
            return hashBool(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return hashInt64(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return hashDouble(v);
        } else if constexpr (std::is_same_v<T, core::Complex>) {
            return hashComplex(v);
        } else if constexpr (std::is_same_v<T, core::Number>) {
            return hashNumber(v);
        } else if constexpr (std::is_same_v<T, core::Bytes>) {
            return hashBytes(v.data);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return hashText(v);
        } else if constexpr (std::is_same_v<T, core::Json>) {
            return hashText(v.text);
        } else if constexpr (std::is_same_v<T, core::Date>) {
            return hashDate(v);
        } else if constexpr (std::is_same_v<T, core::Time>) {
            return hashTime(v);
        } else {
            return hashDateTime(v);
        }
    }, value);
}

}} // namespace slicecodec::hash
