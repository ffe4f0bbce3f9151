#include "slicecodec/codec/NumericCodecs.hpp"
#include "slicecodec/codec/ValueParser.hpp"
#include "slicecodec/codec/WireFormat.hpp"
#include "slicecodec/core/Exception.hpp"
#include "slicecodec/hash/HashValue.hpp"

#include <cmath>
#include <limits>
#include <fmt/format.h>

namespace slicecodec {
namespace codec {

namespace {

template<typename V>
int threeWay(V a, V b) noexcept {
    return a < b ? -1 : (b < a ? 1 : 0);
}

core::Error overflow(const char* type_name, const core::Value& value) {
    return core::makeError(core::ErrorCode::Overflow,
                           fmt::format("{} value {} out of range", type_name, core::describe(value)));
}

} // namespace

// ========== IntegerCodec ==========

template<typename T>
core::Result<core::Value> IntegerCodec<T>::checkRange(int64_t value, const core::Value& original) const {
    // 最小值是 None 标记
    constexpr int64_t kMin = static_cast<int64_t>(std::numeric_limits<T>::min()) + 1;
    constexpr int64_t kMax = static_cast<int64_t>(std::numeric_limits<T>::max());
    if (value < kMin || value > kMax) {
        return overflow(name(), original);
    }
    return core::Value(value);
}

template<typename T>
core::Result<core::Value> IntegerCodec<T>::fromDouble(double value, const core::Value& original) const {
    if (std::isnan(value) || std::isinf(value)) {
        return rejected(original, "not a finite number");
    }
    double truncated = std::trunc(value);
    if (truncated < -9223372036854775808.0 || truncated >= 9223372036854775808.0) {
        return overflow(name(), original);
    }
    return checkRange(static_cast<int64_t>(truncated), original);
}

template<typename T>
core::Result<core::Value> IntegerCodec<T>::convert(const core::Value& value) const {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return core::Value(int64_t{*flag ? 1 : 0});
    }
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return checkRange(*integer, value);
    }
    if (const auto* number = std::get_if<core::Number>(&value)) {
        if (number->isInteger()) {
            if (!number->integer().fitsInt64()) {
                return overflow(name(), value);
            }
            return checkRange(number->integer().toInt64(), value);
        }
        if (parsed_) {
            return fromDouble(number->floating(), value);
        }
        return mismatch(value);
    }
    if (parsed_) {
        if (const auto* floating = std::get_if<double>(&value)) {
            return fromDouble(*floating, value);
        }
        if (const std::string* text = textOf(value)) {
            auto parsed = parseInt64(*text);
            if (!parsed) {
                if (parsed.error().code == core::ErrorCode::Overflow) {
                    return overflow(name(), value);
                }
                return rejected(value, "not an integer");
            }
            return checkRange(parsed.value(), value);
        }
    }
    return mismatch(value);
}

template<typename T>
void IntegerCodec<T>::encode(const core::Value& value, std::string& out) const {
    if (core::isNone(value)) {
        appendLE<T>(out, std::numeric_limits<T>::min());
        return;
    }
    appendLE<T>(out, static_cast<T>(std::get<int64_t>(value)));
}

template<typename T>
std::optional<core::Value> IntegerCodec<T>::decode(stream::ByteSource& source) const {
    uint8_t buf[sizeof(T)];
    if (!source.readExact(buf, sizeof(buf))) {
        return std::nullopt;
    }
    T value = loadLE<T>(buf);
    if (value == std::numeric_limits<T>::min()) {
        return core::Value(core::None);
    }
    return core::Value(static_cast<int64_t>(value));
}

template<typename T>
uint64_t IntegerCodec<T>::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashInt64(std::get<int64_t>(value));
}

template<typename T>
int IntegerCodec<T>::compare(const core::Value& a, const core::Value& b) const {
    return threeWay(std::get<int64_t>(a), std::get<int64_t>(b));
}

// ========== FloatCodec ==========

template<typename T>
double FloatCodec<T>::narrow(double value) noexcept {
    if constexpr (std::is_same_v<T, float>) {
        return core::roundToFloat32(value);
    } else {
        return value;
    }
}

template<typename T>
core::Result<core::Value> FloatCodec<T>::convert(const core::Value& value) const {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return core::Value(*flag ? 1.0 : 0.0);
    }
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return core::Value(narrow(static_cast<double>(*integer)));
    }
    if (const auto* floating = std::get_if<double>(&value)) {
        return core::Value(narrow(*floating));
    }
    if (const auto* number = std::get_if<core::Number>(&value)) {
        // 超大整数在 toDouble() 中已截断为 ±inf
        return core::Value(narrow(number->toDouble()));
    }
    if (parsed_) {
        if (const std::string* text = textOf(value)) {
            auto parsed = parseDouble(*text);
            if (!parsed) {
                return rejected(value, "not a float");
            }
            return core::Value(narrow(parsed.value()));
        }
    }
    return mismatch(value);
}

template<typename T>
void FloatCodec<T>::encode(const core::Value& value, std::string& out) const {
    bool none = core::isNone(value);
    if constexpr (std::is_same_v<T, float>) {
        appendLE<uint32_t>(out, none ? WireFormat::kFloat32NoneBits : float32Bits(std::get<double>(value)));
    } else {
        appendLE<uint64_t>(out, none ? WireFormat::kFloat64NoneBits : float64Bits(std::get<double>(value)));
    }
}

template<typename T>
std::optional<core::Value> FloatCodec<T>::decode(stream::ByteSource& source) const {
    uint8_t buf[sizeof(T)];
    if (!source.readExact(buf, sizeof(buf))) {
        return std::nullopt;
    }
    if constexpr (std::is_same_v<T, float>) {
        uint32_t bits = loadLE<uint32_t>(buf);
        if (bits == WireFormat::kFloat32NoneBits) {
            return core::Value(core::None);
        }
        return core::Value(float32FromBits(bits));
    } else {
        uint64_t bits = loadLE<uint64_t>(buf);
        if (bits == WireFormat::kFloat64NoneBits) {
            return core::Value(core::None);
        }
        return core::Value(float64FromBits(bits));
    }
}

template<typename T>
uint64_t FloatCodec<T>::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashDouble(std::get<double>(value));
}

template<typename T>
int FloatCodec<T>::compare(const core::Value& a, const core::Value& b) const {
    double x = std::get<double>(a);
    double y = std::get<double>(b);
    if (std::isnan(x) || std::isnan(y)) {
        return 2;
    }
    return threeWay(x, y);
}

// ========== ComplexCodec ==========

template<typename T>
core::Complex ComplexCodec<T>::narrow(const core::Complex& value) noexcept {
    if constexpr (std::is_same_v<T, float>) {
        return core::Complex(core::roundToFloat32(value.real()), core::roundToFloat32(value.imag()));
    } else {
        return value;
    }
}

template<typename T>
core::Result<core::Value> ComplexCodec<T>::convert(const core::Value& value) const {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return core::Value(core::Complex(*flag ? 1.0 : 0.0, 0.0));
    }
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return core::Value(narrow(core::Complex(static_cast<double>(*integer), 0.0)));
    }
    if (const auto* floating = std::get_if<double>(&value)) {
        return core::Value(narrow(core::Complex(*floating, 0.0)));
    }
    if (const auto* number = std::get_if<core::Number>(&value)) {
        return core::Value(narrow(core::Complex(number->toDouble(), 0.0)));
    }
    if (const auto* complex = std::get_if<core::Complex>(&value)) {
        return core::Value(narrow(*complex));
    }
    if (parsed_) {
        if (const std::string* text = textOf(value)) {
            auto parsed = parseComplex(*text);
            if (!parsed) {
                return rejected(value, "not a complex number");
            }
            return core::Value(narrow(parsed.value()));
        }
    }
    return mismatch(value);
}

template<typename T>
void ComplexCodec<T>::encode(const core::Value& value, std::string& out) const {
    if (core::isNone(value)) {
        for (int part = 0; part < 2; ++part) {
            if constexpr (std::is_same_v<T, float>) {
                appendLE<uint32_t>(out, WireFormat::kFloat32NoneBits);
            } else {
                appendLE<uint64_t>(out, WireFormat::kFloat64NoneBits);
            }
        }
        return;
    }
    const auto& complex = std::get<core::Complex>(value);
    if constexpr (std::is_same_v<T, float>) {
        appendLE<uint32_t>(out, float32Bits(complex.real()));
        appendLE<uint32_t>(out, float32Bits(complex.imag()));
    } else {
        appendLE<uint64_t>(out, float64Bits(complex.real()));
        appendLE<uint64_t>(out, float64Bits(complex.imag()));
    }
}

template<typename T>
std::optional<core::Value> ComplexCodec<T>::decode(stream::ByteSource& source) const {
    uint8_t buf[2 * sizeof(T)];
    if (!source.readExact(buf, sizeof(buf))) {
        return std::nullopt;
    }
    if constexpr (std::is_same_v<T, float>) {
        uint32_t real = loadLE<uint32_t>(buf);
        uint32_t imag = loadLE<uint32_t>(buf + 4);
        if (real == WireFormat::kFloat32NoneBits && imag == WireFormat::kFloat32NoneBits) {
            return core::Value(core::None);
        }
        return core::Value(core::Complex(float32FromBits(real), float32FromBits(imag)));
    } else {
        uint64_t real = loadLE<uint64_t>(buf);
        uint64_t imag = loadLE<uint64_t>(buf + 8);
        if (real == WireFormat::kFloat64NoneBits && imag == WireFormat::kFloat64NoneBits) {
            return core::Value(core::None);
        }
        return core::Value(core::Complex(float64FromBits(real), float64FromBits(imag)));
    }
}

template<typename T>
uint64_t ComplexCodec<T>::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashComplex(std::get<core::Complex>(value));
}

// ========== BoolCodec ==========

core::Result<core::Value> BoolCodec::convert(const core::Value& value) const {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return core::Value(*flag);
    }
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return core::Value(*integer != 0);
    }
    if (const auto* number = std::get_if<core::Number>(&value)) {
        return core::Value(!number->isZero());
    }
    return mismatch(value);
}

void BoolCodec::encode(const core::Value& value, std::string& out) const {
    if (core::isNone(value)) {
        out.push_back(static_cast<char>(WireFormat::kBoolNone));
        return;
    }
    out.push_back(std::get<bool>(value) ? '\1' : '\0');
}

std::optional<core::Value> BoolCodec::decode(stream::ByteSource& source) const {
    uint8_t byte = 0;
    if (!source.readExact(&byte, 1)) {
        return std::nullopt;
    }
    if (byte == WireFormat::kBoolNone) {
        return core::Value(core::None);
    }
    if (byte > 1) {
        SLICECODEC_THROW_FILE(fmt::format("Invalid bool byte 0x{:02x}", byte), source.name(),
                              core::ErrorCode::FileCorrupted);
    }
    return core::Value(byte == 1);
}

uint64_t BoolCodec::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashBool(std::get<bool>(value));
}

int BoolCodec::compare(const core::Value& a, const core::Value& b) const {
    return threeWay(std::get<bool>(a), std::get<bool>(b));
}

template class IntegerCodec<int32_t>;
template class IntegerCodec<int64_t>;
template class FloatCodec<float>;
template class FloatCodec<double>;
template class ComplexCodec<float>;
template class ComplexCodec<double>;

}} // namespace slicecodec::codec
