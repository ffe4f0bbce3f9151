#pragma once

#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>

namespace slicecodec {
namespace codec {

/**
 * @file WireFormat.hpp
 * @brief 定长字段的小端读写与 None 标记
 */

struct WireFormat {
    // 浮点 None 标记：与规范 NaN 不同的保留 NaN 负载
    static constexpr uint64_t kFloat64NoneBits = 0xfff8000000000badULL;
    static constexpr uint32_t kFloat32NoneBits = 0xffc00badu;
    static constexpr uint64_t kFloat64NaNBits = 0x7ff8000000000000ULL;
    static constexpr uint32_t kFloat32NaNBits = 0x7fc00000u;

    static constexpr uint8_t kBoolNone = 255;

    // 字符串长度前缀
    static constexpr uint8_t kLongStringMarker = 255;
    static constexpr uint32_t kStringNoneLength = 0xffffffffu;

    // Number 标签
    static constexpr uint8_t kNumberNone = 0;
    static constexpr uint8_t kNumberFloat = 1;
    static constexpr uint8_t kNumberInt16 = 2;
    static constexpr uint8_t kNumberInt32 = 4;
    static constexpr uint8_t kNumberInt64 = 8;
    static constexpr uint8_t kNumberMinInline = 9;
    static constexpr uint8_t kNumberMaxInline = 126;
    static constexpr uint8_t kNumberLong = 127;
    static constexpr uint8_t kNumberSmallBase = 128;
    static constexpr int kNumberSmallOffset = 133;  // 标签 = 值 + 133
    static constexpr int kNumberSmallMin = -5;
    static constexpr int kNumberSmallMax = 122;
};

template<typename T>
inline void appendLE(std::string& out, T value) {
    static_assert(std::is_integral_v<T>, "appendLE requires an integral type");
    using U = std::make_unsigned_t<T>;
    U bits = static_cast<U>(value);
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<char>(static_cast<uint8_t>(bits >> (8 * i))));
    }
}

template<typename T>
inline T loadLE(const uint8_t* data) noexcept {
    static_assert(std::is_integral_v<T>, "loadLE requires an integral type");
    using U = std::make_unsigned_t<T>;
    U bits = 0;
    for (size_t i = sizeof(T); i-- > 0;) {
        bits = static_cast<U>((bits << 8) | data[i]);
    }
    return static_cast<T>(bits);
}

// NaN 统一为规范负载，避免与 None 标记冲突
inline uint64_t float64Bits(double value) noexcept {
    if (std::isnan(value)) {
        return WireFormat::kFloat64NaNBits;
    }
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

inline uint32_t float32Bits(double value) noexcept {
    if (std::isnan(value)) {
        return WireFormat::kFloat32NaNBits;
    }
    float narrowed = static_cast<float>(value);
    uint32_t bits;
    std::memcpy(&bits, &narrowed, sizeof(bits));
    return bits;
}

inline double float64FromBits(uint64_t bits) noexcept {
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

inline double float32FromBits(uint32_t bits) noexcept {
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return static_cast<double>(value);
}

}} // namespace slicecodec::codec
