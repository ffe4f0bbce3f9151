// SliceCodec 库
// 组件：哈希模块测试
//
// SipHash-2-4 参考向量以及跨类型一致的值哈希规则。

#include "slicecodec/hash/HashValue.hpp"
#include "slicecodec/hash/SipHash.hpp"
#include "slicecodec/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <cstring>
#include <limits>
#include <vector>

namespace slicecodec {
namespace hash {

class HashTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("", Logger::Level::ERROR, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    // double 的 8 字节小端表示的哈希
    static uint64_t rawDoubleHash(double value) {
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        uint8_t buf[8];
        for (int i = 0; i < 8; ++i) {
            buf[i] = static_cast<uint8_t>(bits >> (8 * i));
        }
        return siphash24(buf, sizeof(buf));
    }

    static uint64_t rawComplexHash(double real, double imag) {
        uint8_t buf[16];
        uint64_t bits;
        std::memcpy(&bits, &real, sizeof(bits));
        for (int i = 0; i < 8; ++i) {
            buf[i] = static_cast<uint8_t>(bits >> (8 * i));
        }
        std::memcpy(&bits, &imag, sizeof(bits));
        for (int i = 0; i < 8; ++i) {
            buf[8 + i] = static_cast<uint8_t>(bits >> (8 * i));
        }
        return siphash24(buf, sizeof(buf));
    }
};

// SipHash 论文中的参考向量（密钥 00..0f）
TEST_F(HashTest, SipHashReferenceVectors) {
    const uint64_t k0 = 0x0706050403020100ULL;
    const uint64_t k1 = 0x0f0e0d0c0b0a0908ULL;

    EXPECT_EQ(siphash24("", 0, k0, k1), 0x726fdb47dd0e0e31ULL);

    uint8_t message[15];
    for (int i = 0; i < 15; ++i) {
        message[i] = static_cast<uint8_t>(i);
    }
    EXPECT_EQ(siphash24(message, sizeof(message), k0, k1), 0xa129ca6149be45e5ULL);
}

TEST_F(HashTest, FixedKeyIsDeterministic) {
    EXPECT_EQ(siphash24("slice"), siphash24("slice"));
    EXPECT_NE(siphash24("slice"), siphash24("slicf"));
}

TEST_F(HashTest, FalsyValuesHashToZero) {
    EXPECT_EQ(hashValue(core::Value(core::None)), 0u);
    EXPECT_EQ(hashInt64(0), 0u);
    EXPECT_EQ(hashDouble(0.0), 0u);
    EXPECT_EQ(hashDouble(-0.0), 0u);
    EXPECT_EQ(hashBool(false), 0u);
    EXPECT_EQ(hashBytes(""), 0u);
    EXPECT_EQ(hashText(""), 0u);
    EXPECT_EQ(hashComplex(core::Complex(0.0, 0.0)), 0u);
    EXPECT_EQ(hashNumber(core::Number(int64_t{0})), 0u);
    EXPECT_EQ(hashNumber(core::Number(0.0)), 0u);
}

TEST_F(HashTest, EqualNumbersHashEqual) {
    uint64_t five = hashInt64(5);
    EXPECT_NE(five, 0u);
    EXPECT_EQ(hashDouble(5.0), five);
    EXPECT_EQ(hashFloat32(5.0), five);
    EXPECT_EQ(hashNumber(core::Number(int64_t{5})), five);
    EXPECT_EQ(hashNumber(core::Number(5.0)), five);
    EXPECT_EQ(hashComplex(core::Complex(5.0, 0.0)), five);
    EXPECT_EQ(hashBool(true), hashInt64(1));
    EXPECT_EQ(hashValue(core::Value(true)), hashValue(core::Value(int64_t{1})));

    // 超出 int64 的整数值浮点数与同值的大整数一致
    const double two_pow_70 = std::ldexp(1.0, 70);
    auto big = core::BigInt::parse("1180591620717411303424");
    ASSERT_TRUE(big.has_value());
    EXPECT_EQ(hashDouble(two_pow_70), hashBigInt(*big));
    EXPECT_EQ(hashDouble(two_pow_70), hashNumber(core::Number(*big)));
    EXPECT_EQ(hashNumber(core::Number(two_pow_70)), hashNumber(core::Number(*big)));
    EXPECT_EQ(hashFloat32(two_pow_70), hashBigInt(*big));
    EXPECT_EQ(hashComplex(core::Complex(-two_pow_70, 0.0)), hashBigInt(-*big));
    EXPECT_NE(hashDouble(two_pow_70), rawDoubleHash(two_pow_70));
    EXPECT_EQ(hashDouble(1e19), hashBigInt(*core::BigInt::parse("10000000000000000000")));
}

TEST_F(HashTest, NonIntegralFloatsHashTheirBits) {
    EXPECT_EQ(hashDouble(1.5), rawDoubleHash(1.5));
    EXPECT_EQ(hashDouble(1.1), rawDoubleHash(1.1));
    EXPECT_EQ(hashNumber(core::Number(1.1)), rawDoubleHash(1.1));
}

TEST_F(HashTest, Float32RoundsBeforeHashing) {
    const double f32_of_1_1 = 1.100000023841858;
    EXPECT_EQ(hashFloat32(1.5), rawDoubleHash(1.5));
    EXPECT_EQ(hashFloat32(1.1), rawDoubleHash(f32_of_1_1));
    EXPECT_EQ(hashFloat32(f32_of_1_1), hashDouble(f32_of_1_1));
    EXPECT_NE(hashFloat32(1.1), hashDouble(1.1));

    // 8765432.1 舍入到 float32 后为整数 8765432
    EXPECT_EQ(hashFloat32(8765432.1), hashInt64(8765432));
    EXPECT_EQ(hashComplex32(core::Complex(8765432.1, 0.0)), hashInt64(8765432));
}

TEST_F(HashTest, ComplexHashing) {
    EXPECT_EQ(hashComplex(core::Complex(1.5, 1.1)), rawComplexHash(1.5, 1.1));
    EXPECT_EQ(hashComplex32(core::Complex(1.5, 1.1)), rawComplexHash(1.5, 1.100000023841858));
    EXPECT_EQ(hashComplex(core::Complex(1.5, 0.0)), hashDouble(1.5));
}

TEST_F(HashTest, NaNHashesCanonically) {
    double quiet = std::numeric_limits<double>::quiet_NaN();
    double negative = -quiet;
    EXPECT_EQ(hashDouble(quiet), hashDouble(negative));
    EXPECT_NE(hashDouble(quiet), 0u);
}

TEST_F(HashTest, BigIntegersHashTwosComplement) {
    auto big = core::BigInt::parse("18446744073709551616");  // 2^64
    ASSERT_TRUE(big.has_value());
    const uint8_t expected[] = {0, 0, 0, 0, 0, 0, 0, 0, 1};
    EXPECT_EQ(hashBigInt(*big), siphash24(expected, sizeof(expected)));
    EXPECT_EQ(hashNumber(core::Number(*big)), hashBigInt(*big));

    auto small = core::BigInt::parse("-42");
    ASSERT_TRUE(small.has_value());
    EXPECT_EQ(hashBigInt(*small), hashInt64(-42));
}

TEST_F(HashTest, TextHashesUtf8Bytes) {
    EXPECT_EQ(hashText("abc"), hashBytes("abc"));
    EXPECT_EQ(hashValue(core::Value(std::string("abc"))), hashValue(core::Value(core::Bytes("abc"))));
    // "ä" 的 UTF-8 与 latin-1 编码不同
    EXPECT_NE(hashText("\xc3\xa4"), hashBytes("\xe4"));
    EXPECT_EQ(hashText("\xc3\xa4"), hashBytes("\xc3\xa4"));
}

TEST_F(HashTest, AsciiRejectsHighBytes) {
    auto ok = hashAscii("abc");
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), hashBytes("abc"));

    auto bad = hashAscii("a\xe4");
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code, core::ErrorCode::InvalidEncoding);
}

TEST_F(HashTest, TemporalHashIgnoresFold) {
    core::Time plain(1, 30, 0, 0, 0);
    core::Time folded(1, 30, 0, 0, 1);
    EXPECT_EQ(hashTime(plain), hashTime(folded));
    EXPECT_EQ(hashDateTime(core::DateTime(2024, 10, 27, 2, 30, 0, 0, 0)),
              hashDateTime(core::DateTime(2024, 10, 27, 2, 30, 0, 0, 1)));
    EXPECT_NE(hashDate(core::Date(2024, 1, 1)), hashDate(core::Date(2024, 1, 2)));
    EXPECT_NE(hashDate(core::Date(2024, 1, 1)), 0u);
}

TEST_F(HashTest, TemporalHashKeepsMinute) {
    EXPECT_NE(hashTime(core::Time(2, 10, 0, 0, 1)), hashTime(core::Time(2, 42, 0, 0, 0)));
    EXPECT_NE(hashDateTime(core::DateTime(1789, 7, 14, 12, 10, 1, 82933, 0)),
              hashDateTime(core::DateTime(1789, 7, 14, 12, 42, 1, 82933, 0)));
    EXPECT_EQ(hashTime(core::Time(12, 42, 0, 0, 0)), hashTime(core::Time(12, 42, 0, 0, 1)));
}

}} // namespace slicecodec::hash
