#include "slicecodec/hash/SipHash.hpp"
#include "slicecodec/core/Constants.hpp"

namespace slicecodec {
namespace hash {

namespace {

inline uint64_t rotl(uint64_t x, int b) noexcept {
    return (x << b) | (x >> (64 - b));
}

inline uint64_t load64le(const uint8_t* p) noexcept {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

struct SipState {
    uint64_t v0, v1, v2, v3;

    SipState(uint64_t k0, uint64_t k1) noexcept
        : v0(0x736f6d6570736575ULL ^ k0),
          v1(0x646f72616e646f6dULL ^ k1),
          v2(0x6c7967656e657261ULL ^ k0),
          v3(0x7465646279746573ULL ^ k1) {}

    void round() noexcept {
        v0 += v1; v1 = rotl(v1, 13); v1 ^= v0; v0 = rotl(v0, 32);
        v2 += v3; v3 = rotl(v3, 16); v3 ^= v2;
        v0 += v3; v3 = rotl(v3, 21); v3 ^= v0;
        v2 += v1; v1 = rotl(v1, 17); v1 ^= v2; v2 = rotl(v2, 32);
    }

    void compress(uint64_t m) noexcept {
        v3 ^= m;
        round();
        round();
        v0 ^= m;
    }

    uint64_t finalize() noexcept {
        v2 ^= 0xff;
        round();
        round();
        round();
        round();
        return v0 ^ v1 ^ v2 ^ v3;
    }
};

} // namespace

uint64_t siphash24(const void* data, size_t size, uint64_t k0, uint64_t k1) noexcept {
    const auto* in = static_cast<const uint8_t*>(data);
    SipState state(k0, k1);

    const size_t full = size & ~static_cast<size_t>(7);
    for (size_t i = 0; i < full; i += 8) {
        state.compress(load64le(in + i));
    }

    // 尾部不足 8 字节，最高字节放入长度
    uint64_t last = static_cast<uint64_t>(size & 0xff) << 56;
    for (size_t i = 0; i < (size & 7); ++i) {
        last |= static_cast<uint64_t>(in[full + i]) << (8 * i);
    }
    state.compress(last);
    return state.finalize();
}

uint64_t siphash24(const void* data, size_t size) noexcept {
    return siphash24(data, size, core::Constants::kHashKey0, core::Constants::kHashKey1);
}

}} // namespace slicecodec::hash
