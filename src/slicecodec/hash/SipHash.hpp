#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace slicecodec {
namespace hash {

/**
 * @brief SipHash-2-4，使用 core::Constants 中的固定密钥
 *
 * 结果与平台字节序无关（输入按小端 64 位字读取）。
 */
uint64_t siphash24(const void* data, size_t size) noexcept;

inline uint64_t siphash24(std::string_view bytes) noexcept {
    return siphash24(bytes.data(), bytes.size());
}

/**
 * @brief 指定密钥的 SipHash-2-4（测试向量用）
 */
uint64_t siphash24(const void* data, size_t size, uint64_t k0, uint64_t k1) noexcept;

}} // namespace slicecodec::hash
