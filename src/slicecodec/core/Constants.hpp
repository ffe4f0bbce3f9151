#pragma once

#include <cstddef>
#include <cstdint>

namespace slicecodec {
namespace core {

// 通用常量集中定义，编译期固定，运行时不可修改
struct Constants {
    // 块流内部缓冲区大小（未压缩字节）
    static constexpr size_t kBlockSize = 128 * 1024;

    // 压缩输出缓冲区大小
    static constexpr size_t kIOBufferSize = 64 * 1024;

    // gzip 默认压缩级别
    static constexpr int kDefaultCompressionLevel = 6;

    // SipHash-2-4 固定密钥（两个 64 位小端字）
    static constexpr uint64_t kHashKey0 = 0x736c696365636f64ULL;
    static constexpr uint64_t kHashKey1 = 0x6563686173686b31ULL;

    // 日期时间的年份范围
    static constexpr int kMinYear = 1;
    static constexpr int kMaxYear = 9999;
};

} // namespace core
} // namespace slicecodec
