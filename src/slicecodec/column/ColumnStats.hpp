#pragma once

#include "slicecodec/codec/ColumnType.hpp"
#include "slicecodec/core/Value.hpp"

#include <cstdint>
#include <string>

namespace slicecodec {
namespace column {

/**
 * @brief 写入器完成时报告的列文件属性
 *
 * min/max 只统计非 None、非 NaN 值，无序类型（复数、字符串）或没有可统计的值时为 None。
 */
struct ColumnStats {
    codec::ColumnType type = codec::ColumnType::Int64;
    std::string compression;
    bool none_support = false;
    int64_t count = 0;
    core::Value min;
    core::Value max;
    uint64_t uncompressed_bytes = 0;
};

}} // namespace slicecodec::column
