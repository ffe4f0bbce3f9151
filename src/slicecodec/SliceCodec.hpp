#pragma once

// SliceCodec库 - 带类型的列式切片编解码
// 每个 (列, 切片) 一个文件，按哈希划分切片

// 标准库依赖
#include <string>

// 核心类型
#include "slicecodec/core/ErrorCode.hpp"
#include "slicecodec/core/Exception.hpp"
#include "slicecodec/core/Expected.hpp"
#include "slicecodec/core/Value.hpp"

// 编解码与哈希
#include "slicecodec/codec/ColumnType.hpp"
#include "slicecodec/codec/TypeCodec.hpp"
#include "slicecodec/hash/HashValue.hpp"

// 读写接口
#include "slicecodec/column/ColumnOptions.hpp"
#include "slicecodec/column/ColumnReader.hpp"
#include "slicecodec/column/ColumnStats.hpp"
#include "slicecodec/column/ColumnWriter.hpp"

#include "slicecodec/utils/Logger.hpp"

// 版本信息
#define SLICECODEC_VERSION_MAJOR 1
#define SLICECODEC_VERSION_MINOR 0
#define SLICECODEC_VERSION_PATCH 0
#define SLICECODEC_VERSION_STRING "1.0.0"

namespace slicecodec {

inline std::string getVersion() {
    return SLICECODEC_VERSION_STRING;
}

/**
 * @brief 初始化日志系统
 * @param log_file_path 日志文件路径，空字符串表示不写文件
 * @param level 日志级别
 * @param enable_console 是否输出到 stderr
 * @return 初始化是否成功
 */
bool initialize(const std::string& log_file_path = "",
                Logger::Level level = Logger::Level::INFO,
                bool enable_console = true);

/**
 * @brief 刷新并关闭日志系统
 */
void cleanup();

// 常用类型别名
using ColumnType = codec::ColumnType;
using ColumnWriter = column::ColumnWriter;
using ColumnReader = column::ColumnReader;
using ColumnStats = column::ColumnStats;
using WriterOptions = column::WriterOptions;
using ReaderOptions = column::ReaderOptions;
using HashFilter = column::HashFilter;
using CallbackAction = column::CallbackAction;
using Value = core::Value;

} // namespace slicecodec
