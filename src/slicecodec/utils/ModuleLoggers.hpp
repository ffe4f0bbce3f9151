#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 编解码模块 (codec)
#define CODEC_DEBUG(...)    SLICECODEC_LOG_DEBUG("[DBG][codc] " __VA_ARGS__)
#define CODEC_INFO(...)     SLICECODEC_LOG_INFO("[INF][codc] " __VA_ARGS__)
#define CODEC_WARN(...)     SLICECODEC_LOG_WARN("[WRN][codc] " __VA_ARGS__)
#define CODEC_ERROR(...)    SLICECODEC_LOG_ERROR("[ERR][codc] " __VA_ARGS__)

// 块流模块 (stream)
#define STREAM_DEBUG(...)    SLICECODEC_LOG_DEBUG("[DBG][strm] " __VA_ARGS__)
#define STREAM_INFO(...)     SLICECODEC_LOG_INFO("[INF][strm] " __VA_ARGS__)
#define STREAM_WARN(...)     SLICECODEC_LOG_WARN("[WRN][strm] " __VA_ARGS__)
#define STREAM_ERROR(...)    SLICECODEC_LOG_ERROR("[ERR][strm] " __VA_ARGS__)

// 列读写模块 (column)
#define COLUMN_DEBUG(...)    SLICECODEC_LOG_DEBUG("[DBG][col ] " __VA_ARGS__)
#define COLUMN_INFO(...)     SLICECODEC_LOG_INFO("[INF][col ] " __VA_ARGS__)
#define COLUMN_WARN(...)     SLICECODEC_LOG_WARN("[WRN][col ] " __VA_ARGS__)
#define COLUMN_ERROR(...)    SLICECODEC_LOG_ERROR("[ERR][col ] " __VA_ARGS__)
#define COLUMN_CRITICAL(...) SLICECODEC_LOG_CRITICAL("[CRT][col ] " __VA_ARGS__)

// 压缩模块 (archive)
#define ARCHIVE_DEBUG(...)    SLICECODEC_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     SLICECODEC_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     SLICECODEC_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    SLICECODEC_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)    SLICECODEC_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)     SLICECODEC_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)    SLICECODEC_LOG_ERROR("[ERR][util] " __VA_ARGS__)

// 命令行模块 (cli)
#define CLI_DEBUG(...)    SLICECODEC_LOG_DEBUG("[DBG][cli ] " __VA_ARGS__)
#define CLI_INFO(...)     SLICECODEC_LOG_INFO("[INF][cli ] " __VA_ARGS__)
#define CLI_ERROR(...)    SLICECODEC_LOG_ERROR("[ERR][cli ] " __VA_ARGS__)

// 示例模块 (examples)
#define EXAMPLE_INFO(...)     SLICECODEC_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define EXAMPLE_WARN(...)     SLICECODEC_LOG_WARN("[WRN][demo] " __VA_ARGS__)
#define EXAMPLE_ERROR(...)    SLICECODEC_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_BLOCK_DEBUG_LOGS
    #define SLICECODEC_LOG_BLOCK_DEBUG(...) STREAM_DEBUG(__VA_ARGS__)
#else
    #define SLICECODEC_LOG_BLOCK_DEBUG(...) do {} while(0)
#endif

#if ENABLE_VALUE_DEBUG_LOGS
    #define SLICECODEC_LOG_VALUE_DEBUG(...) COLUMN_DEBUG(__VA_ARGS__)
#else
    #define SLICECODEC_LOG_VALUE_DEBUG(...) do {} while(0)
#endif
