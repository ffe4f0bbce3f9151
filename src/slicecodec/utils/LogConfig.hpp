#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的逐值/逐块调试日志，设置为 1 启用

#define ENABLE_BLOCK_DEBUG_LOGS 0    // 块刷新/读取的调试日志（每 128 KiB 一条）
#define ENABLE_VALUE_DEBUG_LOGS 0    // 逐值写入的调试日志，量很大
