/**
 * @file 01_write_read_column.cpp
 * @brief SliceCodec 基本用法示例
 *
 * 写入一个 int64 列文件，再逐值读回：
 * - 支持 None 的写入器
 * - 被拒绝的值与默认值
 * - 写入统计信息
 * - 范围 for 读取
 */

#include "slicecodec/SliceCodec.hpp"
#include "slicecodec/utils/ModuleLoggers.hpp"

#include <string>

using namespace slicecodec;

int main() {
    if (!slicecodec::initialize("", Logger::Level::INFO, true)) {
        return 1;
    }

    const std::string path = "example_int64.gz";

    try {
        WriterOptions options;
        options.none_support = true;
        options.default_value = Value(int64_t{-1});

        {
            ColumnWriter writer(path, ColumnType::Int64, options);
            writer.write(Value(int64_t{42})).valueOrThrow();
            writer.write(Value(core::NoneType{})).valueOrThrow();
            writer.write(Value(3.0)).valueOrThrow();

            // 不是数值的字符串被默认值替换
            auto kept = writer.write(Value(std::string("not a number")));
            EXAMPLE_INFO("字符串写入结果: {}", kept.hasValue() ? "已用默认值替换" : kept.error().message);

            ColumnStats stats = writer.finish();
            EXAMPLE_INFO("写入 {} 个值, min={}, max={}, 压缩={}",
                         stats.count, core::describe(stats.min), core::describe(stats.max),
                         stats.compression);
        }

        ColumnReader reader(path, ColumnType::Int64);
        for (const auto& value : reader) {
            EXAMPLE_INFO("  {}", core::describe(value));
        }
        EXAMPLE_INFO("共读取 {} 个值", reader.count());
    } catch (const core::SliceCodecException& e) {
        EXAMPLE_ERROR("示例失败: {}", e.what());
        slicecodec::cleanup();
        return 1;
    }

    slicecodec::cleanup();
    return 0;
}
