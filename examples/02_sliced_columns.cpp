/**
 * @file 02_sliced_columns.cpp
 * @brief 按哈希切片写入并带进度回调读取
 *
 * 同一批 unicode 值写入 3 个切片文件，每个值只落入其中一个切片；
 * 然后读取每个切片，每 2 个值回调一次。
 */

#include "slicecodec/SliceCodec.hpp"
#include "slicecodec/utils/ModuleLoggers.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace slicecodec;

int main() {
    if (!slicecodec::initialize("", Logger::Level::INFO, true)) {
        return 1;
    }

    const uint32_t slices = 3;
    const std::vector<std::string> words = {
        "alpha", "beta", "gamma", "delta", "epsilon", "zeta", "eta", "theta", "\xc3\xa5sa"
    };

    try {
        std::vector<std::unique_ptr<ColumnWriter>> writers;
        for (uint32_t sliceno = 0; sliceno < slices; ++sliceno) {
            WriterOptions options;
            options.hashfilter = HashFilter(sliceno, slices);
            writers.push_back(std::make_unique<ColumnWriter>(
                "example_words." + std::to_string(sliceno), ColumnType::Unicode, options));
        }

        for (const auto& word : words) {
            for (auto& writer : writers) {
                writer->write(Value(word)).valueOrThrow();
            }
        }

        for (uint32_t sliceno = 0; sliceno < slices; ++sliceno) {
            ColumnStats stats = writers[sliceno]->finish();
            EXAMPLE_INFO("切片 {}: {} 个值", sliceno, stats.count);
        }

        for (uint32_t sliceno = 0; sliceno < slices; ++sliceno) {
            ReaderOptions options;
            options.callback_interval = 2;
            options.callback = [sliceno](int64_t progress) {
                EXAMPLE_INFO("切片 {} 进度: {}", sliceno, progress);
                return CallbackAction::Continue;
            };

            ColumnReader reader("example_words." + std::to_string(sliceno), ColumnType::Unicode, options);
            for (const auto& value : reader.readAll()) {
                EXAMPLE_INFO("  [{}] {}", sliceno, core::describe(value));
            }
        }
    } catch (const core::SliceCodecException& e) {
        EXAMPLE_ERROR("示例失败: {}", e.what());
        slicecodec::cleanup();
        return 1;
    }

    slicecodec::cleanup();
    return 0;
}
