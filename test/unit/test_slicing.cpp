// SliceCodec 库
// 组件：切片划分测试
//
// 每种列类型、多种切片数、有无 spread_none：每个值恰好落入一个切片，
// 读取端的切片过滤与写入端的划分结果一致。

#include "slicecodec/SliceCodec.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace slicecodec {
namespace column {

namespace {

// 每种类型的规范值（读回后与写入时严格相等），包含 None
std::vector<core::Value> sampleValues(codec::ColumnType type) {
    std::vector<core::Value> values;
    for (int i = 0; i < 64; ++i) {
        if (i % 9 == 4) {
            values.emplace_back(core::None);
            continue;
        }
        switch (type) {
            case codec::ColumnType::Int32:
                values.emplace_back(int64_t{i} * 7919 - 100000);
                break;
            case codec::ColumnType::Int64:
                values.emplace_back((int64_t{i} - 20) * int64_t{1000000007});
                break;
            case codec::ColumnType::Float32:
                values.emplace_back(i * 0.5 - 3.0);
                break;
            case codec::ColumnType::Float64:
                values.emplace_back(i * 1.1 - 7.0);
                break;
            case codec::ColumnType::Complex32:
                values.emplace_back(core::Complex(i * 0.5, (i % 3) * 0.25));
                break;
            case codec::ColumnType::Complex64:
                values.emplace_back(core::Complex(i * 0.1, -i * 0.3));
                break;
            case codec::ColumnType::Bool:
                values.emplace_back(i % 2 == 0);
                break;
            case codec::ColumnType::Number:
                if (i % 3 == 0) {
                    values.emplace_back(core::Number(i * 2.5));
                } else if (i % 3 == 1) {
                    values.emplace_back(core::Number(int64_t{i} - 10));
                } else {
                    values.emplace_back(core::Number(*core::BigInt::parse(
                        "1" + std::string(static_cast<size_t>(i), '7'))));
                }
                break;
            case codec::ColumnType::Bytes:
                values.emplace_back(core::Bytes("b" + std::to_string(i) + std::string(1, '\xf0')));
                break;
            case codec::ColumnType::Ascii:
                values.emplace_back(i == 0 ? std::string() : "a" + std::to_string(i));
                break;
            case codec::ColumnType::Unicode:
                values.emplace_back("\xc3\xa5" + std::to_string(i));
                break;
            case codec::ColumnType::Date:
                values.emplace_back(core::Date(1900 + i * 3, 1 + i % 12, 1 + i % 28));
                break;
            case codec::ColumnType::Time:
                values.emplace_back(core::Time(i % 24, 59 - i % 60, i % 60, static_cast<uint32_t>(i) * 15625, i % 2));
                break;
            case codec::ColumnType::DateTime:
                values.emplace_back(core::DateTime(1789 + i * 5, 1 + i % 12, 1 + i % 28, i % 24, 30 + i % 30,
                                                   i % 60, static_cast<uint32_t>(i) * 82933 % 1000000, i % 2));
                break;
            case codec::ColumnType::Json:
                values.emplace_back(core::Json("{\"i\":" + std::to_string(i) + ",\"s\":[\"\xc3\xa5\",null]}"));
                break;
            default:
                break;
        }
    }
    return values;
}

const std::vector<codec::ColumnType>& storedTypes() {
    static const std::vector<codec::ColumnType> types = {
        codec::ColumnType::Int32, codec::ColumnType::Int64, codec::ColumnType::Float32,
        codec::ColumnType::Float64, codec::ColumnType::Complex32, codec::ColumnType::Complex64,
        codec::ColumnType::Bool, codec::ColumnType::Number, codec::ColumnType::Bytes,
        codec::ColumnType::Ascii, codec::ColumnType::Unicode, codec::ColumnType::Date,
        codec::ColumnType::Time, codec::ColumnType::DateTime, codec::ColumnType::Json,
    };
    return types;
}

} // namespace

class SlicingTest : public ::testing::TestWithParam<codec::ColumnType> {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("", Logger::Level::ERROR, false);
        test_dir_ = std::string("test_slicing_") + codec::columnTypeName(GetParam());
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        Logger::getInstance().shutdown();
    }

    std::string pathFor(const std::string& name) const {
        return test_dir_ + "/" + name;
    }

    std::vector<core::Value> readSlice(const std::string& path, std::optional<HashFilter> filter) const {
        ReaderOptions options;
        options.compression = "none";
        options.hashfilter = filter;
        ColumnReader reader(path, GetParam(), options);
        return reader.readAll();
    }

    std::string test_dir_;
};

TEST_P(SlicingTest, RoundTripKeepsEveryValue) {
    const codec::ColumnType type = GetParam();
    const auto values = sampleValues(type);

    WriterOptions options;
    options.compression = "none";
    options.none_support = true;
    ColumnWriter writer(pathFor("all"), type, options);
    for (const auto& value : values) {
        ASSERT_TRUE(writer.write(value).valueOrThrow()) << core::describe(value);
    }
    writer.finish();

    auto decoded = readSlice(pathFor("all"), std::nullopt);
    ASSERT_EQ(decoded.size(), values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        EXPECT_EQ(decoded[i], values[i]) << "#" << i << " " << core::describe(values[i]);
    }
}

TEST_P(SlicingTest, PartitionIsCompleteAndDisjoint) {
    const codec::ColumnType type = GetParam();
    const auto values = sampleValues(type);

    WriterOptions plain;
    plain.compression = "none";
    plain.none_support = true;
    {
        ColumnWriter writer(pathFor("all"), type, plain);
        for (const auto& value : values) {
            writer.write(value).valueOrThrow();
        }
    }

    for (uint32_t slices : {1u, 2u, 3u, 5u, 8u, 13u, 23u}) {
        for (bool spread : {false, true}) {
            const std::string label = "slices=" + std::to_string(slices) + " spread=" + std::to_string(spread);

            std::vector<std::unique_ptr<ColumnWriter>> writers;
            for (uint32_t sliceno = 0; sliceno < slices; ++sliceno) {
                WriterOptions options = plain;
                options.hashfilter = HashFilter(sliceno, slices, spread);
                writers.push_back(std::make_unique<ColumnWriter>(
                    pathFor("slice." + std::to_string(sliceno)), type, options));
            }

            for (const auto& value : values) {
                int kept = 0;
                for (auto& writer : writers) {
                    bool check = writer->hashcheck(value).valueOrThrow();
                    bool written = writer->write(value).valueOrThrow();
                    EXPECT_EQ(check, written) << label;
                    kept += written ? 1 : 0;
                }
                EXPECT_EQ(kept, 1) << label << " " << core::describe(value);
            }

            int64_t total = 0;
            for (uint32_t sliceno = 0; sliceno < slices; ++sliceno) {
                total += writers[sliceno]->finish().count;
                auto written = readSlice(pathFor("slice." + std::to_string(sliceno)), std::nullopt);
                auto masked = readSlice(pathFor("all"), HashFilter(sliceno, slices, spread));
                EXPECT_EQ(written, masked) << label << " sliceno=" << sliceno;

                if (spread && sliceno != slices - 1) {
                    for (const auto& value : written) {
                        EXPECT_FALSE(core::isNone(value)) << label << " sliceno=" << sliceno;
                    }
                }
            }
            EXPECT_EQ(total, static_cast<int64_t>(values.size())) << label;
        }
    }
}

INSTANTIATE_TEST_SUITE_P(AllTypes, SlicingTest, ::testing::ValuesIn(storedTypes()),
                         [](const ::testing::TestParamInfo<codec::ColumnType>& info) {
                             return std::string(codec::columnTypeName(info.param));
                         });

}} // namespace slicecodec::column
