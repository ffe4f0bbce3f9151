// SliceCodec 库
// 组件：列写入器测试
//
// 覆盖值转换、默认值替换、切片过滤、统计信息以及失败状态。

#include "slicecodec/SliceCodec.hpp"
#include "slicecodec/hash/HashValue.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <limits>
#include <memory>
#include <set>
#include <string>
#include <vector>

#ifndef _WIN32
#include <csignal>
#include <sys/resource.h>
#endif

namespace slicecodec {
namespace column {

class ColumnWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("", Logger::Level::ERROR, false);
        test_dir_ = "test_column_writer";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        Logger::getInstance().shutdown();
    }

    std::string pathFor(const std::string& name) const {
        return test_dir_ + "/" + name;
    }

    static std::vector<core::Value> readBack(const std::string& path, codec::ColumnType type,
                                             const std::string& compression = "gzip") {
        ReaderOptions options;
        options.compression = compression;
        ColumnReader reader(path, type, options);
        return reader.readAll();
    }

    std::string test_dir_;
};

TEST_F(ColumnWriterTest, WritesAndCounts) {
    std::string path = pathFor("ints");
    ColumnWriter writer(path, codec::ColumnType::Int64);
    for (int64_t i = 1; i <= 10; ++i) {
        auto written = writer.write(core::Value(i * 100));
        ASSERT_TRUE(written.hasValue());
        EXPECT_TRUE(written.value());
    }
    EXPECT_EQ(writer.count(), 10);
    ColumnStats stats = writer.finish();
    EXPECT_EQ(stats.count, 10);
    EXPECT_EQ(stats.compression, "gzip");
    EXPECT_EQ(stats.type, codec::ColumnType::Int64);
    EXPECT_EQ(stats.uncompressed_bytes, 80u);
    EXPECT_EQ(stats.min, core::Value(int64_t{100}));
    EXPECT_EQ(stats.max, core::Value(int64_t{1000}));

    auto values = readBack(path, codec::ColumnType::Int64);
    ASSERT_EQ(values.size(), 10u);
    EXPECT_EQ(values.front(), core::Value(int64_t{100}));
    EXPECT_EQ(values.back(), core::Value(int64_t{1000}));
}

TEST_F(ColumnWriterTest, RejectedValuesLeaveNoTrace) {
    std::string path = pathFor("rejects");
    ColumnWriter writer(path, codec::ColumnType::Int32);
    EXPECT_TRUE(writer.write(core::Value(int64_t{1})).hasValue());

    auto mismatch = writer.write(core::Value(std::string("two")));
    ASSERT_TRUE(mismatch.hasError());
    EXPECT_EQ(mismatch.error().code, core::ErrorCode::TypeMismatch);

    auto overflow = writer.write(core::Value(int64_t{1} << 40));
    ASSERT_TRUE(overflow.hasError());
    EXPECT_EQ(overflow.error().code, core::ErrorCode::Overflow);

    auto none = writer.write(core::Value(core::None));
    ASSERT_TRUE(none.hasError());
    EXPECT_EQ(none.error().code, core::ErrorCode::NoneNotAllowed);

    EXPECT_TRUE(writer.write(core::Value(int64_t{3})).hasValue());
    EXPECT_EQ(writer.finish().count, 2);

    auto values = readBack(path, codec::ColumnType::Int32);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[1], core::Value(int64_t{3}));
}

TEST_F(ColumnWriterTest, ErrorExtraIsAppended) {
    WriterOptions options;
    options.error_extra = " (column 'price')";
    ColumnWriter writer(pathFor("extra"), codec::ColumnType::Float64, options);
    auto result = writer.write(core::Value(std::string("cheap")));
    ASSERT_TRUE(result.hasError());
    const std::string& message = result.error().message;
    ASSERT_GE(message.size(), options.error_extra.size());
    EXPECT_EQ(message.substr(message.size() - options.error_extra.size()), options.error_extra);
}

TEST_F(ColumnWriterTest, NoneSupport) {
    std::string path = pathFor("nones");
    WriterOptions options;
    options.none_support = true;
    ColumnWriter writer(path, codec::ColumnType::Unicode, options);
    EXPECT_TRUE(writer.write(core::Value(std::string("a"))).hasValue());
    EXPECT_TRUE(writer.write(core::Value(core::None)).hasValue());
    EXPECT_TRUE(writer.write(core::Value(std::string(""))).hasValue());
    ColumnStats stats = writer.finish();
    EXPECT_EQ(stats.count, 3);
    EXPECT_TRUE(stats.none_support);
    // 字符串没有自然顺序
    EXPECT_TRUE(core::isNone(stats.min));
    EXPECT_TRUE(core::isNone(stats.max));

    auto values = readBack(path, codec::ColumnType::Unicode);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], core::Value(std::string("a")));
    EXPECT_TRUE(core::isNone(values[1]));
    EXPECT_EQ(values[2], core::Value(std::string("")));
}

TEST_F(ColumnWriterTest, DefaultReplacesRejectedValues) {
    std::string path = pathFor("defaults");
    WriterOptions options;
    options.default_value = core::Value(std::string("-1"));
    ColumnWriter writer(path, codec::ColumnType::ParsedInt64, options);

    EXPECT_TRUE(writer.write(core::Value(std::string("7"))).hasValue());
    EXPECT_TRUE(writer.write(core::Value(std::string("seven"))).hasValue());
    EXPECT_TRUE(writer.write(core::Value(core::None)).hasValue());
    EXPECT_TRUE(writer.write(core::Value(8.9)).hasValue());
    writer.finish();

    auto values = readBack(path, codec::ColumnType::Int64);
    ASSERT_EQ(values.size(), 4u);
    EXPECT_EQ(values[0], core::Value(int64_t{7}));
    EXPECT_EQ(values[1], core::Value(int64_t{-1}));
    EXPECT_EQ(values[2], core::Value(int64_t{-1}));
    EXPECT_EQ(values[3], core::Value(int64_t{8}));
}

TEST_F(ColumnWriterTest, NoneDefault) {
    std::string path = pathFor("none_default");
    WriterOptions options;
    options.none_support = true;
    options.default_value = core::Value(core::None);
    ColumnWriter writer(path, codec::ColumnType::Date, options);
    EXPECT_TRUE(writer.write(core::Value(core::Date(2020, 2, 2))).hasValue());
    EXPECT_TRUE(writer.write(core::Value(int64_t{5})).hasValue());
    writer.finish();

    auto values = readBack(path, codec::ColumnType::Date);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_TRUE(core::isNone(values[1]));
}

TEST_F(ColumnWriterTest, InvalidDefaults) {
    WriterOptions bad_value;
    bad_value.default_value = core::Value(std::string("x"));
    EXPECT_THROW(ColumnWriter(pathFor("bad_default"), codec::ColumnType::Int64, bad_value),
                 core::ParameterException);

    WriterOptions none_without_support;
    none_without_support.default_value = core::Value(core::None);
    EXPECT_THROW(ColumnWriter(pathFor("none_default"), codec::ColumnType::Int64, none_without_support),
                 core::ParameterException);

    WriterOptions bad_compression;
    bad_compression.compression = "brotli";
    EXPECT_THROW(ColumnWriter(pathFor("bad_compression"), codec::ColumnType::Int64, bad_compression),
                 core::ParameterException);

    WriterOptions bad_filter;
    bad_filter.hashfilter = HashFilter(3, 3);
    EXPECT_THROW(ColumnWriter(pathFor("bad_filter"), codec::ColumnType::Int64, bad_filter),
                 core::ParameterException);
}

TEST_F(ColumnWriterTest, SlicesPartitionValues) {
    const uint32_t slices = 3;
    std::vector<std::unique_ptr<ColumnWriter>> writers;
    for (uint32_t slice = 0; slice < slices; ++slice) {
        WriterOptions options;
        options.hashfilter = HashFilter(slice, slices);
        writers.push_back(std::make_unique<ColumnWriter>(pathFor("slice." + std::to_string(slice)),
                                                         codec::ColumnType::Int64, options));
    }

    for (int64_t v = 0; v < 1000; ++v) {
        int kept = 0;
        for (auto& writer : writers) {
            auto written = writer->write(core::Value(v));
            ASSERT_TRUE(written.hasValue());
            kept += written.value() ? 1 : 0;
        }
        EXPECT_EQ(kept, 1) << v;
    }

    int64_t total = 0;
    std::set<int64_t> seen;
    for (uint32_t slice = 0; slice < slices; ++slice) {
        total += writers[slice]->finish().count;
        for (const auto& value : readBack(pathFor("slice." + std::to_string(slice)), codec::ColumnType::Int64)) {
            int64_t v = std::get<int64_t>(value);
            EXPECT_EQ(hash::hashInt64(v) % slices, slice);
            seen.insert(v);
        }
    }
    EXPECT_EQ(total, 1000);
    EXPECT_EQ(seen.size(), 1000u);
    // 0 的哈希为 0，落在切片 0
    EXPECT_EQ(writers[0]->min(), core::Value(int64_t{0}));
}

TEST_F(ColumnWriterTest, SpreadNoneGoesToLastSlice) {
    for (bool spread : {false, true}) {
        for (uint32_t slice = 0; slice < 4; ++slice) {
            WriterOptions options;
            options.none_support = true;
            options.hashfilter = HashFilter(slice, 4, spread);
            ColumnWriter writer(pathFor("spread"), codec::ColumnType::Float64, options);
            auto kept = writer.write(core::Value(core::None));
            ASSERT_TRUE(kept.hasValue());
            uint32_t expected_slice = spread ? 3u : 0u;
            EXPECT_EQ(kept.value(), slice == expected_slice) << "spread=" << spread << " slice=" << slice;
        }
    }
}

TEST_F(ColumnWriterTest, SpreadNoneAppliesToDefault) {
    WriterOptions options;
    options.none_support = true;
    options.default_value = core::Value(core::None);
    options.hashfilter = HashFilter(2, 3, true);
    ColumnWriter writer(pathFor("spread_default"), codec::ColumnType::Int64, options);

    // 被拒绝的值替换为 None 后按 None 规则分配
    auto kept = writer.write(core::Value(std::string("junk")));
    ASSERT_TRUE(kept.hasValue());
    EXPECT_TRUE(kept.value());
    EXPECT_EQ(writer.count(), 1);
}

TEST_F(ColumnWriterTest, HashcheckHasNoSideEffects) {
    WriterOptions options;
    options.hashfilter = HashFilter(1, 2);
    ColumnWriter writer(pathFor("hashcheck"), codec::ColumnType::Int64, options);
    for (int64_t v = 0; v < 50; ++v) {
        auto check = writer.hashcheck(core::Value(v));
        ASSERT_TRUE(check.hasValue());
        EXPECT_EQ(check.value(), hash::hashInt64(v) % 2 == 1);
    }
    EXPECT_EQ(writer.count(), 0);
    EXPECT_TRUE(writer.hashcheck(core::Value(std::string("x"))).hasError());
}

TEST_F(ColumnWriterTest, MinMaxSkipsNaNAndNone) {
    WriterOptions options;
    options.none_support = true;
    ColumnWriter writer(pathFor("minmax"), codec::ColumnType::Float64, options);
    writer.write(core::Value(std::nan(""))).valueOrThrow();
    writer.write(core::Value(2.5)).valueOrThrow();
    writer.write(core::Value(core::None)).valueOrThrow();
    writer.write(core::Value(-1.0)).valueOrThrow();
    writer.write(core::Value(std::nan(""))).valueOrThrow();
    ColumnStats stats = writer.finish();
    EXPECT_EQ(stats.count, 5);
    EXPECT_EQ(stats.min, core::Value(-1.0));
    EXPECT_EQ(stats.max, core::Value(2.5));
}

TEST_F(ColumnWriterTest, MinMaxForNumbersAndDates) {
    ColumnWriter numbers(pathFor("numbers"), codec::ColumnType::Number);
    numbers.write(core::Value(int64_t{3})).valueOrThrow();
    numbers.write(core::Value(2.5)).valueOrThrow();
    numbers.write(core::Value(core::Number(*core::BigInt::parse("100000000000000000000")))).valueOrThrow();
    ColumnStats number_stats = numbers.finish();
    EXPECT_EQ(number_stats.min, core::Value(core::Number(2.5)));
    EXPECT_EQ(core::describe(number_stats.max), "100000000000000000000");

    ColumnWriter dates(pathFor("dates"), codec::ColumnType::Date);
    dates.write(core::Value(core::Date(2001, 1, 1))).valueOrThrow();
    dates.write(core::Value(core::Date(1999, 12, 31))).valueOrThrow();
    ColumnStats date_stats = dates.finish();
    EXPECT_EQ(date_stats.min, core::Value(core::Date(1999, 12, 31)));
    EXPECT_EQ(date_stats.max, core::Value(core::Date(2001, 1, 1)));

    ColumnWriter empty(pathFor("empty"), codec::ColumnType::Int32);
    ColumnStats empty_stats = empty.finish();
    EXPECT_EQ(empty_stats.count, 0);
    EXPECT_TRUE(core::isNone(empty_stats.min));
}

TEST_F(ColumnWriterTest, FinishIsIdempotent) {
    ColumnWriter writer(pathFor("finish"), codec::ColumnType::Bool);
    writer.write(core::Value(true)).valueOrThrow();
    ColumnStats first = writer.finish();
    ColumnStats second = writer.finish();
    EXPECT_EQ(first.count, second.count);
    EXPECT_EQ(writer.state(), ColumnWriter::State::Finished);
    EXPECT_THROW(writer.write(core::Value(false)), core::OperationException);
}

TEST_F(ColumnWriterTest, UncompressedOutput) {
    std::string path = pathFor("stored");
    WriterOptions options;
    options.compression = "none";
    {
        ColumnWriter writer(path, codec::ColumnType::Int32, options);
        writer.write(core::Value(int64_t{1})).valueOrThrow();
        writer.write(core::Value(int64_t{258})).valueOrThrow();
    }
    EXPECT_EQ(std::filesystem::file_size(path), 8u);
    auto values = readBack(path, codec::ColumnType::Int32, "none");
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[1], core::Value(int64_t{258}));
}

TEST_F(ColumnWriterTest, MissingDirectory) {
    EXPECT_THROW(ColumnWriter(pathFor("missing/dir/col"), codec::ColumnType::Int64), core::FileException);
}

TEST_F(ColumnWriterTest, IOFailureIsFatal) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    WriterOptions options;
    options.compression = "none";
    ColumnWriter writer("/dev/full", codec::ColumnType::Int64, options);

    bool failed = false;
    for (int64_t i = 0; i < 100000 && !failed; ++i) {
        try {
            writer.write(core::Value(i + 1)).valueOrThrow();
        } catch (const core::FileException&) {
            failed = true;
        }
    }
    ASSERT_TRUE(failed);
    EXPECT_EQ(writer.state(), ColumnWriter::State::Failed);
    EXPECT_THROW(writer.write(core::Value(int64_t{1})), core::OperationException);
    EXPECT_THROW(writer.finish(), core::OperationException);
}

#ifndef _WIN32
namespace {

// 临时限制进程可写文件大小，超出后写入失败（EFBIG）
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t limit) {
        previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
        active_ = getrlimit(RLIMIT_FSIZE, &previous_) == 0;
        if (active_) {
            struct rlimit lowered = previous_;
            lowered.rlim_cur = limit;
            active_ = setrlimit(RLIMIT_FSIZE, &lowered) == 0;
        }
    }

    ~FileSizeLimit() {
        if (active_) {
            setrlimit(RLIMIT_FSIZE, &previous_);
        }
        std::signal(SIGXFSZ, previous_handler_);
    }

    bool active() const { return active_; }

private:
    struct rlimit previous_ {};
    void (*previous_handler_)(int) = SIG_DFL;
    bool active_ = false;
};

} // namespace

TEST_F(ColumnWriterTest, FailedWriteLeavesNoFile) {
    const std::string path = pathFor("partial");
    bool failed = false;
    {
        WriterOptions options;
        options.compression = "none";
        auto writer = std::make_unique<ColumnWriter>(path, codec::ColumnType::Int64, options);
        {
            FileSizeLimit limit(64 * 1024);
            if (!limit.active()) {
                GTEST_SKIP() << "cannot lower RLIMIT_FSIZE";
            }
            for (int64_t i = 0; i < 100000 && !failed; ++i) {
                try {
                    writer->write(core::Value(i + 1)).valueOrThrow();
                } catch (const core::FileException&) {
                    failed = true;
                }
            }
        }
        ASSERT_TRUE(failed);
        EXPECT_EQ(writer->state(), ColumnWriter::State::Failed);
        EXPECT_FALSE(std::filesystem::exists(path));
        EXPECT_THROW(writer->finish(), core::OperationException);
        writer.reset();
    }
    // 析构不会补写残留数据或压缩尾部
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_THROW(ColumnReader(path, codec::ColumnType::Int64), core::FileException);
}
#endif

TEST_F(ColumnWriterTest, StaticHash) {
    EXPECT_EQ(ColumnWriter::hash(codec::ColumnType::Int32, core::Value(int64_t{5})).value(), hash::hashInt64(5));
    EXPECT_EQ(ColumnWriter::hash(codec::ColumnType::ParsedInt64, core::Value(std::string("5"))).value(),
              hash::hashInt64(5));
    EXPECT_EQ(ColumnWriter::hash(codec::ColumnType::Float32, core::Value(1.1)).value(), hash::hashFloat32(1.1));
    EXPECT_EQ(ColumnWriter::hash(codec::ColumnType::Float64, core::Value(5.0)).value(), hash::hashInt64(5));
    EXPECT_EQ(ColumnWriter::hash(codec::ColumnType::Unicode, core::Value(core::None)).value(), 0u);
    EXPECT_EQ(ColumnWriter::hash(codec::ColumnType::Ascii, core::Value(core::Bytes("abc"))).value(),
              hash::hashBytes("abc"));
    EXPECT_TRUE(ColumnWriter::hash(codec::ColumnType::Int32, core::Value(std::string("5"))).hasError());
}

}} // namespace slicecodec::column
