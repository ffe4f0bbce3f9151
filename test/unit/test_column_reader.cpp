// SliceCodec 库
// 组件：列读取器测试
//
// 覆盖各类型往返、切片过滤、want_count、起始偏移、进度回调与损坏数据。

#include "slicecodec/SliceCodec.hpp"
#include "slicecodec/hash/HashValue.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace slicecodec {
namespace column {

class ColumnReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("", Logger::Level::ERROR, false);
        test_dir_ = "test_column_reader";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        Logger::getInstance().shutdown();
    }

    std::string pathFor(const std::string& name) const {
        return test_dir_ + "/" + name;
    }

    // 写入 1..count 的 int64 列
    std::string writeInts(const std::string& name, int64_t count, const std::string& compression = "gzip") {
        std::string path = pathFor(name);
        WriterOptions options;
        options.compression = compression;
        ColumnWriter writer(path, codec::ColumnType::Int64, options);
        for (int64_t i = 1; i <= count; ++i) {
            writer.write(core::Value(i)).valueOrThrow();
        }
        writer.finish();
        return path;
    }

    std::string writeValues(const std::string& name, codec::ColumnType type,
                            const std::vector<core::Value>& values, const std::string& compression) {
        std::string path = pathFor(name);
        WriterOptions options;
        options.compression = compression;
        options.none_support = true;
        ColumnWriter writer(path, type, options);
        for (const auto& value : values) {
            writer.write(value).valueOrThrow();
        }
        writer.finish();
        return path;
    }

    std::string test_dir_;
};

TEST_F(ColumnReaderTest, RoundTripEveryType) {
    struct Case {
        codec::ColumnType type;
        std::vector<core::Value> values;
    };
    const std::vector<Case> cases = {
        {codec::ColumnType::Int32, {core::Value(int64_t{-7}), core::Value(core::None), core::Value(int64_t{2147483647})}},
        {codec::ColumnType::Int64, {core::Value(int64_t{1} << 62), core::Value(core::None)}},
        {codec::ColumnType::Float32, {core::Value(1.5), core::Value(core::None), core::Value(-0.25)}},
        {codec::ColumnType::Float64, {core::Value(1.1), core::Value(core::None)}},
        {codec::ColumnType::Complex32, {core::Value(core::Complex(1.5, -2.0)), core::Value(core::None)}},
        {codec::ColumnType::Complex64, {core::Value(core::Complex(0.1, 0.2)), core::Value(core::None)}},
        {codec::ColumnType::Bool, {core::Value(true), core::Value(false), core::Value(core::None)}},
        {codec::ColumnType::Number, {core::Value(core::Number(int64_t{-1})), core::Value(core::Number(1e300)),
                                     core::Value(core::Number(*core::BigInt::parse("-123456789012345678901234567890"))),
                                     core::Value(core::None)}},
        {codec::ColumnType::Bytes, {core::Value(core::Bytes(std::string("\0\xff", 2))), core::Value(core::None)}},
        {codec::ColumnType::Ascii, {core::Value(std::string("plain")), core::Value(core::None)}},
        {codec::ColumnType::Unicode, {core::Value(std::string("\xe6\x97\xa5\xe6\x9c\xac")), core::Value(core::None)}},
        {codec::ColumnType::Date, {core::Value(core::Date(1, 1, 1)), core::Value(core::Date(9999, 12, 31)),
                                   core::Value(core::None)}},
        {codec::ColumnType::Time, {core::Value(core::Time(23, 59, 59, 999999)), core::Value(core::None)}},
        {codec::ColumnType::DateTime, {core::Value(core::DateTime(2024, 2, 29, 12, 0, 0, 1, 1)), core::Value(core::None)}},
    };

    for (const std::string compression : {"none", "gzip"}) {
        for (const auto& test_case : cases) {
            std::string name = std::string(codec::columnTypeName(test_case.type)) + "." + compression;
            std::string path = writeValues(name, test_case.type, test_case.values, compression);

            ReaderOptions options;
            options.compression = compression;
            ColumnReader reader(path, test_case.type, options);
            auto values = reader.readAll();
            ASSERT_EQ(values.size(), test_case.values.size()) << name;
            for (size_t i = 0; i < values.size(); ++i) {
                EXPECT_EQ(values[i], test_case.values[i]) << name << " #" << i;
            }
            EXPECT_EQ(reader.state(), ColumnReader::State::Exhausted);
            EXPECT_EQ(reader.count(), static_cast<int64_t>(values.size()));
        }
    }
}

TEST_F(ColumnReaderTest, IteratesWithRangeFor) {
    std::string path = writeInts("iter", 100);
    ColumnReader reader(path, codec::ColumnType::Int64);
    EXPECT_EQ(reader.state(), ColumnReader::State::Opened);
    int64_t expected = 1;
    for (const auto& value : reader) {
        EXPECT_EQ(value, core::Value(expected));
        ++expected;
    }
    EXPECT_EQ(expected, 101);
    EXPECT_FALSE(reader.next().has_value());
    reader.close();
    EXPECT_EQ(reader.state(), ColumnReader::State::Closed);
    EXPECT_STREQ(toString(reader.state()), "Closed");
}

TEST_F(ColumnReaderTest, ValuesSpanBlocks) {
    // 大量字符串跨越多个块
    std::string path = pathFor("strings");
    std::vector<std::string> texts;
    {
        ColumnWriter writer(path, codec::ColumnType::Ascii);
        for (int i = 0; i < 2000; ++i) {
            texts.push_back(std::string(static_cast<size_t>(i % 400), static_cast<char>('a' + i % 26)));
            writer.write(core::Value(texts.back())).valueOrThrow();
        }
    }
    ColumnReader reader(path, codec::ColumnType::Ascii);
    auto values = reader.readAll();
    ASSERT_EQ(values.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        ASSERT_EQ(std::get<std::string>(values[i]), texts[i]) << i;
    }
}

TEST_F(ColumnReaderTest, HugeNumberStraddlesBlocks) {
    std::vector<uint8_t> raw(200000, 0x11);
    core::Number huge(core::BigInt::fromTwosComplement(raw.data(), raw.size()));

    std::string path = pathFor("huge");
    {
        ColumnWriter writer(path, codec::ColumnType::Number);
        for (int64_t i = 0; i < 1000; ++i) {
            writer.write(core::Value(i)).valueOrThrow();
        }
        writer.write(core::Value(huge)).valueOrThrow();
        writer.write(core::Value(int64_t{42})).valueOrThrow();
    }

    ColumnReader reader(path, codec::ColumnType::Number);
    auto values = reader.readAll();
    ASSERT_EQ(values.size(), 1002u);
    EXPECT_EQ(values[1000], core::Value(huge));
    EXPECT_EQ(values[1001], core::Value(core::Number(int64_t{42})));
}

TEST_F(ColumnReaderTest, HashfilterMatchesWriterSlicing) {
    std::string path = writeInts("all", 500);
    int64_t total = 0;
    for (uint32_t slice = 0; slice < 4; ++slice) {
        ReaderOptions options;
        options.hashfilter = HashFilter(slice, 4);
        ColumnReader reader(path, codec::ColumnType::Int64, options);
        for (const auto& value : reader) {
            EXPECT_EQ(hash::hashInt64(std::get<int64_t>(value)) % 4, slice);
            ++total;
        }
    }
    EXPECT_EQ(total, 500);
}

TEST_F(ColumnReaderTest, HashfilterSpreadsNone) {
    std::string path = writeValues("nones", codec::ColumnType::Int64,
                                   {core::Value(core::None), core::Value(int64_t{5}), core::Value(core::None)}, "gzip");
    ReaderOptions last;
    last.hashfilter = HashFilter(2, 3, true);
    ColumnReader reader(path, codec::ColumnType::Int64, last);
    int nones = 0;
    for (const auto& value : reader) {
        nones += core::isNone(value) ? 1 : 0;
    }
    EXPECT_EQ(nones, 2);

    ReaderOptions first;
    first.hashfilter = HashFilter(0, 3, true);
    ColumnReader other(path, codec::ColumnType::Int64, first);
    for (const auto& value : other) {
        EXPECT_FALSE(core::isNone(value));
    }
}

TEST_F(ColumnReaderTest, WantCount) {
    std::string path = writeInts("want", 100);

    ReaderOptions options;
    options.want_count = 5;
    ColumnReader reader(path, codec::ColumnType::Int64, options);
    auto values = reader.readAll();
    ASSERT_EQ(values.size(), 5u);
    EXPECT_EQ(values.back(), core::Value(int64_t{5}));
    EXPECT_EQ(reader.state(), ColumnReader::State::Exhausted);

    options.want_count = 0;
    ColumnReader none(path, codec::ColumnType::Int64, options);
    EXPECT_TRUE(none.readAll().empty());

    options.want_count = 1000;
    ColumnReader more(path, codec::ColumnType::Int64, options);
    EXPECT_EQ(more.readAll().size(), 100u);
}

TEST_F(ColumnReaderTest, WantCountCountsFilteredValues) {
    std::string path = writeInts("want_filtered", 1000);
    ReaderOptions options;
    options.hashfilter = HashFilter(1, 2);
    options.want_count = 10;
    ColumnReader reader(path, codec::ColumnType::Int64, options);
    auto values = reader.readAll();
    ASSERT_EQ(values.size(), 10u);
    for (const auto& value : values) {
        EXPECT_EQ(hash::hashInt64(std::get<int64_t>(value)) % 2, 1u);
    }
}

TEST_F(ColumnReaderTest, SeekSkipsHeader) {
    std::string path = writeInts("seek", 20);
    std::string data;
    {
        std::ifstream in(path, std::ios::binary);
        data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    std::string prefixed = pathFor("prefixed");
    {
        std::ofstream out(prefixed, std::ios::binary);
        out << "0123456789";
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

    ReaderOptions options;
    options.seek = 10;
    ColumnReader reader(prefixed, codec::ColumnType::Int64, options);
    auto values = reader.readAll();
    ASSERT_EQ(values.size(), 20u);
    EXPECT_EQ(values.front(), core::Value(int64_t{1}));
}

TEST_F(ColumnReaderTest, CallbackIntervals) {
    std::string path = writeInts("callback", 1000);

    std::vector<int64_t> calls;
    ReaderOptions options;
    options.callback_interval = 250;
    options.callback = [&calls](int64_t position) {
        calls.push_back(position);
        return CallbackAction::Continue;
    };
    ColumnReader reader(path, codec::ColumnType::Int64, options);
    EXPECT_EQ(reader.readAll().size(), 1000u);
    EXPECT_EQ(calls, std::vector<int64_t>({250, 500, 750, 1000}));

    calls.clear();
    options.callback_interval = 300;
    options.callback_offset = 10000;
    ColumnReader offset_reader(path, codec::ColumnType::Int64, options);
    EXPECT_EQ(offset_reader.readAll().size(), 1000u);
    EXPECT_EQ(calls, std::vector<int64_t>({10300, 10600, 10900}));
}

TEST_F(ColumnReaderTest, CallbackCanStop) {
    std::string path = writeInts("stop", 100);

    ReaderOptions options;
    options.callback_interval = 1;
    options.callback = [](int64_t) { return CallbackAction::Stop; };
    ColumnReader reader(path, codec::ColumnType::Int64, options);
    auto values = reader.readAll();
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(reader.state(), ColumnReader::State::StoppedByCallback);
    EXPECT_FALSE(reader.next().has_value());

    options.callback_interval = 10;
    options.callback = [](int64_t position) {
        return position >= 30 ? CallbackAction::Stop : CallbackAction::Continue;
    };
    ColumnReader later(path, codec::ColumnType::Int64, options);
    EXPECT_EQ(later.readAll().size(), 30u);
}

TEST_F(ColumnReaderTest, CallbackExceptionPropagates) {
    std::string path = writeInts("throw", 100);

    ReaderOptions options;
    options.callback_interval = 50;
    options.callback = [](int64_t) -> CallbackAction { throw std::runtime_error("stop reading"); };
    ColumnReader reader(path, codec::ColumnType::Int64, options);

    int64_t seen = 0;
    EXPECT_THROW({
        while (reader.next()) {
            ++seen;
        }
    }, std::runtime_error);
    EXPECT_EQ(seen, 50);
    EXPECT_EQ(reader.state(), ColumnReader::State::Aborted);
    EXPECT_FALSE(reader.next().has_value());
}

TEST_F(ColumnReaderTest, TruncatedFileAborts) {
    std::string path = writeInts("truncated", 10, "none");
    std::filesystem::resize_file(path, 10 * 8 - 3);

    ReaderOptions options;
    options.compression = "none";
    ColumnReader reader(path, codec::ColumnType::Int64, options);
    for (int i = 0; i < 9; ++i) {
        ASSERT_TRUE(reader.next().has_value());
    }
    EXPECT_THROW(reader.next(), core::FileException);
    EXPECT_EQ(reader.state(), ColumnReader::State::Aborted);
}

TEST_F(ColumnReaderTest, WrongCompressionIsCorrupt) {
    std::string path = writeInts("stored", 10, "none");
    ColumnReader reader(path, codec::ColumnType::Int64);
    EXPECT_THROW(reader.readAll(), core::FileException);
}

TEST_F(ColumnReaderTest, OpenFailures) {
    EXPECT_THROW(ColumnReader(pathFor("missing"), codec::ColumnType::Int64), core::FileException);

    std::string path = writeInts("exists", 1);
    ReaderOptions bad_compression;
    bad_compression.compression = "zstd";
    EXPECT_THROW(ColumnReader(path, codec::ColumnType::Int64, bad_compression), core::ParameterException);

    ReaderOptions bad_want;
    bad_want.want_count = -5;
    EXPECT_THROW(ColumnReader(path, codec::ColumnType::Int64, bad_want), core::ParameterException);
}

}} // namespace slicecodec::column
