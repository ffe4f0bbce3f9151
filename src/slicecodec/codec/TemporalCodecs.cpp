#include "slicecodec/codec/TemporalCodecs.hpp"
#include "slicecodec/codec/ValueParser.hpp"
#include "slicecodec/codec/WireFormat.hpp"
#include "slicecodec/core/Exception.hpp"
#include "slicecodec/hash/HashValue.hpp"

#include <fmt/format.h>

namespace slicecodec {
namespace codec {

namespace {

void appendPacked(std::string& out, const core::PackedDateTime& packed) {
    appendLE<uint32_t>(out, packed.hi);
    appendLE<uint32_t>(out, packed.lo);
}

// 读取 8 字节打包值；hi 为 0 表示 None
std::optional<core::PackedDateTime> readPacked(stream::ByteSource& source, bool& is_none) {
    uint8_t buf[8];
    if (!source.readExact(buf, sizeof(buf))) {
        return std::nullopt;
    }
    core::PackedDateTime packed;
    packed.hi = loadLE<uint32_t>(buf);
    packed.lo = loadLE<uint32_t>(buf + 4);
    is_none = packed.hi == 0 && packed.lo == 0;
    return packed;
}

[[noreturn]] void corrupted(const stream::ByteSource& source, const char* what, const std::string& text) {
    SLICECODEC_THROW_FILE(fmt::format("Invalid {} in column data: {}", what, text), source.name(),
                          core::ErrorCode::FileCorrupted);
}

} // namespace

// ========== DateCodec ==========

core::Result<core::Value> DateCodec::convert(const core::Value& value) const {
    core::Date date;
    if (const auto* d = std::get_if<core::Date>(&value)) {
        date = *d;
    } else if (const auto* dt = std::get_if<core::DateTime>(&value)) {
        date = dt->date;
    } else if (const std::string* text = parsed_ ? textOf(value) : nullptr) {
        auto parsed = parseDate(*text);
        if (!parsed) {
            return rejected(value, "not an ISO date");
        }
        date = parsed.value();
    } else {
        return mismatch(value);
    }
    if (!date.isValid()) {
        return rejected(value, "date out of range");
    }
    return core::Value(date);
}

void DateCodec::encode(const core::Value& value, std::string& out) const {
    appendLE<uint32_t>(out, core::isNone(value) ? 0u : core::packDate(std::get<core::Date>(value)));
}

std::optional<core::Value> DateCodec::decode(stream::ByteSource& source) const {
    uint8_t buf[4];
    if (!source.readExact(buf, sizeof(buf))) {
        return std::nullopt;
    }
    uint32_t packed = loadLE<uint32_t>(buf);
    if (packed == 0) {
        return core::Value(core::None);
    }
    core::Date date = core::unpackDate(packed);
    if (!date.isValid()) {
        corrupted(source, "date", date.toString());
    }
    return core::Value(date);
}

uint64_t DateCodec::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashDate(std::get<core::Date>(value));
}

int DateCodec::compare(const core::Value& a, const core::Value& b) const {
    return std::get<core::Date>(a).compare(std::get<core::Date>(b));
}

// ========== TimeCodec ==========

core::Result<core::Value> TimeCodec::convert(const core::Value& value) const {
    core::Time time;
    if (const auto* t = std::get_if<core::Time>(&value)) {
        time = *t;
    } else if (const std::string* text = parsed_ ? textOf(value) : nullptr) {
        auto parsed = parseTime(*text);
        if (!parsed) {
            return rejected(value, "not an ISO time");
        }
        time = parsed.value();
    } else {
        return mismatch(value);
    }
    if (!time.isValid()) {
        return rejected(value, "time out of range");
    }
    return core::Value(time);
}

void TimeCodec::encode(const core::Value& value, std::string& out) const {
    if (core::isNone(value)) {
        appendPacked(out, core::PackedDateTime());
        return;
    }
    appendPacked(out, core::packTime(std::get<core::Time>(value)));
}

std::optional<core::Value> TimeCodec::decode(stream::ByteSource& source) const {
    bool is_none = false;
    auto packed = readPacked(source, is_none);
    if (!packed) {
        return std::nullopt;
    }
    if (is_none) {
        return core::Value(core::None);
    }
    core::Time time = core::unpackTime(*packed);
    if (!time.isValid()) {
        corrupted(source, "time", time.toString());
    }
    return core::Value(time);
}

uint64_t TimeCodec::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashTime(std::get<core::Time>(value));
}

int TimeCodec::compare(const core::Value& a, const core::Value& b) const {
    return std::get<core::Time>(a).compare(std::get<core::Time>(b));
}

// ========== DateTimeCodec ==========

core::Result<core::Value> DateTimeCodec::convert(const core::Value& value) const {
    core::DateTime datetime;
    if (const auto* dt = std::get_if<core::DateTime>(&value)) {
        datetime = *dt;
    } else if (const std::string* text = parsed_ ? textOf(value) : nullptr) {
        auto parsed = parseDateTime(*text);
        if (!parsed) {
            return rejected(value, "not an ISO datetime");
        }
        datetime = parsed.value();
    } else {
        return mismatch(value);
    }
    if (!datetime.isValid()) {
        return rejected(value, "datetime out of range");
    }
    return core::Value(datetime);
}

void DateTimeCodec::encode(const core::Value& value, std::string& out) const {
    if (core::isNone(value)) {
        appendPacked(out, core::PackedDateTime());
        return;
    }
    appendPacked(out, core::packDateTime(std::get<core::DateTime>(value)));
}

std::optional<core::Value> DateTimeCodec::decode(stream::ByteSource& source) const {
    bool is_none = false;
    auto packed = readPacked(source, is_none);
    if (!packed) {
        return std::nullopt;
    }
    if (is_none) {
        return core::Value(core::None);
    }
    core::DateTime datetime = core::unpackDateTime(*packed);
    if (!datetime.isValid()) {
        corrupted(source, "datetime", datetime.toString());
    }
    return core::Value(datetime);
}

uint64_t DateTimeCodec::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashDateTime(std::get<core::DateTime>(value));
}

int DateTimeCodec::compare(const core::Value& a, const core::Value& b) const {
    return std::get<core::DateTime>(a).compare(std::get<core::DateTime>(b));
}

}} // namespace slicecodec::codec
