#include "slicecodec/codec/NumberCodec.hpp"
#include "slicecodec/codec/ValueParser.hpp"
#include "slicecodec/codec/WireFormat.hpp"
#include "slicecodec/core/Exception.hpp"
#include "slicecodec/hash/HashValue.hpp"

#include <limits>
#include <vector>
#include <fmt/format.h>

namespace slicecodec {
namespace codec {

core::Result<core::Value> NumberCodec::convert(const core::Value& value) const {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return core::Value(core::Number(int64_t{*flag ? 1 : 0}));
    }
    if (const auto* integer = std::get_if<int64_t>(&value)) {
        return core::Value(core::Number(*integer));
    }
    if (const auto* floating = std::get_if<double>(&value)) {
        return core::Value(core::Number(*floating));
    }
    if (std::holds_alternative<core::Number>(value)) {
        return value;
    }
    if (parsed_) {
        if (const std::string* text = textOf(value)) {
            auto parsed = parseNumber(*text);
            if (!parsed) {
                return rejected(value, "not a number");
            }
            return core::Value(std::move(parsed).value());
        }
    }
    return mismatch(value);
}

void NumberCodec::encode(const core::Value& value, std::string& out) const {
    if (core::isNone(value)) {
        out.push_back(static_cast<char>(WireFormat::kNumberNone));
        return;
    }
    const auto& number = std::get<core::Number>(value);
    if (number.isFloat()) {
        out.push_back(static_cast<char>(WireFormat::kNumberFloat));
        appendLE<uint64_t>(out, float64Bits(number.floating()));
        return;
    }

    const core::BigInt& integer = number.integer();
    if (integer.fitsInt64()) {
        int64_t v = integer.toInt64();
        if (v >= WireFormat::kNumberSmallMin && v <= WireFormat::kNumberSmallMax) {
            out.push_back(static_cast<char>(static_cast<uint8_t>(v + WireFormat::kNumberSmallOffset)));
        } else if (v >= std::numeric_limits<int16_t>::min() && v <= std::numeric_limits<int16_t>::max()) {
            out.push_back(static_cast<char>(WireFormat::kNumberInt16));
            appendLE<int16_t>(out, static_cast<int16_t>(v));
        } else if (v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max()) {
            out.push_back(static_cast<char>(WireFormat::kNumberInt32));
            appendLE<int32_t>(out, static_cast<int32_t>(v));
        } else {
            out.push_back(static_cast<char>(WireFormat::kNumberInt64));
            appendLE<int64_t>(out, v);
        }
        return;
    }

    std::vector<uint8_t> bytes = integer.toTwosComplement();
    if (bytes.size() <= WireFormat::kNumberMaxInline) {
        out.push_back(static_cast<char>(static_cast<uint8_t>(bytes.size())));
    } else {
        out.push_back(static_cast<char>(WireFormat::kNumberLong));
        appendLE<uint32_t>(out, static_cast<uint32_t>(bytes.size()));
    }
    out.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::optional<core::Value> NumberCodec::decode(stream::ByteSource& source) const {
    uint8_t tag = 0;
    if (!source.readExact(&tag, 1)) {
        return std::nullopt;
    }

    if (tag >= WireFormat::kNumberSmallBase) {
        return core::Value(core::Number(int64_t{tag} - WireFormat::kNumberSmallOffset));
    }

    uint8_t buf[8];
    switch (tag) {
        case WireFormat::kNumberNone:
            return core::Value(core::None);
        case WireFormat::kNumberFloat:
            source.require(buf, 8);
            return core::Value(core::Number(float64FromBits(loadLE<uint64_t>(buf))));
        case WireFormat::kNumberInt16:
            source.require(buf, 2);
            return core::Value(core::Number(int64_t{loadLE<int16_t>(buf)}));
        case WireFormat::kNumberInt32:
            source.require(buf, 4);
            return core::Value(core::Number(int64_t{loadLE<int32_t>(buf)}));
        case WireFormat::kNumberInt64:
            source.require(buf, 8);
            return core::Value(core::Number(loadLE<int64_t>(buf)));
        default:
            break;
    }

    size_t length = 0;
    if (tag >= WireFormat::kNumberMinInline && tag <= WireFormat::kNumberMaxInline) {
        length = tag;
    } else if (tag == WireFormat::kNumberLong) {
        source.require(buf, 4);
        length = loadLE<uint32_t>(buf);
    } else {
        SLICECODEC_THROW_FILE(fmt::format("Invalid number tag {}", tag), source.name(),
                              core::ErrorCode::FileCorrupted);
    }

    std::string bytes;
    source.requireAppend(bytes, length);
    return core::Value(core::Number(core::BigInt::fromTwosComplement(
        reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size())));
}

uint64_t NumberCodec::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashNumber(std::get<core::Number>(value));
}

int NumberCodec::compare(const core::Value& a, const core::Value& b) const {
    return std::get<core::Number>(a).compare(std::get<core::Number>(b));
}

}} // namespace slicecodec::codec
