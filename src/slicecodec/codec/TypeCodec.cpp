#include "slicecodec/codec/TypeCodec.hpp"
#include "slicecodec/codec/NumberCodec.hpp"
#include "slicecodec/codec/NumericCodecs.hpp"
#include "slicecodec/codec/StringCodecs.hpp"
#include "slicecodec/codec/TemporalCodecs.hpp"
#include "slicecodec/core/Exception.hpp"

#include <fmt/format.h>

namespace slicecodec {
namespace codec {

std::unique_ptr<TypeCodec> TypeCodec::create(ColumnType type) {
    switch (type) {
        case ColumnType::Int32:
        case ColumnType::ParsedInt32:
            return std::make_unique<IntegerCodec<int32_t>>(type);
        case ColumnType::Int64:
        case ColumnType::ParsedInt64:
            return std::make_unique<IntegerCodec<int64_t>>(type);
        case ColumnType::Float32:
        case ColumnType::ParsedFloat32:
            return std::make_unique<FloatCodec<float>>(type);
        case ColumnType::Float64:
        case ColumnType::ParsedFloat64:
            return std::make_unique<FloatCodec<double>>(type);
        case ColumnType::Complex32:
        case ColumnType::ParsedComplex32:
            return std::make_unique<ComplexCodec<float>>(type);
        case ColumnType::Complex64:
        case ColumnType::ParsedComplex64:
            return std::make_unique<ComplexCodec<double>>(type);
        case ColumnType::Bool:
            return std::make_unique<BoolCodec>();
        case ColumnType::Number:
        case ColumnType::ParsedNumber:
            return std::make_unique<NumberCodec>(type);
        case ColumnType::Bytes:
            return std::make_unique<BytesCodec>();
        case ColumnType::Ascii:
            return std::make_unique<AsciiCodec>();
        case ColumnType::Unicode:
            return std::make_unique<UnicodeCodec>();
        case ColumnType::Date:
        case ColumnType::ParsedDate:
            return std::make_unique<DateCodec>(type);
        case ColumnType::Time:
        case ColumnType::ParsedTime:
            return std::make_unique<TimeCodec>(type);
        case ColumnType::DateTime:
        case ColumnType::ParsedDateTime:
            return std::make_unique<DateTimeCodec>(type);
        case ColumnType::Json:
        case ColumnType::ParsedJson:
            return std::make_unique<JsonCodec>(type);
    }
    SLICECODEC_THROW_PARAM(fmt::format("No codec for column type {}", static_cast<int>(type)), "type");
}

core::Result<uint64_t> TypeCodec::hash(const core::Value& value) const {
    if (core::isNone(value)) {
        return uint64_t{0};
    }
    auto converted = convert(value);
    if (!converted) {
        return converted.error();
    }
    return hashCanonical(converted.value());
}

int TypeCodec::compare(const core::Value&, const core::Value&) const {
    return 2;
}

core::Error TypeCodec::mismatch(const core::Value& value) const {
    return core::makeError(core::ErrorCode::TypeMismatch,
                           fmt::format("{} column does not accept {} value {}",
                                       name(), core::valueKindName(value), core::describe(value)));
}

core::Error TypeCodec::rejected(const core::Value& value, const std::string& reason) const {
    return core::makeError(core::ErrorCode::ValueRejected,
                           fmt::format("{} column rejected {}: {}", name(), core::describe(value), reason));
}

const std::string* textOf(const core::Value& value) noexcept {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return text;
    }
    if (const auto* bytes = std::get_if<core::Bytes>(&value)) {
        return &bytes->data;
    }
    return nullptr;
}

}} // namespace slicecodec::codec
