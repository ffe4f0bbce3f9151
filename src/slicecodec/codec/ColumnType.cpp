#include "slicecodec/codec/ColumnType.hpp"
#include "slicecodec/core/Exception.hpp"

#include <fmt/format.h>

namespace slicecodec {
namespace codec {

namespace {

struct TypeEntry {
    ColumnType type;
    const char* name;
    ColumnType base;
};

const TypeEntry kTypeTable[] = {
    {ColumnType::Int32,           "int32",             ColumnType::Int32},
    {ColumnType::Int64,           "int64",             ColumnType::Int64},
    {ColumnType::Float32,         "float32",           ColumnType::Float32},
    {ColumnType::Float64,         "float64",           ColumnType::Float64},
    {ColumnType::Complex32,       "complex32",         ColumnType::Complex32},
    {ColumnType::Complex64,       "complex64",         ColumnType::Complex64},
    {ColumnType::Bool,            "bool",              ColumnType::Bool},
    {ColumnType::Number,          "number",            ColumnType::Number},
    {ColumnType::Bytes,           "bytes",             ColumnType::Bytes},
    {ColumnType::Ascii,           "ascii",             ColumnType::Ascii},
    {ColumnType::Unicode,         "unicode",           ColumnType::Unicode},
    {ColumnType::Date,            "date",              ColumnType::Date},
    {ColumnType::Time,            "time",              ColumnType::Time},
    {ColumnType::DateTime,        "datetime",          ColumnType::DateTime},
    {ColumnType::Json,            "json",              ColumnType::Json},
    {ColumnType::ParsedInt32,     "parsed:int32",      ColumnType::Int32},
    {ColumnType::ParsedInt64,     "parsed:int64",      ColumnType::Int64},
    {ColumnType::ParsedFloat32,   "parsed:float32",    ColumnType::Float32},
    {ColumnType::ParsedFloat64,   "parsed:float64",    ColumnType::Float64},
    {ColumnType::ParsedComplex32, "parsed:complex32",  ColumnType::Complex32},
    {ColumnType::ParsedComplex64, "parsed:complex64",  ColumnType::Complex64},
    {ColumnType::ParsedNumber,    "parsed:number",     ColumnType::Number},
    {ColumnType::ParsedDate,      "parsed:date",       ColumnType::Date},
    {ColumnType::ParsedTime,      "parsed:time",       ColumnType::Time},
    {ColumnType::ParsedDateTime,  "parsed:datetime",   ColumnType::DateTime},
    {ColumnType::ParsedJson,      "parsed:json",       ColumnType::Json},
};

const TypeEntry& entryFor(ColumnType type) noexcept {
    return kTypeTable[static_cast<size_t>(type)];
}

} // namespace

const char* columnTypeName(ColumnType type) noexcept {
    return entryFor(type).name;
}

ColumnType columnTypeFromName(std::string_view name) {
    for (const auto& entry : kTypeTable) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    SLICECODEC_THROW_PARAM(fmt::format("Unknown column type '{}'", name), "type");
}

const std::vector<ColumnType>& allColumnTypes() {
    static const std::vector<ColumnType> types = [] {
        std::vector<ColumnType> result;
        for (const auto& entry : kTypeTable) {
            result.push_back(entry.type);
        }
        return result;
    }();
    return types;
}

bool isParsed(ColumnType type) noexcept {
    return entryFor(type).base != type;
}

ColumnType baseType(ColumnType type) noexcept {
    return entryFor(type).base;
}

ColumnType parsedVariant(ColumnType type) noexcept {
    for (const auto& entry : kTypeTable) {
        if (entry.base == type && entry.type != type) {
            return entry.type;
        }
    }
    return type;
}

bool isStringType(ColumnType type) noexcept {
    return type == ColumnType::Bytes || type == ColumnType::Ascii || type == ColumnType::Unicode;
}

}} // namespace slicecodec::codec
