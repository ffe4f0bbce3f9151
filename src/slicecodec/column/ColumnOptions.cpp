#include "slicecodec/column/ColumnOptions.hpp"
#include "slicecodec/archive/CompressionEngine.hpp"
#include "slicecodec/codec/TypeCodec.hpp"
#include "slicecodec/codec/ValueParser.hpp"
#include "slicecodec/core/Exception.hpp"

#include <fmt/format.h>
#include <limits>
#include <sstream>
#include <vector>

namespace slicecodec {
namespace column {

namespace {

std::vector<std::string> splitComma(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        parts.emplace_back(codec::trimWhitespace(part));
    }
    return parts;
}

bool parseBoolOption(const std::string& key, const std::string& text) {
    std::string value(codec::trimWhitespace(text));
    if (value == "1" || value == "true" || value == "True" || value == "yes") {
        return true;
    }
    if (value == "0" || value == "false" || value == "False" || value == "no" || value.empty()) {
        return false;
    }
    SLICECODEC_THROW_PARAM(fmt::format("Option {} expects a boolean, got '{}'", key, text), key);
}

int64_t parseIntOption(const std::string& key, const std::string& text) {
    auto parsed = codec::parseInt64(text);
    if (!parsed) {
        SLICECODEC_THROW_PARAM(fmt::format("Option {} expects an integer, got '{}'", key, text), key);
    }
    return parsed.value();
}

void validateCompression(const std::string& name) {
    auto backend = archive::CompressionEngine::stringToBackend(name);
    if (!backend) {
        SLICECODEC_THROW_PARAM(backend.error().message, "compression");
    }
}

} // namespace

// ========== HashFilter ==========

HashFilter HashFilter::parse(const std::string& text) {
    std::vector<std::string> parts = splitComma(text);
    if (parts.size() < 2 || parts.size() > 3) {
        SLICECODEC_THROW_PARAM(fmt::format("hashfilter must be 'sliceno,slices[,spread_none]', got '{}'", text),
                               "hashfilter");
    }
    int64_t sliceno = parseIntOption("hashfilter", parts[0]);
    int64_t slices = parseIntOption("hashfilter", parts[1]);
    if (sliceno < 0 || slices <= 0 || slices > std::numeric_limits<uint32_t>::max()) {
        SLICECODEC_THROW_PARAM(fmt::format("Invalid hashfilter '{}'", text), "hashfilter");
    }
    HashFilter filter(static_cast<uint32_t>(sliceno), static_cast<uint32_t>(slices),
                      parts.size() == 3 && parseBoolOption("hashfilter", parts[2]));
    filter.validate();
    return filter;
}

void HashFilter::validate() const {
    if (slices == 0 || sliceno >= slices) {
        SLICECODEC_THROW_PARAM(fmt::format("Invalid hashfilter: slice {} of {}", sliceno, slices), "hashfilter");
    }
}

// ========== WriterOptions ==========

WriterOptions WriterOptions::fromKeyValues(const std::map<std::string, std::string>& options,
                                           codec::ColumnType type) {
    WriterOptions result;
    for (const auto& [key, value] : options) {
        if (key == "compression") {
            validateCompression(value);
            result.compression = value;
        } else if (key == "compression_level") {
            result.compression_level = static_cast<int>(parseIntOption(key, value));
        } else if (key == "none_support") {
            result.none_support = parseBoolOption(key, value);
        } else if (key == "default") {
            if (value == "None") {
                result.default_value = core::Value(core::None);
            } else {
                auto parsed = valueFromText(type, value);
                if (!parsed) {
                    SLICECODEC_THROW_PARAM(fmt::format("Invalid default for {}: {}", codec::columnTypeName(type),
                                                       parsed.error().message), key);
                }
                result.default_value = std::move(parsed).value();
            }
        } else if (key == "hashfilter") {
            result.hashfilter = HashFilter::parse(value);
        } else if (key == "error_extra") {
            result.error_extra = value;
        } else {
            SLICECODEC_THROW_PARAM(fmt::format("Unknown writer option '{}'", key), key);
        }
    }
    return result;
}

// ========== ReaderOptions ==========

ReaderOptions ReaderOptions::fromKeyValues(const std::map<std::string, std::string>& options) {
    ReaderOptions result;
    for (const auto& [key, value] : options) {
        if (key == "compression") {
            validateCompression(value);
            result.compression = value;
        } else if (key == "hashfilter") {
            result.hashfilter = HashFilter::parse(value);
        } else if (key == "want_count") {
            result.want_count = parseIntOption(key, value);
        } else if (key == "seek") {
            int64_t seek = parseIntOption(key, value);
            if (seek < 0) {
                SLICECODEC_THROW_PARAM("seek must not be negative", key);
            }
            result.seek = static_cast<uint64_t>(seek);
        } else if (key == "callback_interval") {
            result.callback_interval = parseIntOption(key, value);
        } else if (key == "callback_offset") {
            result.callback_offset = parseIntOption(key, value);
        } else {
            SLICECODEC_THROW_PARAM(fmt::format("Unknown reader option '{}'", key), key);
        }
    }
    result.validate();
    return result;
}

void ReaderOptions::validate() const {
    if (want_count < -1) {
        SLICECODEC_THROW_PARAM(fmt::format("want_count must be -1 or non-negative, got {}", want_count), "want_count");
    }
    if (callback_interval < 0) {
        SLICECODEC_THROW_PARAM("callback_interval must not be negative", "callback_interval");
    }
    if (hashfilter) {
        hashfilter->validate();
    }
}

// ========== valueFromText ==========

core::Result<core::Value> valueFromText(codec::ColumnType type, const std::string& text) {
    codec::ColumnType base = codec::baseType(type);
    if (base == codec::ColumnType::Bool) {
        std::string trimmed(codec::trimWhitespace(text));
        if (trimmed == "1" || trimmed == "true" || trimmed == "True") {
            return core::Value(true);
        }
        if (trimmed == "0" || trimmed == "false" || trimmed == "False") {
            return core::Value(false);
        }
        return core::makeError(core::ErrorCode::ValueRejected, fmt::format("Cannot parse '{}' as bool", text));
    }
    if (base == codec::ColumnType::Bytes) {
        return core::Value(core::Bytes(text));
    }
    auto value_codec = codec::TypeCodec::create(codec::parsedVariant(base));
    return value_codec->convert(core::Value(text));
}

}} // namespace slicecodec::column
