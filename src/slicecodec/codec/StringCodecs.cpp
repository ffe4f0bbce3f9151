#include "slicecodec/codec/StringCodecs.hpp"
#include "slicecodec/codec/WireFormat.hpp"
#include "slicecodec/core/Exception.hpp"
#include "slicecodec/hash/HashValue.hpp"

#include <json/json.h>
#include <utf8.h>
#include <fmt/format.h>

#include <cmath>
#include <memory>

namespace slicecodec {
namespace codec {

namespace {

bool isAscii(const std::string& text) noexcept {
    for (char c : text) {
        if (static_cast<unsigned char>(c) > 0x7f) {
            return false;
        }
    }
    return true;
}

const std::string& payloadOf(const core::Value& value) {
    if (const auto* bytes = std::get_if<core::Bytes>(&value)) {
        return bytes->data;
    }
    if (const auto* json = std::get_if<core::Json>(&value)) {
        return json->text;
    }
    return std::get<std::string>(value);
}

bool parseJson(const std::string& text, ::Json::Value& root, std::string& errors) {
    ::Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["allowComments"] = false;
    builder["allowSpecialFloats"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<::Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), &root, &errors);
}

std::string writeJson(const ::Json::Value& root) {
    ::Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return ::Json::writeString(builder, root);
}

} // namespace

// ========== StringCodecBase ==========

void StringCodecBase::encode(const core::Value& value, std::string& out) const {
    if (core::isNone(value)) {
        out.push_back(static_cast<char>(WireFormat::kLongStringMarker));
        appendLE<uint32_t>(out, WireFormat::kStringNoneLength);
        return;
    }
    const std::string& data = payloadOf(value);
    if (data.size() < WireFormat::kLongStringMarker) {
        out.push_back(static_cast<char>(static_cast<uint8_t>(data.size())));
    } else {
        out.push_back(static_cast<char>(WireFormat::kLongStringMarker));
        appendLE<uint32_t>(out, static_cast<uint32_t>(data.size()));
    }
    out.append(data);
}

std::optional<std::string> StringCodecBase::decodeRaw(stream::ByteSource& source, bool& is_none) const {
    is_none = false;
    uint8_t prefix = 0;
    if (!source.readExact(&prefix, 1)) {
        return std::nullopt;
    }
    size_t length = prefix;
    if (prefix == WireFormat::kLongStringMarker) {
        uint8_t buf[4];
        source.require(buf, 4);
        uint32_t long_length = loadLE<uint32_t>(buf);
        if (long_length == WireFormat::kStringNoneLength) {
            is_none = true;
            return std::string();
        }
        length = long_length;
    }
    std::string data;
    source.requireAppend(data, length);
    return data;
}

core::Result<core::Value> StringCodecBase::checkLength(const std::string& data, core::Value converted,
                                                        const core::Value& original) const {
    if (data.size() >= WireFormat::kStringNoneLength) {
        return rejected(original, fmt::format("length {} too long", data.size()));
    }
    return converted;
}

// ========== BytesCodec ==========

core::Result<core::Value> BytesCodec::convert(const core::Value& value) const {
    if (const auto* bytes = std::get_if<core::Bytes>(&value)) {
        return checkLength(bytes->data, value, value);
    }
    return mismatch(value);
}

std::optional<core::Value> BytesCodec::decode(stream::ByteSource& source) const {
    bool is_none = false;
    auto raw = decodeRaw(source, is_none);
    if (!raw) {
        return std::nullopt;
    }
    if (is_none) {
        return core::Value(core::None);
    }
    return core::Value(core::Bytes(std::move(*raw)));
}

uint64_t BytesCodec::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashBytes(std::get<core::Bytes>(value).data);
}

// ========== AsciiCodec ==========

core::Result<core::Value> AsciiCodec::convert(const core::Value& value) const {
    const std::string* text = textOf(value);
    if (!text) {
        return mismatch(value);
    }
    if (!isAscii(*text)) {
        return rejected(value, "contains non-ASCII bytes");
    }
    return checkLength(*text, core::Value(*text), value);
}

std::optional<core::Value> AsciiCodec::decode(stream::ByteSource& source) const {
    bool is_none = false;
    auto raw = decodeRaw(source, is_none);
    if (!raw) {
        return std::nullopt;
    }
    if (is_none) {
        return core::Value(core::None);
    }
    return core::Value(std::move(*raw));
}

uint64_t AsciiCodec::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashBytes(std::get<std::string>(value));
}

// ========== UnicodeCodec ==========

core::Result<core::Value> UnicodeCodec::convert(const core::Value& value) const {
    const auto* text = std::get_if<std::string>(&value);
    if (!text) {
        return mismatch(value);
    }
    if (!utf8::is_valid(text->begin(), text->end())) {
        return rejected(value, "invalid UTF-8");
    }
    return checkLength(*text, value, value);
}

std::optional<core::Value> UnicodeCodec::decode(stream::ByteSource& source) const {
    bool is_none = false;
    auto raw = decodeRaw(source, is_none);
    if (!raw) {
        return std::nullopt;
    }
    if (is_none) {
        return core::Value(core::None);
    }
    return core::Value(std::move(*raw));
}

uint64_t UnicodeCodec::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashText(std::get<std::string>(value));
}

// ========== JsonCodec ==========

core::Result<core::Value> JsonCodec::convert(const core::Value& value) const {
    ::Json::Value root;
    if (const auto* json = std::get_if<core::Json>(&value)) {
        std::string errors;
        if (!parseJson(json->text, root, errors)) {
            return rejected(value, "invalid JSON: " + errors);
        }
    } else if (const auto* text = isParsed(type()) ? textOf(value) : nullptr) {
        std::string errors;
        if (!utf8::is_valid(text->begin(), text->end())) {
            return rejected(value, "invalid UTF-8");
        }
        if (!parseJson(*text, root, errors)) {
            return rejected(value, "invalid JSON: " + errors);
        }
    } else if (const auto* flag = std::get_if<bool>(&value)) {
        root = *flag;
    } else if (const auto* integer = std::get_if<int64_t>(&value)) {
        root = static_cast<::Json::Int64>(*integer);
    } else if (const auto* real = std::get_if<double>(&value)) {
        if (!std::isfinite(*real)) {
            return rejected(value, "not representable in JSON");
        }
        root = *real;
    } else if (const auto* number = std::get_if<core::Number>(&value)) {
        if (number->isInteger()) {
            if (!number->integer().fitsInt64()) {
                return rejected(value, "integer out of range for JSON");
            }
            root = static_cast<::Json::Int64>(number->integer().toInt64());
        } else if (std::isfinite(number->floating())) {
            root = number->floating();
        } else {
            return rejected(value, "not representable in JSON");
        }
    } else if (const auto* text = std::get_if<std::string>(&value)) {
        if (!utf8::is_valid(text->begin(), text->end())) {
            return rejected(value, "invalid UTF-8");
        }
        root = *text;
    } else {
        return mismatch(value);
    }
    std::string canonical = writeJson(root);
    return checkLength(canonical, core::Value(core::Json(canonical)), value);
}

std::optional<core::Value> JsonCodec::decode(stream::ByteSource& source) const {
    bool is_none = false;
    auto raw = decodeRaw(source, is_none);
    if (!raw) {
        return std::nullopt;
    }
    if (is_none) {
        return core::Value(core::None);
    }
    ::Json::Value root;
    std::string errors;
    if (!parseJson(*raw, root, errors)) {
        SLICECODEC_THROW_FILE(fmt::format("Invalid JSON in column data: {}", errors), source.name(),
                              core::ErrorCode::FileCorrupted);
    }
    return core::Value(core::Json(std::move(*raw)));
}

uint64_t JsonCodec::hashCanonical(const core::Value& value) const {
    if (core::isNone(value)) {
        return 0;
    }
    return hash::hashText(std::get<core::Json>(value).text);
}

}} // namespace slicecodec::codec
