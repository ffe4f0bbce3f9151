#include "slicecodec/codec/ValueParser.hpp"

#include <fast_float/fast_float.h>
#include <fmt/format.h>
#include <cctype>
#include <system_error>

namespace slicecodec {
namespace codec {

namespace {

core::Error rejected(const char* what, std::string_view text) {
    return core::makeError(core::ErrorCode::ValueRejected,
                           fmt::format("Cannot parse '{}' as {}", std::string(text), what));
}

bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

// 读取固定位数的十进制数字
bool fixedDigits(std::string_view text, size_t pos, size_t count, int& out) noexcept {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!isDigit(text[i])) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

// 不做 trim 的浮点解析，要求整个区间被消费
bool parseDoubleExact(std::string_view text, double& out) noexcept {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            return false;
        }
    }
    if (text.empty()) {
        return false;
    }
    auto result = fast_float::from_chars(text.data(), text.data() + text.size(), out);
    if (result.ptr != text.data() + text.size()) {
        return false;
    }
    // 溢出时 fast_float 已给出 ±inf / ±0
    return result.ec == std::errc() || result.ec == std::errc::result_out_of_range;
}

bool looksLikeInteger(std::string_view text) noexcept {
    size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        ++pos;
    }
    if (pos == text.size()) {
        return false;
    }
    for (; pos < text.size(); ++pos) {
        if (!isDigit(text[pos])) {
            return false;
        }
    }
    return true;
}

core::Result<core::Time> parseTimeTrimmed(std::string_view text) {
    int hour = 0, minute = 0, second = 0;
    uint32_t microsecond = 0;
    if (!fixedDigits(text, 0, 2, hour) || text.size() < 5 || text[2] != ':' ||
        !fixedDigits(text, 3, 2, minute)) {
        return rejected("time", text);
    }
    size_t pos = 5;
    if (pos < text.size()) {
        if (text[pos] != ':' || !fixedDigits(text, pos + 1, 2, second)) {
            return rejected("time", text);
        }
        pos += 3;
        if (pos < text.size()) {
            if (text[pos] != '.') {
                return rejected("time", text);
            }
            ++pos;
            size_t digits = 0;
            while (pos < text.size() && isDigit(text[pos])) {
                if (digits < 6) {
                    microsecond = microsecond * 10 + static_cast<uint32_t>(text[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0 || pos != text.size()) {
                return rejected("time", text);
            }
            for (; digits < 6; ++digits) {
                microsecond *= 10;
            }
        }
    }
    core::Time time(hour, minute, second, microsecond);
    if (!time.isValid()) {
        return rejected("time", text);
    }
    return time;
}

} // namespace

std::string_view trimWhitespace(std::string_view text) noexcept {
    while (!text.empty() && isSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

core::Result<int64_t> parseInt64(std::string_view text) {
    std::string_view trimmed = trimWhitespace(text);
    if (!looksLikeInteger(trimmed)) {
        return rejected("integer", text);
    }
    if (trimmed.front() == '+') {
        trimmed.remove_prefix(1);
    }
    int64_t value = 0;
    auto result = fast_float::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (result.ec == std::errc::result_out_of_range) {
        return core::makeError(core::ErrorCode::Overflow,
                               fmt::format("Integer {} does not fit in 64 bits", std::string(trimmed)));
    }
    if (result.ec != std::errc() || result.ptr != trimmed.data() + trimmed.size()) {
        return rejected("integer", text);
    }
    return value;
}

core::Result<double> parseDouble(std::string_view text) {
    double value = 0.0;
    if (!parseDoubleExact(trimWhitespace(text), value)) {
        return rejected("float", text);
    }
    return value;
}

core::Result<core::Number> parseNumber(std::string_view text) {
    std::string_view trimmed = trimWhitespace(text);
    if (looksLikeInteger(trimmed)) {
        auto integer = core::BigInt::parse(trimmed);
        if (integer) {
            return core::Number(*integer);
        }
    }
    double value = 0.0;
    if (!parseDoubleExact(trimmed, value)) {
        return rejected("number", text);
    }
    return core::Number(value);
}

core::Result<core::Complex> parseComplex(std::string_view text) {
    std::string_view body = trimWhitespace(text);
    if (body.size() >= 2 && body.front() == '(' && body.back() == ')') {
        body = trimWhitespace(body.substr(1, body.size() - 2));
    }
    if (body.empty()) {
        return rejected("complex", text);
    }

    if (body.back() != 'j' && body.back() != 'J') {
        double real = 0.0;
        if (!parseDoubleExact(body, real)) {
            return rejected("complex", text);
        }
        return core::Complex(real, 0.0);
    }

    body.remove_suffix(1);
    // 最后一个不属于指数部分的符号分隔实部与虚部
    size_t split = std::string_view::npos;
    for (size_t i = body.size(); i-- > 1;) {
        if ((body[i] == '+' || body[i] == '-') && body[i - 1] != 'e' && body[i - 1] != 'E') {
            split = i;
            break;
        }
    }

    std::string_view real_part = split == std::string_view::npos ? std::string_view() : body.substr(0, split);
    std::string_view imag_part = split == std::string_view::npos ? body : body.substr(split);

    double real = 0.0;
    if (!real_part.empty() && !parseDoubleExact(real_part, real)) {
        return rejected("complex", text);
    }
    double imag = 0.0;
    if (imag_part.empty() || imag_part == "+") {
        imag = 1.0;
    } else if (imag_part == "-") {
        imag = -1.0;
    } else if (!parseDoubleExact(imag_part, imag)) {
        return rejected("complex", text);
    }
    return core::Complex(real, imag);
}

core::Result<core::Date> parseDate(std::string_view text) {
    std::string_view trimmed = trimWhitespace(text);
    int year = 0, month = 0, day = 0;
    if (trimmed.size() != 10 || trimmed[4] != '-' || trimmed[7] != '-' ||
        !fixedDigits(trimmed, 0, 4, year) || !fixedDigits(trimmed, 5, 2, month) ||
        !fixedDigits(trimmed, 8, 2, day)) {
        return rejected("date", text);
    }
    core::Date date(year, month, day);
    if (!date.isValid()) {
        return rejected("date", text);
    }
    return date;
}

core::Result<core::Time> parseTime(std::string_view text) {
    return parseTimeTrimmed(trimWhitespace(text));
}

core::Result<core::DateTime> parseDateTime(std::string_view text) {
    std::string_view trimmed = trimWhitespace(text);
    auto date = parseDate(trimmed.substr(0, 10));
    if (!date) {
        return rejected("datetime", text);
    }
    if (trimmed.size() == 10) {
        return core::DateTime(date.value(), core::Time());
    }
    if (trimmed.size() < 11 || (trimmed[10] != 'T' && trimmed[10] != ' ')) {
        return rejected("datetime", text);
    }
    auto time = parseTimeTrimmed(trimmed.substr(11));
    if (!time) {
        return rejected("datetime", text);
    }
    return core::DateTime(date.value(), time.value());
}

}} // namespace slicecodec::codec
