#include "slicecodec/core/Value.hpp"
#include "slicecodec/core/Constants.hpp"

#include <cmath>
#include <limits>
#include <fmt/format.h>

namespace slicecodec {
namespace core {

namespace {

bool isLeapYear(int32_t year) {
    return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

int daysInMonth(int32_t year, int month) {
    static const int kNormalDays[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kNormalDays[month];
}

template<typename T>
int threeWay(const T& a, const T& b) {
    return a < b ? -1 : (b < a ? 1 : 0);
}

std::string formatDouble(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    return fmt::format("{}", value);
}

} // namespace

// ========== Number ==========

bool Number::isZero() const noexcept {
    if (isInteger()) {
        return std::get<BigInt>(value_).isZero();
    }
    return std::get<double>(value_) == 0.0;
}

double Number::toDouble() const noexcept {
    if (isInteger()) {
        return std::get<BigInt>(value_).toDouble();
    }
    return std::get<double>(value_);
}

int Number::compare(const Number& other) const {
    if (isInteger() && other.isInteger()) {
        return integer().compare(other.integer());
    }
    if (isInteger()) {
        return integer().compareDouble(other.floating());
    }
    if (other.isInteger()) {
        int cmp = other.integer().compareDouble(floating());
        return cmp == 2 ? 2 : -cmp;
    }
    double a = floating();
    double b = other.floating();
    if (std::isnan(a) || std::isnan(b)) {
        return 2;
    }
    return threeWay(a, b);
}

std::string Number::toString() const {
    if (isInteger()) {
        return integer().toString();
    }
    return formatDouble(floating());
}

bool Number::operator==(const Number& other) const {
    if (isInteger() != other.isInteger()) {
        return false;
    }
    if (isInteger()) {
        return integer() == other.integer();
    }
    double a = floating();
    double b = other.floating();
    // NaN 与自身视为相等，便于往返校验
    return a == b || (std::isnan(a) && std::isnan(b));
}

// ========== Date / Time / DateTime ==========

bool Date::isValid() const noexcept {
    if (year < Constants::kMinYear || year > Constants::kMaxYear) {
        return false;
    }
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= daysInMonth(year, month);
}

int Date::compare(const Date& other) const noexcept {
    if (year != other.year) {
        return threeWay(year, other.year);
    }
    if (month != other.month) {
        return threeWay(month, other.month);
    }
    return threeWay(day, other.day);
}

std::string Date::toString() const {
    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

bool Time::isValid() const noexcept {
    return hour < 24 && minute < 60 && second < 60 && microsecond < 1000000 && fold <= 1;
}

int Time::compare(const Time& other) const noexcept {
    if (hour != other.hour) {
        return threeWay(hour, other.hour);
    }
    if (minute != other.minute) {
        return threeWay(minute, other.minute);
    }
    if (second != other.second) {
        return threeWay(second, other.second);
    }
    return threeWay(microsecond, other.microsecond);
}

std::string Time::toString() const {
    std::string result = fmt::format("{:02d}:{:02d}:{:02d}", hour, minute, second);
    if (microsecond) {
        result += fmt::format(".{:06d}", microsecond);
    }
    return result;
}

int DateTime::compare(const DateTime& other) const noexcept {
    int cmp = date.compare(other.date);
    return cmp != 0 ? cmp : time.compare(other.time);
}

std::string DateTime::toString() const {
    return date.toString() + " " + time.toString();
}

// ========== Value ==========

const char* valueKindName(const Value& value) noexcept {
    switch (value.index()) {
        case 0: return "None";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        case 4: return "complex";
        case 5: return "number";
        case 6: return "bytes";
        case 7: return "text";
        case 8: return "date";
        case 9: return "time";
        case 10: return "datetime";
        case 11: return "json";
        default: return "unknown";
    }
}

std::string describe(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, NoneType>) {
            return "None";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "True" : "False";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return formatDouble(v);
        } else if constexpr (std::is_same_v<T, Complex>) {
            return fmt::format("({}{}{}j)", formatDouble(v.real()),
                               std::signbit(v.imag()) ? "" : "+", formatDouble(v.imag()));
        } else if constexpr (std::is_same_v<T, Number>) {
            return v.toString();
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return v.data;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, Json>) {
            return v.text;
        } else {
            return v.toString();
        }
    }, value);
}

double roundToFloat32(double value) noexcept {
    if (std::isnan(value) || std::isinf(value)) {
        return value;
    }
    // FLT_MAX 与 2^128 的中点，达到即舍入为无穷大
    constexpr double kFloat32Overflow = 3.4028235677973366e38;
    if (std::fabs(value) >= kFloat32Overflow) {
        return std::copysign(std::numeric_limits<double>::infinity(), value);
    }
    volatile float narrowed = static_cast<float>(value);
    return static_cast<double>(narrowed);
}

uint32_t packDate(const Date& date) noexcept {
    return static_cast<uint32_t>(date.year) << 9 |
           static_cast<uint32_t>(date.month) << 5 |
           static_cast<uint32_t>(date.day);
}

Date unpackDate(uint32_t packed) noexcept {
    return Date(static_cast<int32_t>(packed >> 9), (packed >> 5) & 0x0f, packed & 0x1f);
}

PackedDateTime packDateTime(const DateTime& datetime) noexcept {
    PackedDateTime packed;
    packed.hi = (datetime.time.fold ? kFoldBit : 0u) |
                static_cast<uint32_t>(datetime.date.year) << 14 |
                static_cast<uint32_t>(datetime.date.month) << 10 |
                static_cast<uint32_t>(datetime.date.day) << 5 |
                static_cast<uint32_t>(datetime.time.hour);
    packed.lo = static_cast<uint32_t>(datetime.time.minute) << 26 |
                static_cast<uint32_t>(datetime.time.second) << 20 |
                datetime.time.microsecond;
    return packed;
}

DateTime unpackDateTime(const PackedDateTime& packed) noexcept {
    uint32_t hi = packed.hi & ~kFoldBit;
    Date date(static_cast<int32_t>(hi >> 14), (hi >> 10) & 0x0f, (hi >> 5) & 0x1f);
    Time time(hi & 0x1f, (packed.lo >> 26) & 0x3f, (packed.lo >> 20) & 0x3f,
              packed.lo & 0xfffff, (packed.hi & kFoldBit) ? 1 : 0);
    return DateTime(date, time);
}

PackedDateTime packTime(const Time& time) noexcept {
    return packDateTime(DateTime(Date(1970, 1, 1), time));
}

Time unpackTime(const PackedDateTime& packed) noexcept {
    return unpackDateTime(packed).time;
}

}} // namespace slicecodec::core
