#include "yamlite/codec/Scalar.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <system_error>

namespace yamlite::codec::Scalar {

namespace {

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// digits [ '.' digits ] [ (e|E) [sign] digits ], at least one mantissa digit.
bool IsDecimalLiteral(std::string_view body, bool& isFloat) {
    std::size_t i = 0;
    std::size_t mantissaDigits = 0;
    isFloat = false;
    while (i < body.size() && IsDigit(body[i])) {
        ++i;
        ++mantissaDigits;
    }
    if (i < body.size() && body[i] == '.') {
        isFloat = true;
        ++i;
        while (i < body.size() && IsDigit(body[i])) {
            ++i;
            ++mantissaDigits;
        }
    }
    if (mantissaDigits == 0) {
        return false;
    }
    if (i < body.size() && (body[i] == 'e' || body[i] == 'E')) {
        isFloat = true;
        ++i;
        if (i < body.size() && (body[i] == '+' || body[i] == '-')) {
            ++i;
        }
        const std::size_t exponentStart = i;
        while (i < body.size() && IsDigit(body[i])) {
            ++i;
        }
        if (i == exponentStart) {
            return false;
        }
    }
    return i == body.size();
}

bool IsHexLiteral(std::string_view body) {
    if (body.size() < 3 || body[0] != '0' || (body[1] != 'x' && body[1] != 'X')) {
        return false;
    }
    for (std::size_t i = 2; i < body.size(); ++i) {
        if (!IsHexDigit(body[i])) {
            return false;
        }
    }
    return true;
}

bool ParseDouble(std::string_view text, Value& out) {
    double number = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return false;
    }
    out = number;
    return true;
}

bool ParseHex(std::string_view digits, bool negative, Value& out) {
    std::uint64_t magnitude = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, 16);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return false;
    }
    if (!negative) {
        if (magnitude <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            out = static_cast<std::int64_t>(magnitude);
        } else {
            out = magnitude;
        }
        return true;
    }
    constexpr auto kMinMagnitude = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1;
    if (magnitude == kMinMagnitude) {
        out = std::numeric_limits<std::int64_t>::min();
    } else if (magnitude < kMinMagnitude) {
        out = -static_cast<std::int64_t>(magnitude);
    } else {
        out = -static_cast<double>(magnitude);
    }
    return true;
}

bool ParseInteger(std::string_view text, bool negative, Value& out) {
    std::int64_t integer = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), integer);
    if (ec == std::errc() && ptr == text.data() + text.size()) {
        out = integer;
        return true;
    }
    if (ec != std::errc::result_out_of_range) {
        return false;
    }
    if (!negative) {
        std::uint64_t unsignedInteger = 0;
        const auto [uptr, uec] = std::from_chars(text.data(), text.data() + text.size(), unsignedInteger);
        if (uec == std::errc() && uptr == text.data() + text.size()) {
            out = unsignedInteger;
            return true;
        }
    }
    return ParseDouble(text, out);
}

} // namespace

std::string_view TrimView(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

std::string Trim(std::string_view value) {
    return std::string(TrimView(value));
}

bool IsQuoted(std::string_view text) {
    return text.size() >= 2 && text.front() == text.back() &&
           (text.front() == '"' || text.front() == '\'');
}

bool TryParseNumber(std::string_view literal, Value& out) {
    if (literal.empty()) {
        return false;
    }
    // from_chars rejects a leading '+', so it is dropped before conversion.
    std::string_view text = literal;
    if (text.front() == '+') {
        text.remove_prefix(1);
    }
    const bool negative = !text.empty() && text.front() == '-';
    const std::string_view body = negative ? text.substr(1) : text;
    if (body.empty() || body.front() == '+' || body.front() == '-') {
        return false;
    }

    if (IsHexLiteral(body)) {
        return ParseHex(body.substr(2), negative, out);
    }

    bool isFloat = false;
    if (!IsDecimalLiteral(body, isFloat)) {
        return false;
    }
    if (isFloat) {
        return ParseDouble(text, out);
    }
    return ParseInteger(text, negative, out);
}

Value Parse(std::string_view literal) {
    const std::string_view value = TrimView(literal);
    if (value.empty() || value == "null" || value == "~") {
        return Value();
    }
    if (value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off") {
        return false;
    }
    if (value == "[]") {
        return Value::array();
    }
    if (value == "{}") {
        return Value::object();
    }
    if (value == ".nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (value == ".inf" || value == "+.inf") {
        return std::numeric_limits<double>::infinity();
    }
    if (value == "-.inf") {
        return -std::numeric_limits<double>::infinity();
    }
    Value number;
    if (TryParseNumber(value, number)) {
        return number;
    }
    if (IsQuoted(value)) {
        return std::string(value.substr(1, value.size() - 2));
    }
    return std::string(value);
}

} // namespace yamlite::codec::Scalar
