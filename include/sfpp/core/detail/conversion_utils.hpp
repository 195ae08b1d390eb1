#pragma once

#include "sfpp/core/exception.hpp"
#include "sfpp/core/extended_types.hpp"
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

namespace sfpp::core::detail {

inline constexpr int64_t POW10_I64[19] = {
    1LL, 10LL, 100LL, 1000LL, 10000LL, 100000LL, 1000000LL, 10000000LL,
    100000000LL, 1000000000LL, 10000000000LL, 100000000000LL, 1000000000000LL,
    10000000000000LL, 100000000000000LL, 1000000000000000LL, 10000000000000000LL,
    100000000000000000LL, 1000000000000000000LL
};

inline int64_t pow10_i64(int exponent) {
    if (exponent < 0 || exponent > 18) {
        throw ConversionException("Power of ten out of range: " + std::to_string(exponent));
    }
    return POW10_I64[exponent];
}

/**
 * @brief Turn decimal text into the digits of its unscaled integer
 *
 * "12.3" at scale 2 -> "1230", "-0.5e1" at scale 0 -> "-5".
 * Fraction digits beyond the scale are truncated.
 */
inline std::string scaled_integer_text(std::string_view text, int scale,
                                       const std::string& column = {}) {
    auto fail = [&]() -> std::string {
        throw DataFormatException("Invalid numeric value", ERR_INVALID_NUMBER,
                                  column, std::string(text));
    };

    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    int fraction_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
            seen_digit = true;
            if (seen_dot) ++fraction_digits;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else if (c == 'e' || c == 'E') {
            break;
        } else {
            return fail();
        }
    }
    if (!seen_digit) {
        return fail();
    }

    int exponent = 0;
    if (pos < text.size()) {
        std::string_view exp_text = text.substr(pos + 1);
        if (!exp_text.empty() && exp_text.front() == '+') {
            exp_text.remove_prefix(1);
        }
        auto [ptr, ec] = std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);
        if (exp_text.empty() || ec != std::errc() || ptr != exp_text.data() + exp_text.size()) {
            return fail();
        }
    }

    // digits * 10^(exponent - fraction_digits) * 10^scale
    int shift = exponent - fraction_digits + scale;
    if (shift >= 0) {
        digits.append(static_cast<size_t>(shift), '0');
    } else {
        size_t drop = static_cast<size_t>(-shift);
        digits = drop >= digits.size() ? std::string("0") : digits.substr(0, digits.size() - drop);
    }

    size_t first = digits.find_first_not_of('0');
    digits = first == std::string::npos ? std::string("0") : digits.substr(first);
    if (negative && digits != "0") {
        digits.insert(digits.begin(), '-');
    }
    return digits;
}

/// Place a decimal point scale digits from the right of integer text
inline std::string format_scaled(const std::string& unscaled, int scale) {
    if (scale <= 0) {
        return unscaled;
    }
    bool negative = !unscaled.empty() && unscaled[0] == '-';
    std::string digits = negative ? unscaled.substr(1) : unscaled;
    if (digits.size() <= static_cast<size_t>(scale)) {
        digits.insert(0, static_cast<size_t>(scale) - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - static_cast<size_t>(scale), 1, '.');
    return negative ? "-" + digits : digits;
}

inline int64_t parse_int64(std::string_view text, const std::string& column = {}) {
    int64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (!text.empty() && text.front() == '+') {
        ++begin;
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        throw DataFormatException("Invalid integer value", ERR_INVALID_NUMBER,
                                  column, std::string(text));
    }
    return value;
}

// strtod accepts "inf", "-inf" and "NaN" as the server sends them
inline double parse_double(std::string_view text, const std::string& column = {}) {
    std::string buffer(text);
    char* end = nullptr;
    double value = std::strtod(buffer.c_str(), &end);
    if (buffer.empty() || end != buffer.c_str() + buffer.size()) {
        throw DataFormatException("Invalid floating point value", ERR_INVALID_NUMBER,
                                  column, buffer);
    }
    return value;
}

/// Shortest text that parses back to the same double
inline std::string format_double(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof buf, value);
    if (ec != std::errc()) {
        throw ConversionException("Cannot format floating point value");
    }
    return std::string(buf, ptr);
}

inline std::string format_float(float value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof buf, value);
    if (ec != std::errc()) {
        throw ConversionException("Cannot format floating point value");
    }
    return std::string(buf, ptr);
}

inline std::string hex_encode(const Bytes& bytes) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

inline Bytes hex_decode(std::string_view text, const std::string& column = {}) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    if (text.size() % 2 != 0) {
        throw DataFormatException("Invalid binary hex form: odd length", ERR_INVALID_BINARY_HEX,
                                  column, std::string(text));
    }
    Bytes out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = nibble(text[i]);
        int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) {
            throw DataFormatException("Invalid binary hex form", ERR_INVALID_BINARY_HEX,
                                      column, std::string(text));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

/**
 * @brief Replace each run of invalid UTF-8 bytes with U+FFFD
 * @return true if anything was replaced
 */
inline bool to_valid_utf8(std::string_view in, std::string& out) {
    static constexpr std::string_view REPLACEMENT = "\xEF\xBF\xBD";
    out.clear();
    out.reserve(in.size());
    bool replaced = false;
    bool in_bad_run = false;
    size_t i = 0;
    while (i < in.size()) {
        auto c = static_cast<unsigned char>(in[i]);
        size_t len = 0;
        uint32_t min_cp = 0;
        uint32_t cp = 0;
        if (c < 0x80)              { len = 1; cp = c; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; min_cp = 0x80; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min_cp = 0x800; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min_cp = 0x10000; }

        bool valid = len > 0 && i + len <= in.size();
        for (size_t k = 1; valid && k < len; ++k) {
            auto cc = static_cast<unsigned char>(in[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cc & 0x3F);
            }
        }
        if (valid && len > 1 &&
            (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
            valid = false;
        }

        if (valid) {
            out.append(in.substr(i, len));
            i += len;
            in_bad_run = false;
        } else {
            if (!in_bad_run) {
                out.append(REPLACEMENT);
            }
            in_bad_run = true;
            replaced = true;
            ++i;
        }
    }
    return replaced;
}

} // namespace sfpp::core::detail
