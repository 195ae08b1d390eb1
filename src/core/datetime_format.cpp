#include "sfpp/core/datetime_format.hpp"
#include "sfpp/core/exception.hpp"
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>

namespace sfpp::core {

namespace {
    constexpr std::array<const char*, 12> MONTHS = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun",
        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };
    constexpr std::array<const char*, 7> WEEKDAYS = {
        "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"
    };

    bool startsWithNoCase(std::string_view s, size_t pos, std::string_view prefix) {
        if (s.size() - pos < prefix.size()) return false;
        for (size_t i = 0; i < prefix.size(); ++i) {
            if (std::toupper(static_cast<unsigned char>(s[pos + i])) !=
                std::toupper(static_cast<unsigned char>(prefix[i]))) {
                return false;
            }
        }
        return true;
    }

    class Cursor {
    public:
        Cursor(std::string_view text, const std::string& pattern)
            : text_(text), pattern_(pattern) {}

        [[noreturn]] void fail(const std::string& what) const {
            throw DataFormatException("Cannot parse datetime with format '" + pattern_ + "': " + what,
                                      ERR_INVALID_DATETIME, {}, std::string(text_));
        }

        int digits(size_t minCount, size_t maxCount, const char* what) {
            size_t start = pos_;
            int value = 0;
            while (pos_ < text_.size() && pos_ - start < maxCount &&
                   std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                value = value * 10 + (text_[pos_] - '0');
                ++pos_;
            }
            if (pos_ - start < minCount) fail(std::string("expected ") + what);
            return value;
        }

        std::string_view letters(size_t count, const char* what) {
            if (text_.size() - pos_ < count) fail(std::string("expected ") + what);
            auto out = text_.substr(pos_, count);
            pos_ += count;
            return out;
        }

        bool accept(char c) {
            if (pos_ < text_.size() && text_[pos_] == c) {
                ++pos_;
                return true;
            }
            return false;
        }

        void expect(std::string_view literal) {
            if (text_.substr(pos_, literal.size()) != literal) {
                fail("expected '" + std::string(literal) + "'");
            }
            pos_ += literal.size();
        }

        bool atEnd() const { return pos_ >= text_.size(); }
        size_t position() const { return pos_; }
        std::string_view rest() const { return text_.substr(pos_); }

    private:
        std::string_view text_;
        const std::string& pattern_;
        size_t pos_ = 0;
    };
}

Timestamp ParsedDateTime::toTimestamp(const Location& defaultLocation) const {
    if (offsetMinutes) {
        return Timestamp::fromCivil(civil, Location::fromOffsetMinutes(*offsetMinutes));
    }
    return Timestamp::fromCivil(civil, defaultLocation);
}

TimeOfDay ParsedDateTime::toTimeOfDay() const {
    return TimeOfDay::fromParts(civil.hour, civil.minute, civil.second, civil.nanosecond);
}

DateTimeFormat DateTimeFormat::compile(std::string_view pattern) {
    DateTimeFormat fmt;
    fmt.pattern_ = std::string(pattern);

    auto push = [&fmt](TokenKind kind, int width = 0) {
        fmt.tokens_.push_back(Token{kind, width, {}});
    };
    auto pushLiteral = [&fmt](std::string_view text) {
        if (!fmt.tokens_.empty() && fmt.tokens_.back().kind == TokenKind::Literal) {
            fmt.tokens_.back().literal += text;
        } else {
            fmt.tokens_.push_back(Token{TokenKind::Literal, 0, std::string(text)});
        }
    };

    size_t i = 0;
    while (i < pattern.size()) {
        if (pattern[i] == '"') {
            size_t close = pattern.find('"', i + 1);
            if (close == std::string_view::npos) {
                throw DataFormatException("Unterminated literal in datetime format",
                                          ERR_INVALID_DATETIME, {}, std::string(pattern));
            }
            pushLiteral(pattern.substr(i + 1, close - i - 1));
            i = close + 1;
        } else if (startsWithNoCase(pattern, i, "YYYY")) { push(TokenKind::Year4);       i += 4; }
        else if (startsWithNoCase(pattern, i, "YY"))     { push(TokenKind::Year2);       i += 2; }
        else if (startsWithNoCase(pattern, i, "MON"))    { push(TokenKind::MonthAbbrev); i += 3; }
        else if (startsWithNoCase(pattern, i, "MM"))     { push(TokenKind::Month);       i += 2; }
        else if (startsWithNoCase(pattern, i, "MI"))     { push(TokenKind::Minute);      i += 2; }
        else if (startsWithNoCase(pattern, i, "DD"))     { push(TokenKind::Day);         i += 2; }
        else if (startsWithNoCase(pattern, i, "DY"))     { push(TokenKind::DayAbbrev);   i += 2; }
        else if (startsWithNoCase(pattern, i, "HH24"))   { push(TokenKind::Hour24);      i += 4; }
        else if (startsWithNoCase(pattern, i, "HH12"))   { push(TokenKind::Hour12);      i += 4; }
        else if (startsWithNoCase(pattern, i, "HH"))     { push(TokenKind::Hour24);      i += 2; }
        else if (startsWithNoCase(pattern, i, "AM") ||
                 startsWithNoCase(pattern, i, "PM"))     { push(TokenKind::Meridiem);    i += 2; }
        else if (startsWithNoCase(pattern, i, "SS"))     { push(TokenKind::Second);      i += 2; }
        else if (startsWithNoCase(pattern, i, "FF")) {
            i += 2;
            int width = ANY_FRACTION_WIDTH;
            if (i < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[i]))) {
                width = pattern[i] - '0';
                ++i;
            }
            push(TokenKind::Fraction, width);
        }
        else if (startsWithNoCase(pattern, i, "TZH"))    { push(TokenKind::TzHour);      i += 3; }
        else if (startsWithNoCase(pattern, i, "TZM"))    { push(TokenKind::TzMinute);    i += 3; }
        else {
            pushLiteral(pattern.substr(i, 1));
            ++i;
        }
    }
    return fmt;
}

ParsedDateTime DateTimeFormat::parse(std::string_view text) const {
    Cursor cur(text, pattern_);
    ParsedDateTime out;
    out.civil = CivilTime{};
    bool pm = false;
    bool has_meridiem = false;
    int tz_sign = 1;
    int tz_hours = 0;
    int tz_minutes = 0;
    bool has_tz = false;

    for (const auto& token : tokens_) {
        switch (token.kind) {
            case TokenKind::Year4: {
                bool negative = cur.accept('-');
                int year = cur.digits(4, 4, "4-digit year");
                out.civil.year = negative ? -year : year;
                break;
            }
            case TokenKind::Year2:
                out.civil.year = 2000 + cur.digits(2, 2, "2-digit year");
                break;
            case TokenKind::Month:
                out.civil.month = static_cast<unsigned>(cur.digits(1, 2, "month"));
                break;
            case TokenKind::MonthAbbrev: {
                auto name = cur.letters(3, "month name");
                bool found = false;
                for (size_t m = 0; m < MONTHS.size(); ++m) {
                    if (startsWithNoCase(name, 0, MONTHS[m])) {
                        out.civil.month = static_cast<unsigned>(m + 1);
                        found = true;
                        break;
                    }
                }
                if (!found) cur.fail("unknown month name '" + std::string(name) + "'");
                break;
            }
            case TokenKind::Day:
                out.civil.day = static_cast<unsigned>(cur.digits(1, 2, "day"));
                break;
            case TokenKind::DayAbbrev:
                cur.letters(3, "weekday name");
                break;
            case TokenKind::Hour24:
            case TokenKind::Hour12:
                out.civil.hour = cur.digits(1, 2, "hour");
                break;
            case TokenKind::Meridiem: {
                auto marker = cur.letters(2, "AM/PM");
                if (startsWithNoCase(marker, 0, "PM")) pm = true;
                else if (!startsWithNoCase(marker, 0, "AM")) cur.fail("expected AM/PM");
                has_meridiem = true;
                break;
            }
            case TokenKind::Minute:
                out.civil.minute = cur.digits(1, 2, "minutes");
                break;
            case TokenKind::Second:
                out.civil.second = cur.digits(1, 2, "seconds");
                break;
            case TokenKind::Fraction: {
                // FF0 carries no digits
                if (token.width == 0) {
                    out.civil.nanosecond = 0;
                    break;
                }
                size_t start = cur.position();
                int64_t nanos = 0;
                int count = 0;
                while (!cur.atEnd() && std::isdigit(static_cast<unsigned char>(cur.rest()[0]))) {
                    int d = cur.digits(1, 1, "fraction");
                    if (count < 9) {
                        nanos = nanos * 10 + d;
                        ++count;
                    }
                }
                if (cur.position() == start && token.width > 0) cur.fail("expected fraction digits");
                for (; count < 9; ++count) nanos *= 10;
                out.civil.nanosecond = nanos;
                break;
            }
            case TokenKind::TzHour:
                if (cur.accept('Z')) {
                    has_tz = true;
                    break;
                }
                if (cur.accept('-')) tz_sign = -1;
                else if (!cur.accept('+')) cur.fail("expected time zone sign");
                tz_hours = cur.digits(1, 2, "time zone hours");
                has_tz = true;
                break;
            case TokenKind::TzMinute:
                tz_minutes = cur.digits(2, 2, "time zone minutes");
                has_tz = true;
                break;
            case TokenKind::Literal:
                cur.expect(token.literal);
                break;
        }
    }
    if (!cur.atEnd()) {
        cur.fail("unexpected trailing text '" + std::string(cur.rest()) + "'");
    }

    if (has_meridiem) {
        if (out.civil.hour == 12) out.civil.hour = 0;
        if (pm) out.civil.hour += 12;
    }
    if (has_tz) {
        out.offsetMinutes = tz_sign * (tz_hours * 60 + tz_minutes);
    }
    return out;
}

std::string DateTimeFormat::format(const Timestamp& ts) const {
    CivilTime c = ts.civil();
    int offset_minutes = ts.offsetSeconds() / 60;
    std::string out;
    char buf[32];

    for (const auto& token : tokens_) {
        switch (token.kind) {
            case TokenKind::Year4:
                std::snprintf(buf, sizeof buf, "%04d", c.year);
                out += buf;
                break;
            case TokenKind::Year2:
                std::snprintf(buf, sizeof buf, "%02d", ((c.year % 100) + 100) % 100);
                out += buf;
                break;
            case TokenKind::Month:
                std::snprintf(buf, sizeof buf, "%02u", c.month);
                out += buf;
                break;
            case TokenKind::MonthAbbrev:
                out += MONTHS[c.month - 1];
                break;
            case TokenKind::Day:
                std::snprintf(buf, sizeof buf, "%02u", c.day);
                out += buf;
                break;
            case TokenKind::DayAbbrev: {
                using namespace std::chrono;
                weekday wd{sys_days{year_month_day{year{c.year}, month{c.month}, day{c.day}}}};
                out += WEEKDAYS[wd.c_encoding()];
                break;
            }
            case TokenKind::Hour24:
                std::snprintf(buf, sizeof buf, "%02d", c.hour);
                out += buf;
                break;
            case TokenKind::Hour12:
                std::snprintf(buf, sizeof buf, "%02d", c.hour % 12 == 0 ? 12 : c.hour % 12);
                out += buf;
                break;
            case TokenKind::Meridiem:
                out += c.hour < 12 ? "AM" : "PM";
                break;
            case TokenKind::Minute:
                std::snprintf(buf, sizeof buf, "%02d", c.minute);
                out += buf;
                break;
            case TokenKind::Second:
                std::snprintf(buf, sizeof buf, "%02d", c.second);
                out += buf;
                break;
            case TokenKind::Fraction: {
                int width = token.width == ANY_FRACTION_WIDTH ? 9 : token.width;
                std::snprintf(buf, sizeof buf, "%09lld", static_cast<long long>(c.nanosecond));
                out.append(buf, static_cast<size_t>(width));
                break;
            }
            case TokenKind::TzHour: {
                int abs_minutes = offset_minutes < 0 ? -offset_minutes : offset_minutes;
                std::snprintf(buf, sizeof buf, "%c%02d", offset_minutes < 0 ? '-' : '+', abs_minutes / 60);
                out += buf;
                break;
            }
            case TokenKind::TzMinute: {
                int abs_minutes = offset_minutes < 0 ? -offset_minutes : offset_minutes;
                std::snprintf(buf, sizeof buf, "%02d", abs_minutes % 60);
                out += buf;
                break;
            }
            case TokenKind::Literal:
                out += token.literal;
                break;
        }
    }
    return out;
}

} // namespace sfpp::core
