#pragma once

#include "sfpp/core/extended_types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sfpp::core {

/// Result of parsing date/time text
struct ParsedDateTime {
    CivilTime civil;
    std::optional<int> offsetMinutes;   // set when the format has TZH/TZM

    /// Instant, using the parsed offset or the given location when there is none
    Timestamp toTimestamp(const Location& defaultLocation) const;

    TimeOfDay toTimeOfDay() const;
};

/**
 * @brief Server date/time format ("YYYY-MM-DD HH24:MI:SS.FF3 TZHTZM")
 *
 * Supports YYYY, YY, MM, MON, DD, DY, HH24, HH12, HH, AM/PM, MI, SS,
 * FF and FF0-FF9, TZH, TZM and double-quoted literals; any other
 * character is matched literally. Tokens are case-insensitive.
 */
class DateTimeFormat {
public:
    static DateTimeFormat compile(std::string_view pattern);

    /**
     * @brief Parse text in this format
     * @throws DataFormatException (ERR_INVALID_DATETIME) if the text does not match
     */
    ParsedDateTime parse(std::string_view text) const;

    /// Render a timestamp's wall clock in its own location
    std::string format(const Timestamp& ts) const;

    const std::string& pattern() const { return pattern_; }

private:
    enum class TokenKind {
        Year4,
        Year2,
        Month,
        MonthAbbrev,
        Day,
        DayAbbrev,
        Hour24,
        Hour12,
        Meridiem,
        Minute,
        Second,
        Fraction,
        TzHour,
        TzMinute,
        Literal
    };

    static constexpr int ANY_FRACTION_WIDTH = -1;

    struct Token {
        TokenKind kind;
        int width = 0;          // fraction digits; bare FF is ANY_FRACTION_WIDTH
        std::string literal;
    };

    std::string pattern_;
    std::vector<Token> tokens_;
};

} // namespace sfpp::core
