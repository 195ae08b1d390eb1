#include "sfpp/core/extended_types.hpp"
#include "sfpp/core/detail/conversion_utils.hpp"
#include "sfpp/core/exception.hpp"
#include <sfpp_util/logging.h>
#include <algorithm>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace sfpp::core {

namespace {
    constexpr int64_t NANOS_PER_SECOND = 1'000'000'000;
    constexpr int64_t SECONDS_PER_DAY = 86'400;

    int64_t floor_div(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
        return q;
    }

    CivilTime civil_from_local_seconds(int64_t localSeconds, int64_t nanos) {
        using namespace std::chrono;
        int64_t day_count = floor_div(localSeconds, SECONDS_PER_DAY);
        int64_t second_of_day = localSeconds - day_count * SECONDS_PER_DAY;
        year_month_day ymd{sys_days{days{day_count}}};

        CivilTime civil;
        civil.year = static_cast<int>(ymd.year());
        civil.month = static_cast<unsigned>(ymd.month());
        civil.day = static_cast<unsigned>(ymd.day());
        civil.hour = static_cast<int>(second_of_day / 3600);
        civil.minute = static_cast<int>((second_of_day % 3600) / 60);
        civil.second = static_cast<int>(second_of_day % 60);
        civil.nanosecond = nanos;
        return civil;
    }
}

// ---------------------------------------------------------------- BigInt

BigInt::BigInt(int64_t value) {
    value_ = static_cast<ttmath::sint>(value);
}

BigInt BigInt::fromString(std::string_view text) {
    size_t pos = 0;
    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size()) {
        throw DataFormatException("Invalid integer value", ERR_INVALID_NUMBER, {}, std::string(text));
    }

    const IntType ten(static_cast<ttmath::sint>(10));
    IntType result;
    result.SetZero();
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c < '0' || c > '9') {
            throw DataFormatException("Invalid integer value", ERR_INVALID_NUMBER, {}, std::string(text));
        }
        IntType digit(static_cast<ttmath::sint>(c - '0'));
        if (result.Mul(ten) || result.Add(digit)) {
            throw DataFormatException("Integer value out of range", ERR_INVALID_NUMBER, {}, std::string(text));
        }
    }
    if (negative) {
        result.ChangeSign();
    }
    return BigInt(result);
}

std::string BigInt::toString() const {
    return value_.ToString();
}

std::optional<int64_t> BigInt::toInt64() const {
    ttmath::sint out = 0;
    if (value_.ToInt(out)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(out);
}

BigInt BigInt::scaledUp(int exponent) const {
    const IntType ten(static_cast<ttmath::sint>(10));
    IntType result = value_;
    for (int i = 0; i < exponent; ++i) {
        if (result.Mul(ten)) {
            throw ConversionException("Integer overflow scaling " + toString() +
                                      " by 10^" + std::to_string(exponent));
        }
    }
    return BigInt(result);
}

// ---------------------------------------------------------------- Decimal

Decimal Decimal::fromString(std::string_view text, int scale) {
    return Decimal(BigInt::fromString(detail::scaled_integer_text(text, scale)), scale);
}

std::string Decimal::toString() const {
    return detail::format_scaled(unscaled_.toString(), scale_);
}

double Decimal::toDouble() const {
    return detail::parse_double(toString());
}

Decimal Decimal::rescaled(int scale) const {
    if (scale == scale_) {
        return *this;
    }
    if (scale > scale_) {
        return Decimal(unscaled_.scaledUp(scale - scale_), scale);
    }
    return Decimal::fromString(toString(), scale);
}

bool Decimal::operator==(const Decimal& other) const {
    int common = std::max(scale_, other.scale_);
    return rescaled(common).unscaled_ == other.rescaled(common).unscaled_;
}

// ---------------------------------------------------------------- Location

Location Location::utc() {
    return Location();
}

Location Location::fixedOffset(int offsetSeconds) {
    Location loc;
    loc.kind_ = Kind::Fixed;
    loc.offsetSeconds_ = offsetSeconds;
    return loc;
}

Location Location::named(std::string_view name) {
    Location loc;
    loc.kind_ = Kind::Zone;
    try {
        loc.zone_ = std::chrono::locate_zone(name);
    } catch (const std::runtime_error& e) {
        throw DataFormatException(std::string("Unknown time zone: ") + e.what(),
                                  ERR_INVALID_DATETIME, {}, std::string(name));
    }
    return loc;
}

Location Location::local() {
    Location loc;
    try {
        loc.zone_ = std::chrono::current_zone();
        loc.kind_ = Kind::Zone;
    } catch (const std::runtime_error& e) {
        sfpp_util::Logging::get()->warn("Local time zone unavailable ({}), using UTC", e.what());
    }
    return loc;
}

int Location::offsetSecondsAt(int64_t unixSeconds) const {
    switch (kind_) {
        case Kind::Utc:
            return 0;
        case Kind::Fixed:
            return offsetSeconds_;
        case Kind::Zone: {
            auto info = zone_->get_info(std::chrono::sys_seconds{std::chrono::seconds{unixSeconds}});
            return static_cast<int>(info.offset.count());
        }
    }
    return 0;
}

int64_t Location::localToUnixSeconds(int64_t localSeconds) const {
    if (kind_ != Kind::Zone) {
        return localSeconds - offsetSeconds_;
    }
    auto sys = zone_->to_sys(std::chrono::local_seconds{std::chrono::seconds{localSeconds}},
                             std::chrono::choose::earliest);
    return sys.time_since_epoch().count();
}

std::string Location::name() const {
    switch (kind_) {
        case Kind::Utc:
            return "UTC";
        case Kind::Fixed: {
            int minutes = offsetSeconds_ / 60;
            char sign = minutes < 0 ? '-' : '+';
            if (minutes < 0) minutes = -minutes;
            char buf[16];
            std::snprintf(buf, sizeof buf, "%c%02d%02d", sign, minutes / 60, minutes % 60);
            return buf;
        }
        case Kind::Zone:
            return std::string(zone_->name());
    }
    return "UTC";
}

bool Location::operator==(const Location& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case Kind::Utc:   return true;
        case Kind::Fixed: return offsetSeconds_ == other.offsetSeconds_;
        case Kind::Zone:  return zone_ == other.zone_;
    }
    return false;
}

// ---------------------------------------------------------------- Timestamp

Timestamp::Timestamp(int64_t unixSeconds, int64_t nanos, Location location)
    : location_(std::move(location)) {
    int64_t carry = floor_div(nanos, NANOS_PER_SECOND);
    seconds_ = unixSeconds + carry;
    nanos_ = static_cast<int32_t>(nanos - carry * NANOS_PER_SECOND);
}

Timestamp Timestamp::fromCivil(const CivilTime& civil, const Location& location) {
    using namespace std::chrono;
    year_month_day ymd{year{civil.year}, month{civil.month}, day{civil.day}};
    if (!ymd.ok()) {
        char buf[32];
        std::snprintf(buf, sizeof buf, "%04d-%02u-%02u", civil.year, civil.month, civil.day);
        throw DataFormatException("Invalid calendar date", ERR_INVALID_DATETIME, {}, buf);
    }
    int64_t day_count = sys_days{ymd}.time_since_epoch().count();
    int64_t local = day_count * SECONDS_PER_DAY + civil.hour * 3600LL + civil.minute * 60LL + civil.second;
    return Timestamp(location.localToUnixSeconds(local), civil.nanosecond, location);
}

std::optional<int64_t> Timestamp::unixNanos() const {
    constexpr int64_t limit = std::numeric_limits<int64_t>::max() / NANOS_PER_SECOND;
    if (seconds_ > limit || seconds_ < -limit) {
        return std::nullopt;
    }
    int64_t whole = seconds_ * NANOS_PER_SECOND;
    if (whole > std::numeric_limits<int64_t>::max() - nanos_) {
        return std::nullopt;
    }
    return whole + nanos_;
}

CivilTime Timestamp::civil() const {
    return civil_from_local_seconds(seconds_ + offsetSeconds(), nanos_);
}

CivilTime Timestamp::utcCivil() const {
    return civil_from_local_seconds(seconds_, nanos_);
}

std::string Timestamp::toString() const {
    CivilTime c = civil();
    int offset_minutes = offsetSeconds() / 60;
    char sign = offset_minutes < 0 ? '-' : '+';
    if (offset_minutes < 0) offset_minutes = -offset_minutes;
    char buf[80];
    std::snprintf(buf, sizeof buf, "%04d-%02u-%02u %02d:%02d:%02d.%09lld %c%02d:%02d",
                  c.year, c.month, c.day, c.hour, c.minute, c.second,
                  static_cast<long long>(c.nanosecond), sign,
                  offset_minutes / 60, offset_minutes % 60);
    return buf;
}

bool Timestamp::operator==(const Timestamp& other) const {
    return seconds_ == other.seconds_ &&
           nanos_ == other.nanos_ &&
           offsetSeconds() == other.offsetSeconds();
}

// ---------------------------------------------------------------- TimeOfDay

TimeOfDay TimeOfDay::fromParts(int hour, int minute, int second, int64_t nanos) {
    using namespace std::chrono;
    return TimeOfDay(hours{hour} + minutes{minute} + seconds{second} + nanoseconds{nanos});
}

int TimeOfDay::hour() const {
    return static_cast<int>(nanos() / (3600 * NANOS_PER_SECOND));
}

int TimeOfDay::minute() const {
    return static_cast<int>((nanos() / (60 * NANOS_PER_SECOND)) % 60);
}

int TimeOfDay::second() const {
    return static_cast<int>((nanos() / NANOS_PER_SECOND) % 60);
}

int64_t TimeOfDay::nanosecond() const {
    return nanos() % NANOS_PER_SECOND;
}

std::string TimeOfDay::toString() const {
    char buf[32];
    std::snprintf(buf, sizeof buf, "%02d:%02d:%02d.%09lld",
                  hour(), minute(), second(), static_cast<long long>(nanosecond()));
    return buf;
}

} // namespace sfpp::core
