#include "sfpp/core/session_params.hpp"
#include "sfpp/core/exception.hpp"
#include <algorithm>
#include <cctype>

namespace sfpp {
namespace core {

namespace {
    std::string toLower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }
}

SessionParams::SessionParams(const std::map<std::string, std::string>& values) {
    for (const auto& [name, value] : values) {
        set(name, value);
    }
}

void SessionParams::set(std::string_view name, std::string value) {
    values_[toLower(name)] = std::move(value);
}

std::optional<std::string> SessionParams::get(std::string_view name) const {
    auto it = values_.find(toLower(name));
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string SessionParams::dateTimeOutputFormat(WireType type) const {
    std::optional<std::string> format;
    switch (type) {
        case WireType::Date:
            format = get("date_output_format");
            break;
        case WireType::Time:
            format = get("time_output_format");
            break;
        case WireType::TimestampLtz:
            format = get("timestamp_ltz_output_format");
            break;
        case WireType::TimestampTz:
            format = get("timestamp_tz_output_format");
            break;
        case WireType::TimestampNtz:
            format = get("timestamp_ntz_output_format");
            break;
        default:
            throw UnsupportedTypeException("No output format for type " + std::string(toString(type)));
    }

    if (isTimestampType(type) && (!format || format->empty())) {
        format = get("timestamp_output_format");
    }
    if (!format || format->empty()) {
        throw DataFormatException("No output format parameter set for type " + std::string(toString(type)),
                                  ERR_INVALID_DATETIME);
    }
    return *format;
}

Location SessionParams::resolveLocation() const {
    auto tz = get("timezone");
    if (tz && !tz->empty()) {
        return Location::named(*tz);
    }
    return Location::local();
}

ConversionContext ConversionContext::make(SessionParams params, ConversionOptions options) {
    ConversionContext ctx;
    ctx.location = params.resolveLocation();
    ctx.params = std::make_shared<const SessionParams>(std::move(params));
    ctx.options = options;
    return ctx;
}

} // namespace core
} // namespace sfpp
