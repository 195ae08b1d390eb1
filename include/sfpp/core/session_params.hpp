#pragma once

#include "sfpp/core/conversion_options.hpp"
#include "sfpp/core/extended_types.hpp"
#include "sfpp/core/wire_type.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sfpp {
namespace core {

/**
 * @brief Session parameters reported by the server
 *
 * Names are case-insensitive (stored lower-case).
 */
class SessionParams {
public:
    SessionParams() = default;
    explicit SessionParams(const std::map<std::string, std::string>& values);

    void set(std::string_view name, std::string value);
    std::optional<std::string> get(std::string_view name) const;

    const std::map<std::string, std::string>& values() const { return values_; }

    /**
     * @brief Format string used for a temporal type in structured JSON
     *
     * DATE_OUTPUT_FORMAT, TIME_OUTPUT_FORMAT, TIMESTAMP_{NTZ,LTZ,TZ}_OUTPUT_FORMAT
     * (falling back to TIMESTAMP_OUTPUT_FORMAT).
     * @throws DataFormatException if no parameter is set for the type
     */
    std::string dateTimeOutputFormat(WireType type) const;

    /// Session TIMEZONE, or the host zone when unset
    Location resolveLocation() const;

private:
    std::map<std::string, std::string> values_;
};

/**
 * @brief Everything a conversion needs besides the value itself
 *
 * Cheap to copy; structured values keep one.
 */
struct ConversionContext {
    std::shared_ptr<const SessionParams> params = std::make_shared<const SessionParams>();
    Location location = Location::utc();
    ConversionOptions options;

    static ConversionContext make(SessionParams params, ConversionOptions options = {});
};

} // namespace core
} // namespace sfpp
