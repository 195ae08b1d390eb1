#include "sfpp/core/exception.hpp"
#include <unordered_map>

namespace sfpp {
namespace core {

namespace {
    const std::unordered_map<int, std::string> ERROR_TO_SQLSTATE = {
        // Data exception: invalid datetime format
        {ERR_INVALID_TIMESTAMP_TZ,         "22007"},
        {ERR_INVALID_DATETIME,             "22007"},
        {ERR_TOO_HIGH_TIMESTAMP_PRECISION, "22007"},

        // Data exception: numeric value out of range
        {ERR_INVALID_BINARY_HEX,           "22003"},

        // Data exception: invalid character value for cast
        {ERR_INVALID_NUMBER,               "22018"},

        // Data exception: invalid JSON text
        {ERR_INVALID_JSON,                 "22032"},

        // Feature not supported
        {ERR_UNSUPPORTED_TYPE,             "0A000"}
    };

    std::string composeMessage(const std::string& message,
                               const std::string& column,
                               const std::string& raw_value) {
        std::string out = message;
        if (!column.empty()) {
            out += " (column: " + column;
            if (!raw_value.empty()) {
                out += ", value: " + raw_value;
            }
            out += ")";
        } else if (!raw_value.empty()) {
            out += " (value: " + raw_value + ")";
        }
        return out;
    }
}

std::string sqlStateForError(int error_code) {
    auto it = ERROR_TO_SQLSTATE.find(error_code);
    if (it != ERROR_TO_SQLSTATE.end()) {
        return it->second;
    }
    return "HY000";  // General error
}

ConversionException::ConversionException(std::string message)
    : message_(std::move(message))
    , sql_state_("HY000") {
    error_messages_.push_back(message_);
}

ConversionException::ConversionException(std::string message,
                                         int error_code,
                                         std::string column,
                                         std::string raw_value)
    : message_(composeMessage(message, column, raw_value))
    , error_code_(error_code)
    , sql_state_(sqlStateForError(error_code))
    , column_(std::move(column))
    , raw_value_(std::move(raw_value)) {
    error_messages_.push_back(std::move(message));
}

} // namespace core
} // namespace sfpp
