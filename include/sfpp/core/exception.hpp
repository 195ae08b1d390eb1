#pragma once

#include <exception>
#include <string>
#include <vector>

namespace sfpp {
namespace core {

// Driver error numbers
constexpr int ERR_INVALID_TIMESTAMP_TZ         = 268000;
constexpr int ERR_INVALID_BINARY_HEX           = 268002;
constexpr int ERR_TOO_HIGH_TIMESTAMP_PRECISION = 268003;
constexpr int ERR_INVALID_NUMBER               = 268004;
constexpr int ERR_INVALID_DATETIME             = 268005;
constexpr int ERR_UNSUPPORTED_TYPE             = 268006;
constexpr int ERR_INVALID_JSON                 = 268007;

class ConversionException : public std::exception {
public:
    explicit ConversionException(std::string message);
    ConversionException(std::string message,
                        int error_code,
                        std::string column = {},
                        std::string raw_value = {});

    const char* what() const noexcept override { return message_.c_str(); }

    int getErrorCode() const noexcept { return error_code_; }
    const std::string& getSQLState() const noexcept { return sql_state_; }
    const std::string& getColumn() const noexcept { return column_; }
    const std::string& getRawValue() const noexcept { return raw_value_; }
    const std::vector<std::string>& getErrorMessages() const noexcept { return error_messages_; }

private:
    std::string message_;
    int         error_code_ {0};
    std::string sql_state_;
    std::string column_;
    std::string raw_value_;
    std::vector<std::string> error_messages_;
};

// Malformed numeric, hex, timestamp or datetime format text
class DataFormatException : public ConversionException {
public:
    DataFormatException(std::string message,
                        int error_code,
                        std::string column = {},
                        std::string raw_value = {})
        : ConversionException(std::move(message), error_code,
                              std::move(column), std::move(raw_value)) {}
};

// No mapping defined between a wire type and a native kind
class UnsupportedTypeException : public ConversionException {
public:
    explicit UnsupportedTypeException(std::string message,
                                      std::string column = {},
                                      std::string raw_value = {})
        : ConversionException(std::move(message), ERR_UNSUPPORTED_TYPE,
                              std::move(column), std::move(raw_value)) {}
};

class TimestampPrecisionException : public ConversionException {
public:
    explicit TimestampPrecisionException(std::string message,
                                         std::string column = {},
                                         std::string raw_value = {})
        : ConversionException(std::move(message), ERR_TOO_HIGH_TIMESTAMP_PRECISION,
                              std::move(column), std::move(raw_value)) {}
};

/// SQLSTATE for a driver error number ("HY000" when unmapped)
std::string sqlStateForError(int error_code);

} // namespace core
} // namespace sfpp
