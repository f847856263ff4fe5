#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace pmkt {

// Closed set of failure kinds. Numeric values are stable and part of the
// external interface.
enum class ErrorCode : uint32_t {
    ALREADY_INITIALIZED = 1,
    ADMIN_NOT_SET = 2,
    ORACLE_NOT_SET = 3,
    UNAUTHORIZED_ADMIN = 4,
    UNAUTHORIZED_ORACLE = 5,
    INVALID_BET_AMOUNT = 6,
    NO_ACTIVE_ROUND = 7,
    ROUND_ENDED = 8,
    INSUFFICIENT_BALANCE = 9,
    ALREADY_BET = 10,
    OVERFLOW = 11,
    INVALID_PRICE = 12,
    INVALID_DURATION = 13,
    INVALID_MODE = 14,
    INVALID_PRICE_SCALE = 15,
    WRONG_MODE_FOR_PREDICTION = 16,
    ROUND_NOT_ENDED = 17,
    ROUND_ALREADY_ACTIVE = 18,
    STALE_ORACLE_DATA = 19,
    INVALID_ORACLE_ROUND = 20,
    UNAUTHORIZED_USER = 21
};

std::string error_to_string(ErrorCode code);

/**
 * Error raised by any market operation. The operation that throws it has
 * not mutated state once the surrounding transaction is rolled back.
 */
class MarketError : public std::runtime_error {
public:
    explicit MarketError(ErrorCode code);
    MarketError(ErrorCode code, const std::string& detail);

    ErrorCode code() const { return code_; }
    uint32_t numeric_code() const { return static_cast<uint32_t>(code_); }

private:
    ErrorCode code_;
};

} // namespace pmkt
