#include "common/errors.hpp"

namespace pmkt {

std::string error_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ALREADY_INITIALIZED: return "AlreadyInitialized";
        case ErrorCode::ADMIN_NOT_SET: return "AdminNotSet";
        case ErrorCode::ORACLE_NOT_SET: return "OracleNotSet";
        case ErrorCode::UNAUTHORIZED_ADMIN: return "UnauthorizedAdmin";
        case ErrorCode::UNAUTHORIZED_ORACLE: return "UnauthorizedOracle";
        case ErrorCode::INVALID_BET_AMOUNT: return "InvalidBetAmount";
        case ErrorCode::NO_ACTIVE_ROUND: return "NoActiveRound";
        case ErrorCode::ROUND_ENDED: return "RoundEnded";
        case ErrorCode::INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case ErrorCode::ALREADY_BET: return "AlreadyBet";
        case ErrorCode::OVERFLOW: return "Overflow";
        case ErrorCode::INVALID_PRICE: return "InvalidPrice";
        case ErrorCode::INVALID_DURATION: return "InvalidDuration";
        case ErrorCode::INVALID_MODE: return "InvalidMode";
        case ErrorCode::INVALID_PRICE_SCALE: return "InvalidPriceScale";
        case ErrorCode::WRONG_MODE_FOR_PREDICTION: return "WrongModeForPrediction";
        case ErrorCode::ROUND_NOT_ENDED: return "RoundNotEnded";
        case ErrorCode::ROUND_ALREADY_ACTIVE: return "RoundAlreadyActive";
        case ErrorCode::STALE_ORACLE_DATA: return "StaleOracleData";
        case ErrorCode::INVALID_ORACLE_ROUND: return "InvalidOracleRound";
        case ErrorCode::UNAUTHORIZED_USER: return "UnauthorizedUser";
    }
    return "Unknown";
}

MarketError::MarketError(ErrorCode code)
    : std::runtime_error(error_to_string(code)), code_(code) {}

MarketError::MarketError(ErrorCode code, const std::string& detail)
    : std::runtime_error(error_to_string(code) + ": " + detail), code_(code) {}

} // namespace pmkt
