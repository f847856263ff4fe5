#pragma once

#include "common/errors.hpp"
#include "common/types.hpp"

namespace pmkt {

// Overflow-checked arithmetic. Every helper throws MarketError(OVERFLOW)
// instead of wrapping.

inline Amount checked_add(Amount a, Amount b) {
    Amount out;
    if (__builtin_add_overflow(a, b, &out)) {
        throw MarketError(ErrorCode::OVERFLOW, "addition");
    }
    return out;
}

inline Amount checked_sub(Amount a, Amount b) {
    Amount out;
    if (__builtin_sub_overflow(a, b, &out)) {
        throw MarketError(ErrorCode::OVERFLOW, "subtraction");
    }
    return out;
}

inline Amount checked_mul(Amount a, Amount b) {
    Amount out;
    if (__builtin_mul_overflow(a, b, &out)) {
        throw MarketError(ErrorCode::OVERFLOW, "multiplication");
    }
    return out;
}

inline LedgerSeq checked_add(LedgerSeq a, LedgerSeq b) {
    LedgerSeq out;
    if (__builtin_add_overflow(a, b, &out)) {
        throw MarketError(ErrorCode::OVERFLOW, "ledger sequence");
    }
    return out;
}

// |a - b| for unsigned prices
inline Price abs_diff(Price a, Price b) {
    return a > b ? a - b : b - a;
}

} // namespace pmkt
