#pragma once

#include <string>
#include <variant>
#include "common/types.hpp"

namespace pmkt {

// ============================================================================
// STORAGE KEY NAMESPACE
//
// Every persisted value lives under exactly one of these keys. Per-user
// keys carry the user address; singleton keys carry nothing.
// ============================================================================

namespace keys {

struct Balance { Address user; };
struct Admin {};
struct Oracle {};
struct ActiveRound {};
struct UpDownPositions {};
struct PrecisionPositions {};
struct PendingWinnings { Address user; };
struct UserStats { Address user; };
struct BetWindow {};
struct RunWindow {};
struct LastRoundId {};

} // namespace keys

using StorageKey = std::variant<
    keys::Balance,
    keys::Admin,
    keys::Oracle,
    keys::ActiveRound,
    keys::UpDownPositions,
    keys::PrecisionPositions,
    keys::PendingWinnings,
    keys::UserStats,
    keys::BetWindow,
    keys::RunWindow,
    keys::LastRoundId
>;

// Stable textual form, e.g. "Balance/GABC..." or "ActiveRound"
std::string encode_key(const StorageKey& key);

} // namespace pmkt
