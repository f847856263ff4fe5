#include "storage/storage_key.hpp"

namespace pmkt {

namespace {

struct KeyEncoder {
    std::string operator()(const keys::Balance& k) const { return "Balance/" + k.user; }
    std::string operator()(const keys::Admin&) const { return "Admin"; }
    std::string operator()(const keys::Oracle&) const { return "Oracle"; }
    std::string operator()(const keys::ActiveRound&) const { return "ActiveRound"; }
    std::string operator()(const keys::UpDownPositions&) const { return "UpDownPositions"; }
    std::string operator()(const keys::PrecisionPositions&) const { return "PrecisionPositions"; }
    std::string operator()(const keys::PendingWinnings& k) const { return "PendingWinnings/" + k.user; }
    std::string operator()(const keys::UserStats& k) const { return "UserStats/" + k.user; }
    std::string operator()(const keys::BetWindow&) const { return "BetWindow"; }
    std::string operator()(const keys::RunWindow&) const { return "RunWindow"; }
    std::string operator()(const keys::LastRoundId&) const { return "LastRoundId"; }
};

} // namespace

std::string encode_key(const StorageKey& key) {
    return std::visit(KeyEncoder{}, key);
}

} // namespace pmkt
