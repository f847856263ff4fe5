#include "market/window_policy.hpp"
#include "common/errors.hpp"
#include "utils/checked_math.hpp"
#include <spdlog/spdlog.h>

namespace pmkt {

void WindowPolicy::validate(LedgerSeq bet_ledgers, LedgerSeq run_ledgers) {
    if (bet_ledgers == 0 || run_ledgers == 0) {
        throw MarketError(ErrorCode::INVALID_DURATION, "window length must be positive");
    }
    if (bet_ledgers >= run_ledgers) {
        throw MarketError(ErrorCode::INVALID_DURATION,
                          "bet window must be shorter than run window");
    }
}

void WindowPolicy::set_windows(LedgerSeq bet_ledgers, LedgerSeq run_ledgers,
                               const CallContext& ctx) {
    access_.require_admin(ctx);
    validate(bet_ledgers, run_ledgers);

    state_.set_windows(WindowConfig{bet_ledgers, run_ledgers});
    spdlog::info("Windows updated: bet={} run={} ledgers", bet_ledgers, run_ledgers);
}

RoundMarkers WindowPolicy::markers_for(LedgerSeq start) const {
    WindowConfig cfg = state_.windows();

    RoundMarkers markers;
    markers.start_ledger = start;
    markers.bet_end_ledger = checked_add(start, cfg.bet_ledgers);
    markers.end_ledger = checked_add(start, cfg.run_ledgers);
    return markers;
}

} // namespace pmkt
