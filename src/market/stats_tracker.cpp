#include "market/stats_tracker.hpp"
#include <limits>

namespace pmkt {

namespace {

uint32_t saturating_inc(uint32_t v) {
    return v == std::numeric_limits<uint32_t>::max() ? v : v + 1;
}

} // namespace

void StatsTracker::record_win(const Address& user) {
    UserStats stats = state_.user_stats(user);
    stats.total_wins = saturating_inc(stats.total_wins);
    stats.current_streak = saturating_inc(stats.current_streak);
    if (stats.current_streak > stats.best_streak) {
        stats.best_streak = stats.current_streak;
    }
    state_.set_user_stats(user, stats);
}

void StatsTracker::record_loss(const Address& user) {
    UserStats stats = state_.user_stats(user);
    stats.total_losses = saturating_inc(stats.total_losses);
    stats.current_streak = 0;
    state_.set_user_stats(user, stats);
}

} // namespace pmkt
