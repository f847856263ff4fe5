#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "position/position_book.hpp"
#include "settlement/settlement_engine.hpp"
#include "storage/key_value_store.hpp"

using namespace pmkt;

class SettlementEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        access_.initialize("admin", "oracle", CallContext::signed_by("admin"));
        for (const auto& user : {"alice", "bob", "carol", "dave"}) {
            ledger_.mint_initial(user, CallContext::signed_by(user));
        }
    }

    Round open_round(RoundMode mode, Price start_price) {
        return lifecycle_.create_round(start_price, mode_to_code(mode),
                                       CallContext::signed_by("admin", START));
    }

    void bet(const Address& user, Amount amount, BetSide side) {
        book_.stake_updown(user, amount, side, CallContext::signed_by(user, START + 1));
    }

    void predict(const Address& user, Amount amount, uint32_t price) {
        book_.stake_precision(user, amount, price, CallContext::signed_by(user, START + 1));
    }

    SettlementSummary resolve(Price price) {
        return engine_.resolve(OraclePayload{price, 1000, START},
                               CallContext::signed_by("oracle", START + 12, 1000));
    }

    static constexpr LedgerSeq START = 100;

    InMemoryStore store_;
    ContractState state_{store_};
    AccessController access_{state_};
    WindowPolicy windows_{state_, access_};
    RoundLifecycle lifecycle_{state_, access_, windows_};
    BalanceLedger ledger_{state_, access_};
    PendingWinningsVault vault_{state_, access_, ledger_};
    StatsTracker stats_{state_};
    PositionBook book_{state_, access_, lifecycle_, ledger_};
    OracleValidator validator_;
    SettlementEngine engine_{state_, access_, lifecycle_, validator_, vault_, stats_};
};

// ============================================================================
// Up/Down
// ============================================================================

TEST_F(SettlementEngineTest, UpDown_UpWinsProportionally) {
    open_round(RoundMode::UP_DOWN, 1'000'000);
    bet("alice", 1000, BetSide::UP);
    bet("bob", 500, BetSide::DOWN);

    SettlementSummary s = resolve(1'100'000);

    EXPECT_EQ(s.outcome, SettlementOutcome::UP_WON);
    EXPECT_EQ(vault_.pending("alice"), 1500);
    EXPECT_EQ(vault_.pending("bob"), 0);
    EXPECT_EQ(stats_.get("alice").total_wins, 1u);
    EXPECT_EQ(stats_.get("alice").current_streak, 1u);
    EXPECT_EQ(stats_.get("bob").total_losses, 1u);
    EXPECT_EQ(s.total_staked, 1500);
    EXPECT_EQ(s.total_paid, 1500);
    EXPECT_EQ(s.undistributed, 0);
    EXPECT_EQ(s.winner_count(), 1u);
    ASSERT_EQ(s.losers.size(), 1u);
    EXPECT_EQ(s.losers[0], "bob");
}

TEST_F(SettlementEngineTest, UpDown_DownWinsSplitsLosingPool) {
    open_round(RoundMode::UP_DOWN, 1'000'000);
    bet("alice", 100, BetSide::DOWN);
    bet("bob", 200, BetSide::DOWN);
    bet("carol", 300, BetSide::UP);

    SettlementSummary s = resolve(900'000);

    EXPECT_EQ(s.outcome, SettlementOutcome::DOWN_WON);
    EXPECT_EQ(vault_.pending("alice"), 100 + 100);   // 100 * 300 / 300
    EXPECT_EQ(vault_.pending("bob"), 200 + 200);
    EXPECT_EQ(vault_.pending("carol"), 0);
    EXPECT_EQ(stats_.get("carol").total_losses, 1u);
}

TEST_F(SettlementEngineTest, UpDown_TruncationDustIsReported) {
    open_round(RoundMode::UP_DOWN, 1'000'000);
    bet("alice", 1, BetSide::UP);
    bet("bob", 1, BetSide::UP);
    bet("carol", 1, BetSide::UP);
    bet("dave", 1, BetSide::DOWN);

    SettlementSummary s = resolve(1'000'001);

    // Each winner: 1 + floor(1 * 1 / 3) = 1
    EXPECT_EQ(vault_.pending("alice"), 1);
    EXPECT_EQ(s.total_paid, 3);
    EXPECT_EQ(s.undistributed, 1);
    EXPECT_LE(s.total_paid, s.total_staked);
}

TEST_F(SettlementEngineTest, UpDown_EqualPriceRefundsWithoutStats) {
    open_round(RoundMode::UP_DOWN, 1'000'000);
    bet("alice", 1000, BetSide::UP);
    bet("bob", 500, BetSide::DOWN);

    SettlementSummary s = resolve(1'000'000);

    EXPECT_EQ(s.outcome, SettlementOutcome::REFUND_TIE);
    EXPECT_EQ(vault_.pending("alice"), 1000);
    EXPECT_EQ(vault_.pending("bob"), 500);
    EXPECT_EQ(stats_.get("alice"), UserStats{});
    EXPECT_EQ(stats_.get("bob"), UserStats{});
    EXPECT_EQ(s.winner_count(), 0u);
}

TEST_F(SettlementEngineTest, UpDown_OneSidedRoundRefunds) {
    open_round(RoundMode::UP_DOWN, 1'000'000);
    bet("alice", 1000, BetSide::UP);
    bet("bob", 400, BetSide::UP);

    SettlementSummary s = resolve(1'200'000);

    EXPECT_EQ(s.outcome, SettlementOutcome::REFUND_ONE_SIDED);
    EXPECT_EQ(vault_.pending("alice"), 1000);
    EXPECT_EQ(vault_.pending("bob"), 400);
    EXPECT_EQ(stats_.get("alice"), UserStats{});
}

TEST_F(SettlementEngineTest, UpDown_LosingSideOnlyRefunds) {
    open_round(RoundMode::UP_DOWN, 1'000'000);
    bet("alice", 1000, BetSide::DOWN);

    SettlementSummary s = resolve(1'200'000);

    EXPECT_EQ(s.outcome, SettlementOutcome::REFUND_ONE_SIDED);
    EXPECT_EQ(vault_.pending("alice"), 1000);
}

TEST_F(SettlementEngineTest, NoStakes_ClosesRound) {
    open_round(RoundMode::UP_DOWN, 1'000'000);

    SettlementSummary s = resolve(1'200'000);

    EXPECT_EQ(s.outcome, SettlementOutcome::NO_STAKES);
    EXPECT_TRUE(s.payouts.empty());
    EXPECT_FALSE(lifecycle_.active_round().has_value());
}

TEST_F(SettlementEngineTest, Resolve_ClearsRoundAndPositions) {
    open_round(RoundMode::UP_DOWN, 1'000'000);
    bet("alice", 1000, BetSide::UP);
    bet("bob", 500, BetSide::DOWN);

    resolve(1'100'000);

    EXPECT_FALSE(lifecycle_.active_round().has_value());
    EXPECT_TRUE(state_.updown_positions().empty());
    EXPECT_FALSE(store_.contains(keys::UpDownPositions{}));
}

// ============================================================================
// Precision
// ============================================================================

TEST_F(SettlementEngineTest, Precision_ClosestGuessTakesPot) {
    open_round(RoundMode::PRECISION, 230'000);
    predict("alice", 1000, 229'000);
    predict("bob", 500, 235'000);

    SettlementSummary s = resolve(230'000);

    EXPECT_EQ(s.outcome, SettlementOutcome::PRECISION_WINNERS);
    EXPECT_EQ(vault_.pending("alice"), 1500);
    EXPECT_EQ(vault_.pending("bob"), 0);
    EXPECT_EQ(stats_.get("alice").total_wins, 1u);
    EXPECT_EQ(stats_.get("bob").total_losses, 1u);
}

TEST_F(SettlementEngineTest, Precision_TieSplitsPotEvenly) {
    open_round(RoundMode::PRECISION, 230'000);
    predict("alice", 1000, 229'000);     // distance 1000
    predict("bob", 200, 231'000);        // distance 1000
    predict("carol", 300, 250'000);

    SettlementSummary s = resolve(230'000);

    EXPECT_EQ(vault_.pending("alice"), 750);
    EXPECT_EQ(vault_.pending("bob"), 750);
    EXPECT_EQ(vault_.pending("carol"), 0);
    EXPECT_EQ(s.winner_count(), 2u);
    EXPECT_EQ(s.undistributed, 0);
}

TEST_F(SettlementEngineTest, Precision_DustBoundedByWinnerCount) {
    open_round(RoundMode::PRECISION, 230'000);
    predict("alice", 100, 1000);
    predict("bob", 100, 1000);
    predict("carol", 101, 1000);

    SettlementSummary s = resolve(1000);

    EXPECT_EQ(vault_.pending("alice"), 100);    // 301 / 3
    EXPECT_EQ(s.undistributed, 1);
    EXPECT_LE(s.undistributed, static_cast<Amount>(s.winner_count() - 1));
}

TEST_F(SettlementEngineTest, Precision_UsesScaledPriceDirectly) {
    open_round(RoundMode::PRECISION, 230'000);
    predict("alice", 10, 999'999);
    predict("bob", 10, 1);

    // Far above every guess: the highest guess is closest
    resolve(5'000'000);

    EXPECT_EQ(vault_.pending("alice"), 20);
    EXPECT_EQ(vault_.pending("bob"), 0);
}

// ============================================================================
// Gating
// ============================================================================

TEST_F(SettlementEngineTest, Resolve_RequiresOracleAndEndedRound) {
    open_round(RoundMode::UP_DOWN, 1'000'000);

    EXPECT_MARKET_ERROR(ErrorCode::UNAUTHORIZED_ORACLE,
                        engine_.resolve(OraclePayload{1, 1000, START},
                                        CallContext::signed_by("admin", START + 12, 1000)));
    EXPECT_MARKET_ERROR(ErrorCode::ROUND_NOT_ENDED,
                        engine_.resolve(OraclePayload{1, 1000, START},
                                        CallContext::signed_by("oracle", START + 11, 1000)));
    EXPECT_TRUE(lifecycle_.active_round().has_value());
}

TEST_F(SettlementEngineTest, SummaryJson_CarriesPrice) {
    open_round(RoundMode::UP_DOWN, 1'000'000);
    bet("alice", 10, BetSide::UP);

    nlohmann::json j = resolve(1'234'567);

    EXPECT_EQ(j["price"], "1234567");
    EXPECT_EQ(j["outcome"], "REFUND_ONE_SIDED");
    EXPECT_EQ(j["payouts"].size(), 1u);
    EXPECT_EQ(j["payouts"][0]["amount"], "10");
}
