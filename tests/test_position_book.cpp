#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "position/position_book.hpp"
#include "storage/key_value_store.hpp"

using namespace pmkt;

class PositionBookTest : public ::testing::Test {
protected:
    void SetUp() override {
        access_.initialize("admin", "oracle", CallContext::signed_by("admin"));
        ledger_.mint_initial("alice", CallContext::signed_by("alice"));
        ledger_.mint_initial("bob", CallContext::signed_by("bob"));
    }

    void open_round(RoundMode mode, LedgerSeq start = 100) {
        lifecycle_.create_round(10'000, mode_to_code(mode), CallContext::signed_by("admin", start));
    }

    CallContext as(const Address& user, LedgerSeq seq = 101) {
        return CallContext::signed_by(user, seq);
    }

    InMemoryStore store_;
    ContractState state_{store_};
    AccessController access_{state_};
    WindowPolicy windows_{state_, access_};
    RoundLifecycle lifecycle_{state_, access_, windows_};
    BalanceLedger ledger_{state_, access_};
    PositionBook book_{state_, access_, lifecycle_, ledger_};
};

// ============================================================================
// Up/Down
// ============================================================================

TEST_F(PositionBookTest, StakeUpDown_DebitsAndCreditsPool) {
    open_round(RoundMode::UP_DOWN);

    book_.stake_updown("alice", 300, BetSide::UP, as("alice"));
    Round round = book_.stake_updown("bob", 200, BetSide::DOWN, as("bob"));

    EXPECT_EQ(round.pool_up, 300);
    EXPECT_EQ(round.pool_down, 200);
    EXPECT_EQ(lifecycle_.active_round()->pool_up, 300);
    EXPECT_EQ(ledger_.balance("alice"), INITIAL_MINT - 300);
    EXPECT_EQ(ledger_.balance("bob"), INITIAL_MINT - 200);

    ASSERT_TRUE(book_.position_of("alice").has_value());
    EXPECT_EQ(book_.position_of("alice")->side, BetSide::UP);
    EXPECT_EQ(book_.position_of("alice")->amount, 300);
    EXPECT_FALSE(book_.position_of("carol").has_value());
}

TEST_F(PositionBookTest, StakeUpDown_OnePositionPerUser) {
    open_round(RoundMode::UP_DOWN);
    book_.stake_updown("alice", 100, BetSide::UP, as("alice"));

    EXPECT_MARKET_ERROR(ErrorCode::ALREADY_BET, book_.stake_updown("alice", 50, BetSide::DOWN, as("alice")));
    EXPECT_EQ(lifecycle_.active_round()->pool_down, 0);
    EXPECT_EQ(ledger_.balance("alice"), INITIAL_MINT - 100);
}

TEST_F(PositionBookTest, StakeUpDown_RejectsBadAmounts) {
    open_round(RoundMode::UP_DOWN);

    EXPECT_MARKET_ERROR(ErrorCode::INVALID_BET_AMOUNT, book_.stake_updown("alice", 0, BetSide::UP, as("alice")));
    EXPECT_MARKET_ERROR(ErrorCode::INVALID_BET_AMOUNT, book_.stake_updown("alice", -5, BetSide::UP, as("alice")));
    EXPECT_MARKET_ERROR(ErrorCode::INSUFFICIENT_BALANCE,
                        book_.stake_updown("alice", INITIAL_MINT + 1, BetSide::UP, as("alice")));
    EXPECT_MARKET_ERROR(ErrorCode::INSUFFICIENT_BALANCE,
                        book_.stake_updown("carol", 1, BetSide::UP, as("carol")));
}

TEST_F(PositionBookTest, StakeUpDown_RequiresOwnSignature) {
    open_round(RoundMode::UP_DOWN);
    EXPECT_MARKET_ERROR(ErrorCode::UNAUTHORIZED_USER, book_.stake_updown("alice", 10, BetSide::UP, as("bob")));
}

TEST_F(PositionBookTest, StakeUpDown_OnlyWhileOpen) {
    EXPECT_MARKET_ERROR(ErrorCode::NO_ACTIVE_ROUND, book_.stake_updown("alice", 10, BetSide::UP, as("alice")));

    open_round(RoundMode::UP_DOWN, 100);
    EXPECT_NO_THROW(book_.stake_updown("alice", 10, BetSide::UP, as("alice", 105)));
    EXPECT_MARKET_ERROR(ErrorCode::ROUND_ENDED, book_.stake_updown("bob", 10, BetSide::UP, as("bob", 106)));
}

TEST_F(PositionBookTest, StakeUpDown_WrongModeInPrecisionRound) {
    open_round(RoundMode::PRECISION);
    EXPECT_MARKET_ERROR(ErrorCode::WRONG_MODE_FOR_PREDICTION,
                        book_.stake_updown("alice", 10, BetSide::UP, as("alice")));
}

// ============================================================================
// Precision
// ============================================================================

TEST_F(PositionBookTest, StakePrecision_AppendsInOrder) {
    open_round(RoundMode::PRECISION);

    book_.stake_precision("bob", 50, 22'900, as("bob"));
    book_.stake_precision("alice", 70, 23'000, as("alice"));

    PredictionList predictions = book_.precision_predictions();
    ASSERT_EQ(predictions.size(), 2u);
    EXPECT_EQ(predictions[0].user, "bob");
    EXPECT_EQ(predictions[1].user, "alice");
    EXPECT_EQ(predictions[1].predicted_price, 23'000u);
    EXPECT_EQ(ledger_.balance("alice"), INITIAL_MINT - 70);

    ASSERT_TRUE(book_.prediction_of("alice").has_value());
    EXPECT_EQ(book_.prediction_of("alice")->amount, 70);
}

TEST_F(PositionBookTest, StakePrecision_ValidatesPriceScale) {
    open_round(RoundMode::PRECISION);

    EXPECT_MARKET_ERROR(ErrorCode::INVALID_PRICE_SCALE, book_.stake_precision("alice", 10, 0, as("alice")));
    EXPECT_MARKET_ERROR(ErrorCode::INVALID_PRICE_SCALE,
                        book_.stake_precision("alice", 10, 1'000'000, as("alice")));
    EXPECT_NO_THROW(book_.stake_precision("alice", 10, 999'999, as("alice")));
    EXPECT_NO_THROW(book_.stake_precision("bob", 10, 1, as("bob")));
}

TEST_F(PositionBookTest, StakePrecision_OnePredictionPerUser) {
    open_round(RoundMode::PRECISION);
    book_.stake_precision("alice", 10, 500, as("alice"));

    EXPECT_MARKET_ERROR(ErrorCode::ALREADY_BET, book_.stake_precision("alice", 10, 600, as("alice")));
    EXPECT_EQ(book_.precision_predictions().size(), 1u);
}

TEST_F(PositionBookTest, StakePrecision_WrongModeInUpDownRound) {
    open_round(RoundMode::UP_DOWN);
    EXPECT_MARKET_ERROR(ErrorCode::WRONG_MODE_FOR_PREDICTION,
                        book_.stake_precision("alice", 10, 500, as("alice")));
}

TEST_F(PositionBookTest, BooksAreDisjoint) {
    open_round(RoundMode::UP_DOWN);
    book_.stake_updown("alice", 10, BetSide::UP, as("alice"));

    EXPECT_TRUE(book_.precision_predictions().empty());
    EXPECT_FALSE(book_.prediction_of("alice").has_value());
}
