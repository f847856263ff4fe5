#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "oracle/oracle_validator.hpp"
#include <limits>

using namespace pmkt;

class OracleValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        round_.round_number = 1;
        round_.price_start = 50'000;
        round_.start_ledger = 100;
        round_.bet_end_ledger = 106;
        round_.end_ledger = 112;
    }

    OraclePayload payload(Price price, LedgerTime ts, LedgerSeq round_id = 100) {
        return OraclePayload{price, ts, round_id};
    }

    Round round_;
    OracleValidator validator_;
};

TEST_F(OracleValidatorTest, Validate_AcceptsFreshMatchingPayload) {
    EXPECT_NO_THROW(validator_.validate(payload(51'000, 900), round_, 1000));
    EXPECT_NO_THROW(validator_.validate(payload(51'000, 700), round_, 1000));  // exactly 300s old
}

TEST_F(OracleValidatorTest, Validate_RejectsZeroPrice) {
    EXPECT_MARKET_ERROR(ErrorCode::INVALID_PRICE, validator_.validate(payload(0, 1000), round_, 1000));
}

TEST_F(OracleValidatorTest, Validate_RejectsWrongRound) {
    EXPECT_MARKET_ERROR(ErrorCode::INVALID_ORACLE_ROUND,
                        validator_.validate(payload(51'000, 1000, 999), round_, 1000));
}

TEST_F(OracleValidatorTest, Validate_RejectsStaleObservation) {
    EXPECT_MARKET_ERROR(ErrorCode::STALE_ORACLE_DATA, validator_.validate(payload(51'000, 600), round_, 1000));
    EXPECT_MARKET_ERROR(ErrorCode::STALE_ORACLE_DATA, validator_.validate(payload(51'000, 699), round_, 1000));
}

TEST_F(OracleValidatorTest, IsStale_DoesNotWrap) {
    LedgerTime max = std::numeric_limits<LedgerTime>::max();
    EXPECT_FALSE(validator_.is_stale(max, 0));
    EXPECT_FALSE(validator_.is_stale(max - 10, max));
    EXPECT_TRUE(validator_.is_stale(0, max));
}

TEST_F(OracleValidatorTest, IsStale_AcceptsFutureTimestamps) {
    EXPECT_FALSE(validator_.is_stale(2000, 1000));
}

TEST_F(OracleValidatorTest, CustomMaxAge) {
    OracleValidator strict(10);
    EXPECT_EQ(strict.max_age_seconds(), 10u);
    EXPECT_TRUE(strict.is_stale(100, 111));
    EXPECT_FALSE(strict.is_stale(100, 110));
}

TEST_F(OracleValidatorTest, PayloadJson_AcceptsStringOrNumberPrice) {
    auto from_string = nlohmann::json::parse(R"({"price": "340282366920938463463374607431768211455",
                                                 "timestamp": 5, "round_id": 100})").get<OraclePayload>();
    EXPECT_EQ(from_string.price, std::numeric_limits<Price>::max());

    auto from_number = nlohmann::json::parse(R"({"price": 51000, "timestamp": 5, "round_id": 100})")
                           .get<OraclePayload>();
    EXPECT_EQ(from_number.price, Price{51'000});
    EXPECT_EQ(from_number.round_id, 100u);
}
