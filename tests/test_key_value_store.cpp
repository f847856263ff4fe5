#include <gtest/gtest.h>
#include "persistence/sqlite_store.hpp"
#include "storage/contract_state.hpp"
#include "storage/key_value_store.hpp"
#include <filesystem>
#include <unistd.h>

using namespace pmkt;

// ============================================================================
// Key encoding
// ============================================================================

TEST(StorageKeyTest, EncodesEachNamespaceDistinctly) {
    EXPECT_EQ(encode_key(keys::Balance{"alice"}), "Balance/alice");
    EXPECT_EQ(encode_key(keys::PendingWinnings{"alice"}), "PendingWinnings/alice");
    EXPECT_EQ(encode_key(keys::UserStats{"alice"}), "UserStats/alice");
    EXPECT_EQ(encode_key(keys::Admin{}), "Admin");
    EXPECT_EQ(encode_key(keys::ActiveRound{}), "ActiveRound");
    EXPECT_EQ(encode_key(keys::UpDownPositions{}), "UpDownPositions");
    EXPECT_EQ(encode_key(keys::PrecisionPositions{}), "PrecisionPositions");
    EXPECT_EQ(encode_key(keys::LastRoundId{}), "LastRoundId");
    EXPECT_NE(encode_key(keys::Balance{"bob"}), encode_key(keys::Balance{"alice"}));
}

// ============================================================================
// In-memory store
// ============================================================================

TEST(InMemoryStoreTest, SetGetRemove) {
    InMemoryStore store;
    EXPECT_FALSE(store.contains(keys::Admin{}));

    store.set(keys::Admin{}, "admin");
    ASSERT_TRUE(store.get(keys::Admin{}).has_value());
    EXPECT_EQ(store.get(keys::Admin{})->get<std::string>(), "admin");
    EXPECT_EQ(store.size(), 1u);

    store.remove(keys::Admin{});
    EXPECT_FALSE(store.contains(keys::Admin{}));
    EXPECT_EQ(store.size(), 0u);
}

TEST(InMemoryStoreTest, RollbackRestoresSnapshot) {
    InMemoryStore store;
    store.set(keys::Balance{"alice"}, "100");

    store.begin_transaction();
    store.set(keys::Balance{"alice"}, "50");
    store.set(keys::Balance{"bob"}, "10");
    store.remove(keys::Admin{});
    EXPECT_TRUE(store.in_transaction());
    store.rollback_transaction();

    EXPECT_FALSE(store.in_transaction());
    EXPECT_EQ(store.get(keys::Balance{"alice"})->get<std::string>(), "100");
    EXPECT_FALSE(store.contains(keys::Balance{"bob"}));
}

TEST(InMemoryStoreTest, CommitKeepsWrites) {
    InMemoryStore store;
    store.begin_transaction();
    store.set(keys::LastRoundId{}, 3);
    store.commit_transaction();

    EXPECT_EQ(store.get(keys::LastRoundId{})->get<uint32_t>(), 3u);
    EXPECT_EQ(store.entries().count("LastRoundId"), 1u);
}

TEST(InMemoryStoreTest, TransactionMisuseThrows) {
    InMemoryStore store;
    EXPECT_THROW(store.commit_transaction(), std::logic_error);
    EXPECT_THROW(store.rollback_transaction(), std::logic_error);

    store.begin_transaction();
    EXPECT_THROW(store.begin_transaction(), std::logic_error);
}

// ============================================================================
// SQLite store
// ============================================================================

class SqliteStoreTest : public ::testing::Test {
protected:
    std::string test_db_path_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_db_path_ = "/tmp/test_pmkt_store_" + std::string(info->name()) + "_" +
                        std::to_string(::getpid()) + ".db";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_db_path_)) {
            std::filesystem::remove(test_db_path_);
        }
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }
};

TEST_F(SqliteStoreTest, OpensAndInitializesSchema) {
    SqliteStore store(test_db_path_);
    EXPECT_TRUE(store.is_open());
    EXPECT_EQ(store.get_schema_version(), 1);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(SqliteStoreTest, UpsertOverwritesValue) {
    SqliteStore store(test_db_path_);
    store.set(keys::Balance{"alice"}, "100");
    store.set(keys::Balance{"alice"}, "250");

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get(keys::Balance{"alice"})->get<std::string>(), "250");

    store.remove(keys::Balance{"alice"});
    EXPECT_FALSE(store.get(keys::Balance{"alice"}).has_value());
}

TEST_F(SqliteStoreTest, RollbackDiscardsWrites) {
    SqliteStore store(test_db_path_);
    store.set(keys::Admin{}, "admin");

    store.begin_transaction();
    store.set(keys::Admin{}, "mallory");
    store.set(keys::Oracle{}, "oracle");
    store.rollback_transaction();

    EXPECT_EQ(store.get(keys::Admin{})->get<std::string>(), "admin");
    EXPECT_FALSE(store.contains(keys::Oracle{}));
}

TEST_F(SqliteStoreTest, StatePersistsAcrossReopen) {
    Round round;
    round.round_number = 4;
    round.mode = RoundMode::PRECISION;
    round.price_start = 123456;
    round.start_ledger = 100;
    round.bet_end_ledger = 106;
    round.end_ledger = 112;

    {
        SqliteStore store(test_db_path_);
        ContractState state(store);
        store.begin_transaction();
        state.set_roles("admin", "oracle");
        state.set_active_round(round);
        state.set_balance("alice", INITIAL_MINT);
        store.commit_transaction();
    }

    SqliteStore reopened(test_db_path_);
    ContractState state(reopened);
    EXPECT_EQ(state.admin(), std::optional<Address>("admin"));
    EXPECT_EQ(state.oracle(), std::optional<Address>("oracle"));
    ASSERT_TRUE(state.active_round().has_value());
    EXPECT_EQ(*state.active_round(), round);
    EXPECT_EQ(state.balance("alice"), INITIAL_MINT);
}

TEST_F(SqliteStoreTest, DestructorRollsBackOpenTransaction) {
    {
        SqliteStore store(test_db_path_);
        store.begin_transaction();
        store.set(keys::Admin{}, "admin");
    }

    SqliteStore reopened(test_db_path_);
    EXPECT_FALSE(reopened.contains(keys::Admin{}));
}

// ============================================================================
// Typed state accessors
// ============================================================================

TEST(ContractStateTest, DefaultsWhenUnset) {
    InMemoryStore store;
    ContractState state(store);

    EXPECT_FALSE(state.admin().has_value());
    EXPECT_FALSE(state.has_balance("alice"));
    EXPECT_EQ(state.balance("alice"), 0);
    EXPECT_EQ(state.pending_winnings("alice"), 0);
    EXPECT_EQ(state.user_stats("alice"), UserStats{});
    EXPECT_FALSE(state.active_round().has_value());
    EXPECT_TRUE(state.updown_positions().empty());
    EXPECT_TRUE(state.precision_predictions().empty());
    EXPECT_EQ(state.windows().bet_ledgers, DEFAULT_BET_LEDGERS);
    EXPECT_EQ(state.windows().run_ledgers, DEFAULT_RUN_LEDGERS);
    EXPECT_EQ(state.last_round_id(), 0u);
}

TEST(ContractStateTest, ZeroPendingRemovesEntry) {
    InMemoryStore store;
    ContractState state(store);

    state.set_pending_winnings("alice", 500);
    EXPECT_TRUE(store.contains(keys::PendingWinnings{"alice"}));
    state.set_pending_winnings("alice", 0);
    EXPECT_FALSE(store.contains(keys::PendingWinnings{"alice"}));
}

TEST(ContractStateTest, WideAmountsSurviveSerialization) {
    InMemoryStore store;
    ContractState state(store);

    Amount big = static_cast<Amount>(1) << 100;
    state.set_balance("whale", big);
    EXPECT_EQ(state.balance("whale"), big);

    PositionMap positions{{"alice", UserPosition{big, BetSide::DOWN}}};
    state.set_updown_positions(positions);
    EXPECT_EQ(state.updown_positions(), positions);

    state.clear_positions();
    EXPECT_TRUE(state.updown_positions().empty());
}
