#include "storage/contract_state.hpp"
#include "utils/wide_int.hpp"

namespace pmkt {

namespace {

Amount read_amount(const KeyValueStore& store, const StorageKey& key) {
    auto value = store.get(key);
    if (!value) return 0;
    return parse_amount(value->get<std::string>());
}

} // namespace

std::optional<Address> ContractState::admin() const {
    auto value = store_.get(keys::Admin{});
    if (!value) return std::nullopt;
    return value->get<Address>();
}

std::optional<Address> ContractState::oracle() const {
    auto value = store_.get(keys::Oracle{});
    if (!value) return std::nullopt;
    return value->get<Address>();
}

void ContractState::set_roles(const Address& admin, const Address& oracle) {
    store_.set(keys::Admin{}, admin);
    store_.set(keys::Oracle{}, oracle);
}

bool ContractState::has_balance(const Address& user) const {
    return store_.contains(keys::Balance{user});
}

Amount ContractState::balance(const Address& user) const {
    return read_amount(store_, keys::Balance{user});
}

void ContractState::set_balance(const Address& user, Amount amount) {
    store_.set(keys::Balance{user}, amount_to_string(amount));
}

Amount ContractState::pending_winnings(const Address& user) const {
    return read_amount(store_, keys::PendingWinnings{user});
}

void ContractState::set_pending_winnings(const Address& user, Amount amount) {
    if (amount == 0) {
        store_.remove(keys::PendingWinnings{user});
        return;
    }
    store_.set(keys::PendingWinnings{user}, amount_to_string(amount));
}

UserStats ContractState::user_stats(const Address& user) const {
    auto value = store_.get(keys::UserStats{user});
    if (!value) return UserStats{};
    return value->get<UserStats>();
}

void ContractState::set_user_stats(const Address& user, const UserStats& stats) {
    store_.set(keys::UserStats{user}, stats);
}

std::optional<Round> ContractState::active_round() const {
    auto value = store_.get(keys::ActiveRound{});
    if (!value) return std::nullopt;
    return value->get<Round>();
}

void ContractState::set_active_round(const Round& round) {
    store_.set(keys::ActiveRound{}, round);
}

void ContractState::clear_active_round() {
    store_.remove(keys::ActiveRound{});
}

PositionMap ContractState::updown_positions() const {
    auto value = store_.get(keys::UpDownPositions{});
    if (!value) return {};
    return value->get<PositionMap>();
}

void ContractState::set_updown_positions(const PositionMap& positions) {
    store_.set(keys::UpDownPositions{}, positions);
}

PredictionList ContractState::precision_predictions() const {
    auto value = store_.get(keys::PrecisionPositions{});
    if (!value) return {};
    return value->get<PredictionList>();
}

void ContractState::set_precision_predictions(const PredictionList& predictions) {
    store_.set(keys::PrecisionPositions{}, predictions);
}

void ContractState::clear_positions() {
    store_.remove(keys::UpDownPositions{});
    store_.remove(keys::PrecisionPositions{});
}

WindowConfig ContractState::windows() const {
    WindowConfig cfg;
    if (auto bet = store_.get(keys::BetWindow{})) {
        cfg.bet_ledgers = bet->get<LedgerSeq>();
    }
    if (auto run = store_.get(keys::RunWindow{})) {
        cfg.run_ledgers = run->get<LedgerSeq>();
    }
    return cfg;
}

void ContractState::set_windows(const WindowConfig& windows) {
    store_.set(keys::BetWindow{}, windows.bet_ledgers);
    store_.set(keys::RunWindow{}, windows.run_ledgers);
}

uint32_t ContractState::last_round_id() const {
    auto value = store_.get(keys::LastRoundId{});
    if (!value) return 0;
    return value->get<uint32_t>();
}

void ContractState::set_last_round_id(uint32_t id) {
    store_.set(keys::LastRoundId{}, id);
}

} // namespace pmkt
