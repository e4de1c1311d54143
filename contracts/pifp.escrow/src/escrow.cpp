#include "pifpescrow.hpp"
#include <limits>

using namespace eosio;
using namespace pifp;

static constexpr eosio::name active_perm{"active"_n};

// memo id must be plain decimal, no sign, no spaces.
// stoull would accept "+1", " 1" and "1abc" and throws on overflow, so ids are parsed strictly here.
static bool parse_project_id(const string& s, uint64_t& out) {
    if (s.empty() || s.size() > 20) return false;
    uint128_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    if (v > std::numeric_limits<uint64_t>::max()) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

// ------------------- Ledger helpers ----------------------------------------------------------
void pifpescrow::_init_balances(const project_t& project) {
    balance_t::idx_t balances(get_self(), project.id);
    for (uint64_t slot = 0; slot < project.accepted_tokens.size(); slot++) {
        balances.emplace(get_self(), [&](auto& row) {
            row.id      = slot;
            row.balance = extended_asset(0, project.accepted_tokens[slot]);
        });
    }
}

int64_t pifpescrow::_get_balance(const uint64_t& project_id, const extended_symbol& token) {
    balance_t::idx_t balances(get_self(), project_id);
    auto idx = balances.get_index<"bytoken"_n>();
    auto itr = idx.find(token_key(token));
    if (itr == idx.end() || itr->balance.get_extended_symbol() != token) return 0;
    return itr->balance.quantity.amount;
}

void pifpescrow::_credit_balance(const uint64_t& project_id, const extended_asset& quantity) {
    balance_t::idx_t balances(get_self(), project_id);
    auto idx = balances.get_index<"bytoken"_n>();
    auto itr = idx.find(token_key(quantity.get_extended_symbol()));
    CHECKC(itr != idx.end(), err::TOKEN_NOT_ACCEPTED, "no balance slot for token: " + quantity.quantity.symbol.code().to_string());
    CHECKC(quantity.quantity.amount <= asset::max_amount - itr->balance.quantity.amount,
           err::ARITHMETIC_OVERFLOW, "pooled balance overflow");

    idx.modify(itr, same_payer, [&](auto& row) {
        row.balance.quantity.amount += quantity.quantity.amount;
    });
}

void pifpescrow::_debit_balance(const uint64_t& project_id, const extended_asset& quantity) {
    balance_t::idx_t balances(get_self(), project_id);
    auto idx = balances.get_index<"bytoken"_n>();
    auto itr = idx.find(token_key(quantity.get_extended_symbol()));
    CHECKC(itr != idx.end(), err::TOKEN_NOT_ACCEPTED, "no balance slot for token: " + quantity.quantity.symbol.code().to_string());
    CHECKC(itr->balance.quantity.amount >= quantity.quantity.amount, err::INSUFFICIENT_BALANCE, "pooled balance insufficient");

    idx.modify(itr, same_payer, [&](auto& row) {
        row.balance.quantity.amount -= quantity.quantity.amount;
    });
}

int64_t pifpescrow::_drain_balance(const uint64_t& project_id, const uint64_t& slot) {
    balance_t::idx_t balances(get_self(), project_id);
    auto itr = balances.find(slot);
    CHECKC(itr != balances.end(), err::TOKEN_NOT_ACCEPTED, "no balance slot: " + to_string(slot));

    const int64_t amount = itr->balance.quantity.amount;
    if (amount == 0) return 0;

    balances.modify(itr, same_payer, [&](auto& row) {
        row.balance.quantity.amount = 0;
    });
    return amount;
}

bool pifpescrow::_credit_donor(const uint64_t& project_id, const name& donor, const extended_asset& quantity) {
    donor_t::idx_t donors(get_self(), project_id);
    const auto now = time_point_sec(current_time_point());

    auto itr = donors.find(donor.value);
    if (itr == donors.end()) {
        donors.emplace(get_self(), [&](auto& row) {
            row.donor            = donor;
            row.contributions.push_back(quantity);
            row.first_deposit_at = now;
            row.last_deposit_at  = now;
        });
        return true;
    }

    donors.modify(itr, same_payer, [&](auto& row) {
        auto c = std::find_if(row.contributions.begin(), row.contributions.end(), [&](const extended_asset& a) {
            return a.get_extended_symbol() == quantity.get_extended_symbol();
        });
        if (c == row.contributions.end()) {
            row.contributions.push_back(quantity);
        } else {
            c->quantity.amount += quantity.quantity.amount;
        }
        row.last_deposit_at = now;
    });
    return false;
}

int64_t pifpescrow::_debit_donor(const uint64_t& project_id, const name& donor, const extended_symbol& token) {
    donor_t::idx_t donors(get_self(), project_id);
    auto itr = donors.find(donor.value);
    CHECKC(itr != donors.end(), err::INSUFFICIENT_BALANCE, "no contribution from donor: " + donor.to_string());

    const int64_t amount = itr->contributed(token);
    CHECKC(amount > 0, err::INSUFFICIENT_BALANCE, "nothing to refund for token: " + token.get_symbol().code().to_string());

    // row stays, zeroed, so the donor is still counted once
    donors.modify(itr, same_payer, [&](auto& row) {
        for (auto& c : row.contributions) {
            if (c.get_extended_symbol() == token) c.quantity.amount = 0;
        }
    });
    return amount;
}

// ------------------- Deposit -----------------------------------------------------------------
void pifpescrow::_deposit(const name& donor, const extended_asset& quantity, const uint64_t& project_id) {
    const time_point_sec now = time_point_sec(current_time_point());

    // === Step 1: 项目校验 ===
    const auto project  = _load_project(project_id);
    auto state          = _load_state(project_id);

    CHECKC(now < project.deadline, err::PROJECT_EXPIRED, "project deadline passed: " + to_string(project_id));
    CHECKC(state.is_open(), err::PROJECT_NOT_ACTIVE,
           "project not open for deposits (status: " + state.status.to_string() + ")");
    CHECKC(project.accepts(quantity.get_extended_symbol()), err::TOKEN_NOT_ACCEPTED,
           "token not accepted: " + quantity.quantity.symbol.code().to_string() + "@" + quantity.contract.to_string());

    // === Step 2: 入账 ===
    _credit_balance(project_id, quantity);
    const bool new_donor = _credit_donor(project_id, donor, quantity);

    // === Step 3: 更新状态 ===
    if (new_donor) state.donation_count++;
    if (state.status == ProjectStatus::FUNDING) state.status = ProjectStatus::ACTIVE;
    _save_state(state);

    logfunded_action{ get_self(), { {get_self(), active_perm} } }.send(project_id, donor, quantity, state.donation_count);
}

// memo: deposit:<project_id>
void pifpescrow::on_transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
    if (from == get_self() || to != get_self()) return;

    _require_not_paused();
    CHECKC(quantity.amount > 0, err::INVALID_AMOUNT, "quantity must be positive");

    auto parts = split(memo, ":");
    CHECKC(parts.size() == 2 && parts[0] == DEPOSIT_MEMO_PREFIX, err::INVALID_FORMAT,
           "invalid memo format, expect deposit:<project_id>");

    uint64_t project_id = 0;
    CHECKC(parse_project_id(string(parts[1]), project_id), err::INVALID_FORMAT, "invalid project id in memo");

    const name bank = get_first_receiver();
    _deposit(from, extended_asset(quantity, bank), project_id);
}
