#pragma once

#include "pifpescrowdb.hpp"
#include <flon/flon.token.hpp>
#include <flon/utils.hpp>

namespace pifp {

using namespace eosio;
using namespace wasm::db;
using std::string;

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

// numbers are part of the public contract, do not renumber
enum class err: uint8_t {
   INVALID_FORMAT             = 0,
   PROJECT_NOT_FOUND          = 1,
   MILESTONE_NOT_FOUND        = 2,
   MILESTONE_ALREADY_RELEASED = 3,
   INSUFFICIENT_BALANCE       = 4,
   INVALID_MILESTONES         = 5,
   NOT_AUTHORIZED             = 6,
   INVALID_GOAL               = 7,
   ALREADY_INITIALIZED        = 8,
   ROLE_NOT_FOUND             = 9,
   TOO_MANY_TOKENS            = 10,
   INVALID_AMOUNT             = 11,
   DUPLICATE_TOKEN            = 12,
   INVALID_DEADLINE           = 13,
   PROJECT_EXPIRED            = 14,
   PROJECT_NOT_ACTIVE         = 15,
   VERIFICATION_FAILED        = 16,
   EMPTY_ACCEPTED_TOKENS      = 17,
   ARITHMETIC_OVERFLOW        = 18,
   PROTOCOL_PAUSED            = 19,
   GOAL_MISMATCH              = 20,
   TOKEN_NOT_ACCEPTED         = 21,
   INVALID_STATE_TRANSITION   = 22,
   DEADLINE_OVERFLOW          = 23,
   NOT_INITIALIZED            = 24,
   ACCOUNT_INVALID            = 25
};

/**
 * @contract pifp.escrow
 * @brief Proof-of-impact funding escrow
 *
 *   - project managers register projects (accepted tokens, goal, proof commitment, deadline)
 *   - donors fund a project by transferring an accepted token with memo "deposit:<project_id>"
 *   - an oracle submitting the matching proof hash releases every pooled token to the creator
 *   - after the deadline, donors reclaim their own contribution per token
 */
class [[eosio::contract("pifp.escrow")]] pifpescrow : public contract {
public:
    using contract::contract;

    pifpescrow(name receiver, name code, datastream<const char*> ds)
    : contract(receiver, code, ds),
      _db(get_self()),
      _global(get_self(), get_self().value)
    {
        _gstate = _global.exists() ? _global.get() : global_t{};
    }

    // ========== Role registry ==========

    /**
     * 初始化（仅一次）
     * @param super_admin the sole SuperAdmin
     */
    ACTION init(const name& super_admin);

    /**
     * Grant `role` to `target`, replacing its previous role.
     * caller must be superadmin or admin; superadmin itself moves only via xfersuperadm.
     */
    ACTION grantrole(const name& caller, const name& target, const name& role);

    /**
     * Remove any role from `target`. The superadmin cannot be revoked.
     */
    ACTION revokerole(const name& caller, const name& target);

    ACTION setoracle(const name& caller, const name& oracle);

    /**
     * Move the superadmin role to `new_super_admin`; caller loses it in the same action.
     */
    ACTION xfersuperadm(const name& caller, const name& new_super_admin);

    [[eosio::action, eosio::read_only]] std::optional<name> roleof(const name& account);
    [[eosio::action, eosio::read_only]] bool hasrole(const name& account, const name& role);

    // ========== Emergency control ==========

    ACTION pause(const name& caller);
    ACTION unpause(const name& caller);
    [[eosio::action, eosio::read_only]] bool ispaused();

    // ========== Project lifecycle ==========

    /**
     * Register a new funding project.
     * @param creator          projmanager, admin or superadmin; receives funds on release
     * @param accepted_tokens  1..10 distinct tokens
     * @param goal             0 < goal <= MAX_GOAL
     * @param proof_hash       milestone proof commitment
     * @param deadline         now < deadline <= now + 5 years
     */
    [[eosio::action]] project_view regproject( const name& creator,
                                               const vector<extended_symbol>& accepted_tokens,
                                               const int64_t& goal,
                                               const checksum256& proof_hash,
                                               const time_point_sec& deadline );

    /**
     * 捐款（监听任意代币转账）
     * memo 格式： "deposit:<project_id>"
     */
    [[eosio::on_notify("*::transfer")]]
    void on_transfer(const name& from, const name& to, const asset& quantity, const string& memo);

    /**
     * Oracle submits the milestone proof hash; on match every pooled token goes to the creator.
     */
    ACTION verifyproof(const name& oracle, const uint64_t& project_id, const checksum256& proof_hash);

    /**
     * Anyone may mark a project expired once its deadline has passed.
     */
    ACTION expire(const uint64_t& project_id);

    /**
     * Return the donor's whole contribution of `token` after the project expired.
     * Not gated by pause.
     */
    ACTION refund(const name& donor, const uint64_t& project_id, const extended_symbol& token);

    // ========== Queries ==========

    [[eosio::action, eosio::read_only]] project_view getproject(const uint64_t& project_id);
    [[eosio::action, eosio::read_only]] int64_t getbalance(const uint64_t& project_id, const extended_symbol& token);
    [[eosio::action, eosio::read_only]] project_balances getbalances(const uint64_t& project_id);
    [[eosio::action, eosio::read_only]] std::string version();

    // ========== Events (inline, self-authorized) ==========

    ACTION logcreated(const uint64_t& project_id, const name& creator, const extended_symbol& token, const int64_t& goal);
    ACTION logfunded(const uint64_t& project_id, const name& donor, const extended_asset& quantity, const uint64_t& donation_count);
    ACTION logreleased(const uint64_t& project_id, const name& creator, const extended_asset& quantity);
    ACTION logverified(const uint64_t& project_id, const name& oracle, const checksum256& proof_hash);
    ACTION logexpired(const uint64_t& project_id, const time_point_sec& deadline);
    ACTION logrefunded(const uint64_t& project_id, const name& donor, const extended_asset& quantity);
    ACTION logpaused(const name& admin);
    ACTION logunpaused(const name& admin);
    ACTION logrole(const name& kind, const name& caller, const name& target, const name& role);

    using logcreated_action     = eosio::action_wrapper<"logcreated"_n,  &pifpescrow::logcreated>;
    using logfunded_action      = eosio::action_wrapper<"logfunded"_n,   &pifpescrow::logfunded>;
    using logreleased_action    = eosio::action_wrapper<"logreleased"_n, &pifpescrow::logreleased>;
    using logverified_action    = eosio::action_wrapper<"logverified"_n, &pifpescrow::logverified>;
    using logexpired_action     = eosio::action_wrapper<"logexpired"_n,  &pifpescrow::logexpired>;
    using logrefunded_action    = eosio::action_wrapper<"logrefunded"_n, &pifpescrow::logrefunded>;
    using logpaused_action      = eosio::action_wrapper<"logpaused"_n,   &pifpescrow::logpaused>;
    using logunpaused_action    = eosio::action_wrapper<"logunpaused"_n, &pifpescrow::logunpaused>;
    using logrole_action        = eosio::action_wrapper<"logrole"_n,     &pifpescrow::logrole>;

private:
    // === 权限 ===
    std::optional<name> _role_of(const name& account);
    void _require_initialized();
    void _require_not_paused();
    void _require_admin_or_above(const name& caller);
    void _set_role(const name& caller, const name& target, const name& role);

    // === 项目存储 ===
    bool _project_exists(const uint64_t& project_id);
    project_t _load_project(const uint64_t& project_id);
    project_state_t _load_state(const uint64_t& project_id);
    std::pair<project_t, project_state_t> _load_project_pair(const uint64_t& project_id);
    void _save_state(project_state_t& state);

    // === 托管账本 ===
    void _init_balances(const project_t& project);
    void _deposit(const name& donor, const extended_asset& quantity, const uint64_t& project_id);
    bool _credit_donor(const uint64_t& project_id, const name& donor, const extended_asset& quantity);
    void _credit_balance(const uint64_t& project_id, const extended_asset& quantity);
    int64_t _drain_balance(const uint64_t& project_id, const uint64_t& slot);
    int64_t _debit_donor(const uint64_t& project_id, const name& donor, const extended_symbol& token);
    void _debit_balance(const uint64_t& project_id, const extended_asset& quantity);
    int64_t _get_balance(const uint64_t& project_id, const extended_symbol& token);

private:
    dbc                 _db;
    global_singleton    _global;
    global_t            _gstate;
};

} // namespace pifp
