#include "pifpescrow.hpp"
#include "contract_version.hpp"
#include <limits>

using namespace eosio;
using namespace pifp;
using namespace flon;

static constexpr eosio::name active_perm{"active"_n};

// ------------------- Internal functions ------------------------------------------------------
void pifpescrow::_require_not_paused() {
    CHECKC(!_gstate.paused, err::PROTOCOL_PAUSED, "protocol paused");
}

bool pifpescrow::_project_exists(const uint64_t& project_id) {
    project_t::idx_t projects(get_self(), get_self().value);
    return projects.find(project_id) != projects.end();
}

project_t pifpescrow::_load_project(const uint64_t& project_id) {
    auto project = project_t(project_id);
    CHECKC(_db.get(project), err::PROJECT_NOT_FOUND, "project not found: " + to_string(project_id));
    return project;
}

project_state_t pifpescrow::_load_state(const uint64_t& project_id) {
    auto state = project_state_t(project_id);
    CHECKC(_db.get(state), err::PROJECT_NOT_FOUND, "project state not found: " + to_string(project_id));
    return state;
}

std::pair<project_t, project_state_t> pifpescrow::_load_project_pair(const uint64_t& project_id) {
    return { _load_project(project_id), _load_state(project_id) };
}

void pifpescrow::_save_state(project_state_t& state) {
    state.updated_at = time_point_sec(current_time_point());
    _db.set(state, get_self());
}

// ------------------- Emergency control -------------------------------------------------------
void pifpescrow::pause(const name& caller) {
    require_auth(caller);
    _require_admin_or_above(caller);

    _gstate.paused = true;
    _global.set(_gstate, get_self());

    logpaused_action{ get_self(), { {get_self(), active_perm} } }.send(caller);
}

void pifpescrow::unpause(const name& caller) {
    require_auth(caller);
    _require_admin_or_above(caller);

    _gstate.paused = false;
    _global.set(_gstate, get_self());

    logunpaused_action{ get_self(), { {get_self(), active_perm} } }.send(caller);
}

bool pifpescrow::ispaused() {
    return _gstate.paused;
}

// ------------------- Project lifecycle -------------------------------------------------------
project_view pifpescrow::regproject( const name& creator,
                                     const vector<extended_symbol>& accepted_tokens,
                                     const int64_t& goal,
                                     const checksum256& proof_hash,
                                     const time_point_sec& deadline ) {
    // === Step 1: 暂停与权限 ===
    _require_not_paused();
    require_auth(creator);

    const auto role = _role_of(creator);
    CHECKC(role && (*role == Role::PROJECT_MANAGER || role_rank(*role) >= role_rank(Role::ADMIN)),
           err::NOT_AUTHORIZED, "creator must be projmanager, admin or superadmin");

    // === Step 2: 代币列表 ===
    CHECKC(!accepted_tokens.empty(), err::EMPTY_ACCEPTED_TOKENS, "accepted tokens empty");
    CHECKC(accepted_tokens.size() <= MAX_ACCEPTED_TOKENS, err::TOO_MANY_TOKENS,
           "too many accepted tokens, max " + to_string(MAX_ACCEPTED_TOKENS));
    for (size_t i = 0; i < accepted_tokens.size(); i++) {
        for (size_t j = i + 1; j < accepted_tokens.size(); j++) {
            CHECKC(accepted_tokens[i] != accepted_tokens[j], err::DUPLICATE_TOKEN,
                   "duplicate token: " + accepted_tokens[j].get_symbol().code().to_string());
        }
    }
    for (const auto& token : accepted_tokens) {
        CHECKC(token.get_symbol().is_valid(), err::TOKEN_NOT_ACCEPTED, "invalid token symbol");
        CHECKC(is_account(token.get_contract()), err::TOKEN_NOT_ACCEPTED,
               "token contract not found: " + token.get_contract().to_string());
    }

    // === Step 3: 目标与截止时间 ===
    CHECKC(goal > 0 && goal <= MAX_GOAL, err::INVALID_GOAL, "goal out of range");

    const uint64_t now          = current_time_point().sec_since_epoch();
    const uint64_t max_deadline = now + MAX_DEADLINE_SECONDS;
    CHECKC(max_deadline <= std::numeric_limits<uint32_t>::max(), err::DEADLINE_OVERFLOW, "deadline horizon overflow");
    CHECKC(deadline.sec_since_epoch() > now && deadline.sec_since_epoch() <= max_deadline,
           err::INVALID_DEADLINE, "deadline must be in (now, now + 5 years]");

    // === Step 4: 写入项目 ===
    auto project            = project_t(_gstate.next_project_id);
    project.creator         = creator;
    project.accepted_tokens = accepted_tokens;
    project.goal            = goal;
    project.proof_hash      = proof_hash;
    project.deadline        = deadline;
    project.created_at      = time_point_sec(now);
    _db.set(project, get_self());

    auto state              = project_state_t(project.id);
    _save_state(state);

    _init_balances(project);

    _gstate.next_project_id++;
    _global.set(_gstate, get_self());

    logcreated_action{ get_self(), { {get_self(), active_perm} } }.send(project.id, creator, accepted_tokens.front(), goal);
    return project_view(project, state);
}

void pifpescrow::verifyproof(const name& oracle, const uint64_t& project_id, const checksum256& proof_hash) {
    // === Step 1: 暂停与权限 ===
    _require_not_paused();
    require_auth(oracle);
    CHECKC(_role_of(oracle) == Role::ORACLE, err::NOT_AUTHORIZED, "caller is not an oracle: " + oracle.to_string());

    // === Step 2: 项目状态 ===
    const auto project = _load_project(project_id);
    auto state         = _load_state(project_id);

    CHECKC(state.status != ProjectStatus::COMPLETED, err::MILESTONE_ALREADY_RELEASED, "milestone already released");
    CHECKC(state.status != ProjectStatus::EXPIRED, err::PROJECT_NOT_FOUND, "project expired: " + to_string(project_id));
    CHECKC(proof_hash == project.proof_hash, err::VERIFICATION_FAILED, "proof hash mismatch");

    // === Step 3: 清零并释放所有代币 ===
    vector<extended_asset> released;
    for (uint64_t slot = 0; slot < project.accepted_tokens.size(); slot++) {
        const auto& token    = project.accepted_tokens[slot];
        const int64_t amount = _drain_balance(project_id, slot);
        if (amount == 0) continue;

        const asset quantity(amount, token.get_symbol());
        TRANSFER(token.get_contract(), project.creator, quantity, "release:" + to_string(project_id));
        released.emplace_back(quantity, token.get_contract());
    }

    // === Step 4: 更新状态 ===
    state.status = ProjectStatus::COMPLETED;
    _save_state(state);

    for (const auto& quantity : released) {
        logreleased_action{ get_self(), { {get_self(), active_perm} } }.send(project_id, project.creator, quantity);
    }
    logverified_action{ get_self(), { {get_self(), active_perm} } }.send(project_id, oracle, proof_hash);
}

void pifpescrow::expire(const uint64_t& project_id) {
    _require_not_paused();

    const auto project = _load_project(project_id);
    auto state         = _load_state(project_id);

    CHECKC(time_point_sec(current_time_point()) >= project.deadline, err::INVALID_STATE_TRANSITION,
           "deadline not reached: " + to_string(project_id));
    CHECKC(state.is_open(), err::INVALID_STATE_TRANSITION,
           "cannot expire project in status " + state.status.to_string());

    state.status = ProjectStatus::EXPIRED;
    _save_state(state);

    logexpired_action{ get_self(), { {get_self(), active_perm} } }.send(project_id, project.deadline);
}

// 不受暂停限制：捐款人必须始终能取回资金
void pifpescrow::refund(const name& donor, const uint64_t& project_id, const extended_symbol& token) {
    require_auth(donor);

    // === Step 1: 项目与状态 ===
    const auto project = _load_project(project_id);
    auto state         = _load_state(project_id);

    CHECKC(project.accepts(token), err::TOKEN_NOT_ACCEPTED,
           "token not accepted: " + token.get_symbol().code().to_string() + "@" + token.get_contract().to_string());
    CHECKC(state.status != ProjectStatus::COMPLETED, err::MILESTONE_ALREADY_RELEASED, "funds already released");

    const bool lazy_expire = state.is_open() && time_point_sec(current_time_point()) >= project.deadline;
    CHECKC(state.status == ProjectStatus::EXPIRED || lazy_expire, err::INVALID_STATE_TRANSITION,
           "refund only after expiry (status: " + state.status.to_string() + ")");

    // === Step 2: 扣减捐款记录与池余额 ===
    const int64_t amount = _debit_donor(project_id, donor, token);
    const extended_asset quantity(amount, token);
    _debit_balance(project_id, quantity);

    if (lazy_expire) {
        state.status = ProjectStatus::EXPIRED;
        _save_state(state);
        logexpired_action{ get_self(), { {get_self(), active_perm} } }.send(project_id, project.deadline);
    }

    // === Step 3: 退回代币 ===
    TRANSFER(token.get_contract(), donor, quantity.quantity, "refund:" + to_string(project_id));

    logrefunded_action{ get_self(), { {get_self(), active_perm} } }.send(project_id, donor, quantity);
}

// ------------------- Queries -----------------------------------------------------------------
project_view pifpescrow::getproject(const uint64_t& project_id) {
    const auto pair = _load_project_pair(project_id);
    return project_view(pair.first, pair.second);
}

int64_t pifpescrow::getbalance(const uint64_t& project_id, const extended_symbol& token) {
    CHECKC(_project_exists(project_id), err::PROJECT_NOT_FOUND, "project not found: " + to_string(project_id));
    return _get_balance(project_id, token);
}

project_balances pifpescrow::getbalances(const uint64_t& project_id) {
    const auto project = _load_project(project_id);

    project_balances result;
    result.project_id = project_id;
    for (const auto& token : project.accepted_tokens) {
        result.balances.emplace_back(_get_balance(project_id, token), token);
    }
    return result;
}

std::string pifpescrow::version() {
    return CONTRACT_VERSION;
}
