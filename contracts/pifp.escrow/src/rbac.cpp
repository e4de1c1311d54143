#include "pifpescrow.hpp"

using namespace eosio;
using namespace pifp;

static constexpr eosio::name active_perm{"active"_n};

// ------------------- Internal functions ------------------------------------------------------
std::optional<name> pifpescrow::_role_of(const name& account) {
    auto role = role_t(account);
    if (!_db.get(role)) return std::nullopt;
    return role.role;
}

void pifpescrow::_require_initialized() {
    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "contract not initialized");
}

void pifpescrow::_require_admin_or_above(const name& caller) {
    const auto role = _role_of(caller);
    CHECKC(role && role_rank(*role) >= role_rank(Role::ADMIN), err::NOT_AUTHORIZED,
           "caller must be admin or above: " + caller.to_string());
}

void pifpescrow::_set_role(const name& caller, const name& target, const name& role) {
    _require_initialized();
    require_auth(caller);
    _require_admin_or_above(caller);

    CHECKC(is_valid_role(role), err::ROLE_NOT_FOUND, "unknown role: " + role.to_string());
    CHECKC(role != Role::SUPER_ADMIN, err::NOT_AUTHORIZED,
           caller == _gstate.super_admin ? "superadmin can only be moved by xfersuperadm"
                                         : "only superadmin may grant superadmin");
    CHECKC(is_account(target), err::ACCOUNT_INVALID, "invalid target account: " + target.to_string());
    CHECKC(target != _gstate.super_admin, err::NOT_AUTHORIZED, "cannot overwrite the superadmin role");

    auto record         = role_t(target);
    record.role         = role;
    record.granted_by   = caller;
    record.granted_at   = time_point_sec(current_time_point());
    _db.set(record, get_self());

    logrole_action{ get_self(), { {get_self(), active_perm} } }.send("grant"_n, caller, target, role);
}

// ------------------- Actions ------------------------------------------------------------------
void pifpescrow::init(const name& super_admin) {
    require_auth(get_self());
    CHECKC(!_gstate.initialized, err::ALREADY_INITIALIZED, "already initialized");
    CHECKC(is_account(super_admin), err::ACCOUNT_INVALID, "invalid super admin account");

    auto record         = role_t(super_admin);
    record.role         = Role::SUPER_ADMIN;
    record.granted_by   = get_self();
    record.granted_at   = time_point_sec(current_time_point());
    _db.set(record, get_self());

    _gstate.super_admin = super_admin;
    _gstate.initialized = true;
    _global.set(_gstate, get_self());

    logrole_action{ get_self(), { {get_self(), active_perm} } }.send("init"_n, get_self(), super_admin, Role::SUPER_ADMIN);
}

void pifpescrow::grantrole(const name& caller, const name& target, const name& role) {
    _set_role(caller, target, role);
}

void pifpescrow::setoracle(const name& caller, const name& oracle) {
    _set_role(caller, oracle, Role::ORACLE);
}

void pifpescrow::revokerole(const name& caller, const name& target) {
    _require_initialized();
    require_auth(caller);
    _require_admin_or_above(caller);

    CHECKC(target != _gstate.super_admin, err::NOT_AUTHORIZED, "superadmin cannot be revoked");

    auto record = role_t(target);
    CHECKC(_db.get(record), err::ROLE_NOT_FOUND, "no role held by: " + target.to_string());
    const name revoked = record.role;
    _db.del(record);

    logrole_action{ get_self(), { {get_self(), active_perm} } }.send("revoke"_n, caller, target, revoked);
}

void pifpescrow::xfersuperadm(const name& caller, const name& new_super_admin) {
    _require_initialized();
    require_auth(caller);

    CHECKC(caller == _gstate.super_admin && _role_of(caller) == Role::SUPER_ADMIN,
           err::NOT_AUTHORIZED, "only the superadmin can transfer superadmin");
    CHECKC(is_account(new_super_admin), err::ACCOUNT_INVALID, "invalid new superadmin account");
    CHECKC(new_super_admin != caller, err::ACCOUNT_INVALID, "new superadmin must differ from current");

    auto old_role = role_t(caller);
    _db.del(old_role);

    auto record         = role_t(new_super_admin);
    record.role         = Role::SUPER_ADMIN;
    record.granted_by   = caller;
    record.granted_at   = time_point_sec(current_time_point());
    _db.set(record, get_self());

    _gstate.super_admin = new_super_admin;
    _global.set(_gstate, get_self());

    logrole_action{ get_self(), { {get_self(), active_perm} } }.send("transfer"_n, caller, new_super_admin, Role::SUPER_ADMIN);
}

std::optional<name> pifpescrow::roleof(const name& account) {
    return _role_of(account);
}

bool pifpescrow::hasrole(const name& account, const name& role) {
    return _role_of(account) == role;
}
