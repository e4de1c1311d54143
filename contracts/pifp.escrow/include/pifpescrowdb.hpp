#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/crypto.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>
#include <algorithm>
#include <optional>
#include <flon/wasm_db.hpp>
#include "pifp/consts.hpp"

using namespace eosio;
using namespace std;
using std::string;
using namespace wasm::db;

namespace pifp {

#define TBL struct [[eosio::table, eosio::contract("pifp.escrow")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("pifp.escrow")]]

// project status
namespace ProjectStatus {
    static constexpr eosio::name FUNDING     = "funding"_n;      // 已创建，等待首笔捐款
    static constexpr eosio::name ACTIVE      = "active"_n;       // 已有捐款，募资中
    static constexpr eosio::name COMPLETED   = "completed"_n;    // 里程碑已验证，资金已释放
    static constexpr eosio::name EXPIRED     = "expired"_n;      // 截止未达成，可退款
}

// account roles
namespace Role {
    static constexpr eosio::name SUPER_ADMIN     = "superadmin"_n;
    static constexpr eosio::name ADMIN           = "admin"_n;
    static constexpr eosio::name PROJECT_MANAGER = "projmanager"_n;
    static constexpr eosio::name ORACLE          = "oracle"_n;
    static constexpr eosio::name AUDITOR         = "auditor"_n;
}

/**
 * Privilege rank of a role: superadmin > admin > {projmanager, oracle, auditor}.
 * Returns 0 for names that are not roles.
 */
inline uint8_t role_rank(const name& role) {
    if (role == Role::SUPER_ADMIN)      return 3;
    if (role == Role::ADMIN)            return 2;
    if (role == Role::PROJECT_MANAGER ||
        role == Role::ORACLE ||
        role == Role::AUDITOR)          return 1;
    return 0;
}

inline bool is_valid_role(const name& role) { return role_rank(role) > 0; }

inline uint128_t token_key(const extended_symbol& token) {
    return ((uint128_t)token.get_contract().value << 64) | token.get_symbol().raw();
}

NTBL("global") global_t {
    name            super_admin;
    uint64_t        next_project_id     = 0;
    bool            paused              = false;
    bool            initialized         = false;

    EOSLIB_SERIALIZE( global_t, (super_admin)(next_project_id)(paused)(initialized) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//scope: _self
TBL role_t {
    name            account;                    //PK
    name            role;
    name            granted_by;
    time_point_sec  granted_at;

    uint64_t primary_key() const { return account.value; }

    role_t() {}
    role_t( const name& a ): account(a) {}

    typedef eosio::multi_index<"roles"_n, role_t> idx_t;

    EOSLIB_SERIALIZE( role_t, (account)(role)(granted_by)(granted_at) )
};

// immutable project config
//scope: _self
TBL project_t {
    uint64_t                id;                 //PK: dense, from global.next_project_id
    name                    creator;
    vector<extended_symbol> accepted_tokens;    //1..10, no duplicates
    int64_t                 goal = 0;
    checksum256             proof_hash;         //milestone proof commitment
    time_point_sec          deadline;
    time_point_sec          created_at;

    uint64_t primary_key() const { return id; }

    bool accepts( const extended_symbol& token ) const {
        return std::find(accepted_tokens.begin(), accepted_tokens.end(), token) != accepted_tokens.end();
    }

    project_t() {}
    project_t( const uint64_t& i ): id(i) {}

    typedef eosio::multi_index<"projects"_n, project_t> idx_t;

    EOSLIB_SERIALIZE( project_t, (id)(creator)(accepted_tokens)(goal)(proof_hash)(deadline)(created_at) )
};

// mutable project state, kept apart from config so hot paths rewrite only this row
//scope: _self
TBL project_state_t {
    uint64_t            id;                     //PK: same as project_t.id
    name                status = ProjectStatus::FUNDING;
    uint64_t            donation_count = 0;     //distinct donors over all tokens
    time_point_sec      updated_at;

    uint64_t primary_key() const { return id; }

    bool is_open() const { return status == ProjectStatus::FUNDING || status == ProjectStatus::ACTIVE; }

    project_state_t() {}
    project_state_t( const uint64_t& i ): id(i) {}

    typedef eosio::multi_index<"projstates"_n, project_state_t> idx_t;

    EOSLIB_SERIALIZE( project_state_t, (id)(status)(donation_count)(updated_at) )
};

// pooled escrow per accepted token
//scope: project_id
TBL balance_t {
    uint64_t            id;                     //PK: position in project_t.accepted_tokens
    extended_asset      balance;

    uint64_t primary_key() const { return id; }
    uint128_t by_token() const { return token_key( balance.get_extended_symbol() ); }

    balance_t() {}
    balance_t( const uint64_t& i ): id(i) {}

    typedef eosio::multi_index<"balances"_n, balance_t,
        indexed_by<"bytoken"_n, const_mem_fun<balance_t, uint128_t, &balance_t::by_token>>
    > idx_t;

    EOSLIB_SERIALIZE( balance_t, (id)(balance) )
};

// per-donor contributions, needed so a refund returns exactly what the donor put in
//scope: project_id
//Note: rows are kept after refund (zeroed) so a returning donor is not counted twice
TBL donor_t {
    name                    donor;              //PK
    vector<extended_asset>  contributions;      //one entry per token deposited
    time_point_sec          first_deposit_at;
    time_point_sec          last_deposit_at;

    uint64_t primary_key() const { return donor.value; }

    int64_t contributed( const extended_symbol& token ) const {
        for (const auto& c : contributions) {
            if (c.get_extended_symbol() == token) return c.quantity.amount;
        }
        return 0;
    }

    donor_t() {}
    donor_t( const name& d ): donor(d) {}

    typedef eosio::multi_index<"donors"_n, donor_t> idx_t;

    EOSLIB_SERIALIZE( donor_t, (donor)(contributions)(first_deposit_at)(last_deposit_at) )
};

// combined config + state, returned by queries and regproject
struct project_view {
    uint64_t                id;
    name                    creator;
    vector<extended_symbol> accepted_tokens;
    int64_t                 goal = 0;
    checksum256             proof_hash;
    time_point_sec          deadline;
    name                    status;
    uint64_t                donation_count = 0;

    project_view() {}
    project_view( const project_t& c, const project_state_t& s ):
        id(c.id), creator(c.creator), accepted_tokens(c.accepted_tokens), goal(c.goal),
        proof_hash(c.proof_hash), deadline(c.deadline), status(s.status), donation_count(s.donation_count) {}

    EOSLIB_SERIALIZE( project_view, (id)(creator)(accepted_tokens)(goal)(proof_hash)(deadline)(status)(donation_count) )
};

struct project_balances {
    uint64_t                project_id;
    vector<extended_asset>  balances;           //accepted-token order

    EOSLIB_SERIALIZE( project_balances, (project_id)(balances) )
};

} // namespace pifp
