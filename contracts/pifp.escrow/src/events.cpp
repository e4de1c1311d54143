#include "pifpescrow.hpp"

using namespace eosio;
using namespace pifp;

// inline log actions, sent by the contract to itself; the concerned party is notified

void pifpescrow::logcreated(const uint64_t& project_id, const name& creator, const extended_symbol& token, const int64_t& goal) {
    require_auth(get_self());
    require_recipient(creator);
}

void pifpescrow::logfunded(const uint64_t& project_id, const name& donor, const extended_asset& quantity, const uint64_t& donation_count) {
    require_auth(get_self());
    require_recipient(donor);
}

void pifpescrow::logreleased(const uint64_t& project_id, const name& creator, const extended_asset& quantity) {
    require_auth(get_self());
    require_recipient(creator);
}

void pifpescrow::logverified(const uint64_t& project_id, const name& oracle, const checksum256& proof_hash) {
    require_auth(get_self());
    require_recipient(oracle);
}

void pifpescrow::logexpired(const uint64_t& project_id, const time_point_sec& deadline) {
    require_auth(get_self());
}

void pifpescrow::logrefunded(const uint64_t& project_id, const name& donor, const extended_asset& quantity) {
    require_auth(get_self());
    require_recipient(donor);
}

void pifpescrow::logpaused(const name& admin) {
    require_auth(get_self());
    require_recipient(admin);
}

void pifpescrow::logunpaused(const name& admin) {
    require_auth(get_self());
    require_recipient(admin);
}

void pifpescrow::logrole(const name& kind, const name& caller, const name& target, const name& role) {
    require_auth(get_self());
    require_recipient(target);
}
