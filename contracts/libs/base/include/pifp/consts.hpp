#pragma once
#include <eosio/asset.hpp>
#include <eosio/name.hpp>

namespace pifp {

static constexpr uint64_t seconds_per_year          = 365 * 24 * 3600;

static constexpr uint32_t MAX_ACCEPTED_TOKENS       = 10;
static constexpr int64_t  MAX_GOAL                  = 1'000'000'000'000'000'000LL;   // 1e18 < asset::max_amount
static constexpr uint64_t MAX_DEADLINE_SECONDS      = 5 * seconds_per_year;          // 157,680,000

static constexpr const char* DEPOSIT_MEMO_PREFIX    = "deposit";

}
