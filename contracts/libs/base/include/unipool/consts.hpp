#pragma once
#include <eosio/asset.hpp>
#include <eosio/name.hpp>

namespace unipool {

static constexpr eosio::name UNIPOOL_DIST           {"unipool.dist"_n};    // 奖励池（质押 + 奖励累计）
static constexpr eosio::name TOKEN_DISTRO           {"token.distro"_n};    // 分配账本（归属/解锁）
static constexpr eosio::name REWARD_TOKEN           {"reward.token"_n};    // 包装代币（铸造/销毁闸门）

static constexpr eosio::symbol GIV_SYM              = eosio::symbol("GIV", 8);   // 奖励代币
static constexpr eosio::symbol GUR_SYM              = eosio::symbol("GUR", 8);   // 包装凭证币

// reward_per_unit 的定点精度 1e18
static constexpr uint128_t HIGH_PRECISION           = 1'000'000'000'000'000'000ULL;
static constexpr uint128_t UINT128_MAX_VALUE        = ~uint128_t(0);

static constexpr uint64_t DAY_SECONDS               = 24 * 3600;
static constexpr uint32_t DEFAULT_DURATION          = 14 * DAY_SECONDS;       // 默认奖励周期两周
static constexpr uint64_t PERCENT_BOOST             = 10000;                  // 基点制 10000 = 100%
static constexpr uint32_t MAX_MEMO_SIZE             = 256;

}
