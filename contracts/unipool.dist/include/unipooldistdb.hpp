#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>
#include <unipool/consts.hpp>

using namespace eosio;
using namespace std;
using std::string;

namespace unipool {

#define TBL struct [[eosio::table, eosio::contract("unipool.dist")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("unipool.dist")]]

NTBL("global") global_t {
    name            owner;                                  // 可变更奖励注入方
    name            reward_distribution;                    // 唯一可调用 notifyreward 的账户
    name            hook_source         = REWARD_TOKEN;     // 唯一可投递 onhook 的账户
    name            token_distro        = TOKEN_DISTRO;     // 奖励分配账本
    symbol          stake_symbol        = GUR_SYM;
    symbol          reward_symbol       = GIV_SYM;
    uint32_t        duration            = DEFAULT_DURATION; // 奖励周期（秒），init 后不可改
    bool            initialized         = false;

    EOSLIB_SERIALIZE( global_t, (owner)(reward_distribution)(hook_source)(token_distro)
                                (stake_symbol)(reward_symbol)(duration)(initialized) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

NTBL("pool") pool_t {
    asset           total_staked;                           // == Σ stakers.staked
    uint128_t       reward_per_unit_stored  = 0;            // 每单位质押累计奖励 * HIGH_PRECISION，只增不减
    time_point_sec  last_update_time;
    int64_t         reward_rate             = 0;            // 每秒奖励数量
    time_point_sec  period_finish;
    asset           total_rewards_added;
    asset           total_rewards_paid;

    EOSLIB_SERIALIZE( pool_t, (total_staked)(reward_per_unit_stored)(last_update_time)
                              (reward_rate)(period_finish)(total_rewards_added)(total_rewards_paid) )
};
typedef eosio::singleton< "pool"_n, pool_t > pool_singleton;

TBL staker_t {                                              // scope: _self
    name            owner;                                  // PK
    asset           staked;
    uint128_t       reward_per_unit_paid    = 0;            // 上次结算时的 reward_per_unit
    asset           owed_reward;                            // 已结算未领取
    time_point_sec  created_at;
    time_point_sec  updated_at;

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index<"stakers"_n, staker_t> idx_t;

    EOSLIB_SERIALIZE( staker_t, (owner)(staked)(reward_per_unit_paid)(owed_reward)(created_at)(updated_at) )
};

} // namespace unipool
