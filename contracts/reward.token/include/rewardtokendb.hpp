#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <unipool/consts.hpp>
#include <unipool/wasm_db.hpp>

using namespace eosio;
using namespace std;
using std::string;
using namespace wasm::db;

namespace unipool {

#define TBL struct [[eosio::table, eosio::contract("reward.token")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("reward.token")]]

NTBL("global") global_t {
    name            minter;                         // 唯一可铸造的账户
    name            staker;                         // 唯一可持有/转出的账户
    name            token_distro        = TOKEN_DISTRO;
    name            reward_pool         = UNIPOOL_DIST;
    symbol          stake_symbol        = GUR_SYM;  // 本币符号
    symbol          reward_symbol       = GIV_SYM;  // 转出时记入账本的符号
    bool            initialized         = false;

    EOSLIB_SERIALIZE( global_t, (minter)(staker)(token_distro)(reward_pool)
                                (stake_symbol)(reward_symbol)(initialized) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

NTBL("stat") stat_t {
    asset           supply;

    EOSLIB_SERIALIZE( stat_t, (supply) )
};
typedef eosio::singleton< "stat"_n, stat_t > stat_singleton;

TBL account_t {                                     // scope: _self
    name            owner;                          // PK
    asset           balance;

    account_t() {}
    account_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index<"accounts"_n, account_t> idx_t;

    EOSLIB_SERIALIZE( account_t, (owner)(balance) )
};

} // namespace unipool
