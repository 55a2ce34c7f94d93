#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>
#include <unipool/consts.hpp>
#include <unipool/wasm_db.hpp>

using namespace eosio;
using namespace std;
using std::string;
using namespace wasm::db;

namespace unipool {

#define TBL struct [[eosio::table, eosio::contract("token.distro")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("token.distro")]]

NTBL("global") global_t {
    name            admin;
    asset           total_tokens;                   // 归属计划总量
    time_point_sec  start_time;
    time_point_sec  cliff_time;                     // 锁定期结束
    time_point_sec  end_time;                       // 全部解锁
    uint32_t        duration            = 0;        // end_time - start_time
    uint16_t        initial_percentage  = 0;        // 初始解锁比例（基点）
    asset           initial_amount;                 // total_tokens * initial_percentage / 10000
    asset           locked_amount;                  // total_tokens - initial_amount
    bool            initialized         = false;

    EOSLIB_SERIALIZE( global_t, (admin)(total_tokens)(start_time)(cliff_time)(end_time)(duration)
                                (initial_percentage)(initial_amount)(locked_amount)(initialized) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

// 合约自身的行保存尚未分派给分配方的预算
TBL balance_t {                                     // scope: _self
    name            owner;                          // PK
    asset           allocated;                      // 分配方：剩余预算；接收方：累计分配额
    asset           claimed;
    time_point_sec  updated_at;

    balance_t() {}
    balance_t(const name& o): owner(o) {}

    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index<"balances"_n, balance_t> idx_t;

    EOSLIB_SERIALIZE( balance_t, (owner)(allocated)(claimed)(updated_at) )
};

TBL distributor_t {                                 // scope: _self
    name            account;                        // PK
    time_point_sec  granted_at;

    distributor_t() {}
    distributor_t(const name& a): account(a) {}

    uint64_t primary_key() const { return account.value; }

    typedef eosio::multi_index<"distributors"_n, distributor_t> idx_t;

    EOSLIB_SERIALIZE( distributor_t, (account)(granted_at) )
};

} // namespace unipool
