#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>
#include <unipool/utils.hpp>

#include "rewardtokendb.hpp"

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

enum class err: uint8_t {
   INVALID_FORMAT        = 0,
   QUANTITY_INSUFFICIENT = 3,
   NOT_POSITIVE          = 4,
   SYMBOL_MISMATCH       = 5,
   ACCOUNT_INVALID       = 11,
   NO_AUTH               = 16,
   NOT_INITIALIZED       = 18,
   ACTION_REDUNDANT      = 22,
   PARAM_ERROR           = 33
};

namespace unipool {

using namespace eosio;
using namespace std;

/**
 * 合约：rewardtoken
 * 功能：只对单一质押方开放的包装代币
 * 说明：
 *   - minter 只能铸造给 staker，铸造即通知奖励池质押
 *   - staker 转出即销毁：通知奖励池取回，并将等量奖励记入 token.distro 归属账本
 */
class [[eosio::contract("reward.token")]] rewardtoken : public contract {
public:
    using contract::contract;

    rewardtoken(name receiver, name code, datastream<const char*> ds)
    : contract(receiver, code, ds),
      _global(get_self(), get_self().value),
      _stat(get_self(), get_self().value),
      _db(get_self())
    {
        _gstate = _global.exists() ? _global.get() : global_t{};
    }

    /**
     * 初始化（仅一次）
     * @param minter        铸造方
     * @param staker        唯一持有方
     * @param token_distro  归属账本合约
     * @param reward_pool   奖励池合约（接收 onhook）
     * @param stake_symbol  本币符号
     * @param reward_symbol 奖励币符号
     */
    ACTION init(const name& minter, const name& staker, const name& token_distro,
                const name& reward_pool, const symbol& stake_symbol, const symbol& reward_symbol);

    ACTION mint(const name& to, const asset& quantity);

    /**
     * 仅 staker 可转出；转出部分销毁，并以奖励币记入 to 的归属额度
     */
    ACTION transfer(const name& from, const name& to, const asset& quantity, const string& memo);

    ACTION rewardpaid(const name& owner, const asset& reward);

    using mint_action       = eosio::action_wrapper<"mint"_n, &rewardtoken::mint>;
    using transfer_action   = eosio::action_wrapper<"transfer"_n, &rewardtoken::transfer>;
    using rewardpaid_action = eosio::action_wrapper<"rewardpaid"_n, &rewardtoken::rewardpaid>;

private:
    void _add_balance(const name& owner, const asset& value);
    void _sub_balance(const name& owner, const asset& value);

    void _check_initialized() const;

private:
    global_singleton    _global;
    global_t            _gstate;
    stat_singleton      _stat;
    dbc                 _db;
};

} // namespace unipool
