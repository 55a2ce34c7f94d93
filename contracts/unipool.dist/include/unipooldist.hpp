#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>
#include <unipool/utils.hpp>

#include "unipooldistdb.hpp"

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

enum class err: uint8_t {
   INVALID_FORMAT        = 0,
   QUANTITY_INSUFFICIENT = 3,
   NOT_POSITIVE          = 4,
   SYMBOL_MISMATCH       = 5,
   RECORD_NOT_FOUND      = 8,
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
 * 合约：unipooldist
 * 功能：按 reward-per-unit 累计的奖励分发池
 * 说明：
 *   - 质押余额由包装代币合约（hook_source）通过 onhook 推送（铸造=质押，销毁=取回，转账=取回+质押）
 *   - reward_distribution 调用 notifyreward 注入一期奖励，按 duration 线性释放
 *   - 奖励不直接转账，而是内联调用 token.distro::allocate 记入归属账本
 */
class [[eosio::contract("unipool.dist")]] unipooldist : public contract {
public:
    using contract::contract;

    unipooldist(name receiver, name code, datastream<const char*> ds)
    : contract(receiver, code, ds),
      _global(get_self(), get_self().value),
      _pool_tbl(get_self(), get_self().value)
    {
        _gstate = _global.exists() ? _global.get() : global_t{};
        _pool   = _pool_tbl.exists() ? _pool_tbl.get() : pool_t{};
    }

    /**
     * 初始化（仅一次）
     * @param owner               管理员
     * @param reward_distribution 奖励注入方
     * @param hook_source         包装代币合约
     * @param token_distro        分配账本合约
     * @param stake_symbol        质押凭证币符号
     * @param reward_symbol       奖励币符号
     * @param duration            奖励周期（秒）
     */
    ACTION init(const name& owner, const name& reward_distribution, const name& hook_source,
                const name& token_distro, const symbol& stake_symbol, const symbol& reward_symbol,
                const uint32_t& duration);

    ACTION setowner(const name& new_owner);

    ACTION setrewarddist(const name& distributor);

    /**
     * 注入一期奖励；若上一期未结束，剩余部分并入新一期
     * @param reward 奖励数量（不转账，只更新发放速率）
     */
    ACTION notifyreward(const asset& reward);

    /**
     * 包装代币余额变动通知
     * from 为空：铸造；to 为空：销毁；均非空：转账
     */
    ACTION onhook(const name& from, const name& to, const asset& quantity);

    ACTION getreward(const name& owner);

    // ========== 只读查询 ==========
    [[eosio::action, eosio::read_only]]
    asset earned(const name& owner);

    [[eosio::action, eosio::read_only]]
    uint128_t rewardperunit();

    [[eosio::action, eosio::read_only]]
    time_point_sec lasttimeapp();

    // ========== 事件日志（仅供 trace 观察） ==========
    ACTION rewardadded(const asset& reward);
    ACTION staked(const name& owner, const asset& quantity);
    ACTION withdrawn(const name& owner, const asset& quantity);
    ACTION rewardpaid(const name& owner, const asset& reward);

    using init_action           = eosio::action_wrapper<"init"_n, &unipooldist::init>;
    using notifyreward_action   = eosio::action_wrapper<"notifyreward"_n, &unipooldist::notifyreward>;
    using onhook_action         = eosio::action_wrapper<"onhook"_n, &unipooldist::onhook>;
    using getreward_action      = eosio::action_wrapper<"getreward"_n, &unipooldist::getreward>;
    using rewardadded_action    = eosio::action_wrapper<"rewardadded"_n, &unipooldist::rewardadded>;
    using staked_action         = eosio::action_wrapper<"staked"_n, &unipooldist::staked>;
    using withdrawn_action      = eosio::action_wrapper<"withdrawn"_n, &unipooldist::withdrawn>;
    using rewardpaid_action     = eosio::action_wrapper<"rewardpaid"_n, &unipooldist::rewardpaid>;

private:
    // ========== 累计引擎 ==========
    time_point_sec _last_time_reward_applicable(const time_point_sec& now) const;

    uint128_t _reward_per_unit(const time_point_sec& now) const;

    asset _earned(const staker_t& staker, const uint128_t& reward_per_unit) const;

    /**
     * 每个变更入口的第一步：推进全局累加器，并结算 account 的应得奖励
     * account 为空 name 时只推进全局
     */
    void _checkpoint(const name& account, const time_point_sec& now);

    // ========== 质押账本 ==========
    void _stake(const name& owner, const asset& quantity, const time_point_sec& now);

    void _withdraw(const name& owner, const asset& quantity, const time_point_sec& now);

    asset _staked_of(const name& owner) const;

    void _pay_reward(const name& owner, const time_point_sec& now);

    void _check_initialized() const;

    void _save();

private:
    global_singleton    _global;
    global_t            _gstate;
    pool_singleton      _pool_tbl;
    pool_t              _pool;
};

} // namespace unipool
