#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/action.hpp>
#include <unipool/utils.hpp>

#include "tokendistrodb.hpp"

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

enum class err: uint8_t {
   INVALID_FORMAT        = 0,
   QUANTITY_INSUFFICIENT = 3,
   NOT_POSITIVE          = 4,
   SYMBOL_MISMATCH       = 5,
   RECORD_NOT_FOUND      = 8,
   RECORD_EXISTS         = 9,
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
 * 合约：tokendistro
 * 功能：带锁定期的线性归属分配账本
 * 说明：
 *   - init 时合约自身持有全部 total_tokens 作为未分派预算
 *   - admin 授予 distributor 角色并 assign 预算
 *   - distributor 调用 allocate 将预算记入接收方名下，按归属计划解锁
 */
class [[eosio::contract("token.distro")]] tokendistro : public contract {
public:
    using contract::contract;

    tokendistro(name receiver, name code, datastream<const char*> ds)
    : contract(receiver, code, ds),
      _global(get_self(), get_self().value),
      _db(get_self())
    {
        _gstate = _global.exists() ? _global.get() : global_t{};
    }

    /**
     * 初始化（仅一次）
     * @param admin              管理员
     * @param total              归属计划总量
     * @param start_time         开始时间
     * @param start_to_cliff     开始到锁定期结束（秒）
     * @param start_to_end       开始到全部解锁（秒）
     * @param initial_percentage 锁定期内可领比例（基点，<= 10000）
     */
    ACTION init(const name& admin, const asset& total, const time_point_sec& start_time,
                const uint32_t& start_to_cliff, const uint32_t& start_to_end,
                const uint16_t& initial_percentage);

    ACTION grantrole(const name& account);

    ACTION revokerole(const name& account);

    /**
     * 管理员从合约预算中划拨给分配方
     */
    ACTION assign(const name& distributor, const asset& amount);

    /**
     * 分配方从自身预算中记入接收方名下
     */
    ACTION allocate(const name& distributor, const name& recipient, const asset& amount);

    /**
     * 记录领取（实际代币由托管方监听通知后发放）
     */
    ACTION claim(const name& account);

    [[eosio::action, eosio::read_only]]
    asset claimable(const name& account);

    ACTION assigned(const name& admin, const name& distributor, const asset& amount);
    ACTION allocated(const name& distributor, const name& recipient, const asset& amount);
    ACTION claimed(const name& account, const asset& amount);

    using allocate_action   = eosio::action_wrapper<"allocate"_n, &tokendistro::allocate>;
    using assigned_action   = eosio::action_wrapper<"assigned"_n, &tokendistro::assigned>;
    using allocated_action  = eosio::action_wrapper<"allocated"_n, &tokendistro::allocated>;
    using claimed_action    = eosio::action_wrapper<"claimed"_n, &tokendistro::claimed>;

private:
    bool _is_distributor(const name& account);

    /**
     * 时刻 t 全局已解锁量
     */
    asset _globally_claimable(const time_point_sec& t) const;

    asset _claimable_of(const balance_t& balance, const time_point_sec& now) const;

    balance_t _get_balance(const name& owner);

    void _check_initialized() const;

private:
    global_singleton    _global;
    global_t            _gstate;
    dbc                 _db;
};

} // namespace unipool
