#include "unipooldist.hpp"
#include "token.distro/tokendistro.hpp"

namespace unipool {

time_point_sec unipooldist::_last_time_reward_applicable(const time_point_sec& now) const {
    return now < _pool.period_finish ? now : _pool.period_finish;
}

uint128_t unipooldist::_reward_per_unit(const time_point_sec& now) const {
    if (_pool.total_staked.amount == 0) return _pool.reward_per_unit_stored;

    // 首次注入前 period_finish 为 0，此时区间为负，按 0 处理
    uint32_t elapsed = elapsed_seconds(_pool.last_update_time, _last_time_reward_applicable(now));
    if (elapsed == 0 || _pool.reward_rate == 0) return _pool.reward_per_unit_stored;

    uint128_t emitted = safe_mul(elapsed, (uint128_t)_pool.reward_rate);
    uint128_t delta   = mul_div(emitted, HIGH_PRECISION, to_u128(_pool.total_staked));
    return safe_add(_pool.reward_per_unit_stored, delta);
}

asset unipooldist::_earned(const staker_t& staker, const uint128_t& reward_per_unit) const {
    uint128_t delta  = safe_sub(reward_per_unit, staker.reward_per_unit_paid);
    uint128_t fresh  = mul_div(to_u128(staker.staked), delta, HIGH_PRECISION);
    uint128_t amount = safe_add(fresh, to_u128(staker.owed_reward));
    return asset(to_amount(amount, "earned"), _gstate.reward_symbol);
}

void unipooldist::_checkpoint(const name& account, const time_point_sec& now) {
    _pool.reward_per_unit_stored = _reward_per_unit(now);
    _pool.last_update_time       = _last_time_reward_applicable(now);

    if (account == name()) return;

    staker_t::idx_t stakers(get_self(), get_self().value);
    auto itr = stakers.find(account.value);
    if (itr == stakers.end()) return;   // 尚未质押，_stake 建行时直接对齐累加器

    stakers.modify(itr, same_payer, [&](auto& s) {
        s.owed_reward           = _earned(s, _pool.reward_per_unit_stored);
        s.reward_per_unit_paid  = _pool.reward_per_unit_stored;
        s.updated_at            = now;
    });
}

void unipooldist::_stake(const name& owner, const asset& quantity, const time_point_sec& now) {
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "cannot stake zero");
    CHECKC(quantity.symbol == _gstate.stake_symbol, err::SYMBOL_MISMATCH, "stake symbol mismatch");
    CHECKC(is_account(owner), err::ACCOUNT_INVALID, "invalid account: " + owner.to_string());

    _checkpoint(owner, now);

    staker_t::idx_t stakers(get_self(), get_self().value);
    auto itr = stakers.find(owner.value);
    if (itr == stakers.end()) {
        stakers.emplace(get_self(), [&](auto& s) {
            s.owner                 = owner;
            s.staked                = quantity;
            s.reward_per_unit_paid  = _pool.reward_per_unit_stored;
            s.owed_reward           = asset(0, _gstate.reward_symbol);
            s.created_at            = now;
            s.updated_at            = now;
        });
    } else {
        stakers.modify(itr, same_payer, [&](auto& s) {
            s.staked                += quantity;
            s.updated_at            = now;
        });
    }
    _pool.total_staked += quantity;

    staked_action staked_act(get_self(), { {get_self(), "active"_n} });
    staked_act.send(owner, quantity);
}

void unipooldist::_withdraw(const name& owner, const asset& quantity, const time_point_sec& now) {
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "cannot withdraw zero");
    CHECKC(quantity.symbol == _gstate.stake_symbol, err::SYMBOL_MISMATCH, "stake symbol mismatch");

    _checkpoint(owner, now);

    staker_t::idx_t stakers(get_self(), get_self().value);
    auto itr = stakers.find(owner.value);
    CHECKC(itr != stakers.end() && itr->staked >= quantity, err::QUANTITY_INSUFFICIENT,
           "insufficient staked balance: " + owner.to_string());

    stakers.modify(itr, same_payer, [&](auto& s) {
        s.staked                -= quantity;
        s.updated_at            = now;
    });
    CHECKC(_pool.total_staked >= quantity, err::QUANTITY_INSUFFICIENT, "insufficient total staked");
    _pool.total_staked -= quantity;

    withdrawn_action withdrawn_act(get_self(), { {get_self(), "active"_n} });
    withdrawn_act.send(owner, quantity);
}

asset unipooldist::_staked_of(const name& owner) const {
    staker_t::idx_t stakers(get_self(), get_self().value);
    auto itr = stakers.find(owner.value);
    return itr == stakers.end() ? asset(0, _gstate.stake_symbol) : itr->staked;
}

void unipooldist::_pay_reward(const name& owner, const time_point_sec& now) {
    staker_t::idx_t stakers(get_self(), get_self().value);
    auto itr = stakers.find(owner.value);
    if (itr == stakers.end()) return;

    auto reward = _earned(*itr, _pool.reward_per_unit_stored);
    if (reward.amount <= 0) return;

    stakers.modify(itr, same_payer, [&](auto& s) {
        s.owed_reward.amount    = 0;
        s.reward_per_unit_paid  = _pool.reward_per_unit_stored;
        s.updated_at            = now;
    });
    _pool.total_rewards_paid += reward;

    // 账本拒绝（角色或预算不足）时整笔交易回滚，包括上面的清零
    tokendistro::allocate_action allocate_act(_gstate.token_distro, { {get_self(), "active"_n} });
    allocate_act.send(get_self(), owner, reward);

    rewardpaid_action rewardpaid_act(get_self(), { {get_self(), "active"_n} });
    rewardpaid_act.send(owner, reward);
}

void unipooldist::_check_initialized() const {
    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "contract not initialized");
}

void unipooldist::_save() {
    _global.set(_gstate, get_self());
    _pool_tbl.set(_pool, get_self());
}

void unipooldist::init(const name& owner, const name& reward_distribution, const name& hook_source,
                       const name& token_distro, const symbol& stake_symbol, const symbol& reward_symbol,
                       const uint32_t& duration) {
    require_auth(get_self());
    CHECKC(!_gstate.initialized, err::ACTION_REDUNDANT, "already initialized");
    CHECKC(is_account(owner), err::ACCOUNT_INVALID, "invalid owner");
    CHECKC(is_account(reward_distribution), err::ACCOUNT_INVALID, "invalid reward distribution");
    CHECKC(is_account(hook_source), err::ACCOUNT_INVALID, "invalid hook source");
    CHECKC(is_account(token_distro), err::ACCOUNT_INVALID, "invalid token distro");
    CHECKC(stake_symbol.is_valid() && reward_symbol.is_valid(), err::SYMBOL_MISMATCH, "invalid symbol");
    CHECKC(duration > 0, err::NOT_POSITIVE, "duration must be positive");

    _gstate.owner               = owner;
    _gstate.reward_distribution = reward_distribution;
    _gstate.hook_source         = hook_source;
    _gstate.token_distro        = token_distro;
    _gstate.stake_symbol        = stake_symbol;
    _gstate.reward_symbol       = reward_symbol;
    _gstate.duration            = duration;
    _gstate.initialized         = true;

    _pool                       = pool_t{};
    _pool.total_staked          = asset(0, stake_symbol);
    _pool.total_rewards_added   = asset(0, reward_symbol);
    _pool.total_rewards_paid    = asset(0, reward_symbol);

    _save();
}

void unipooldist::setowner(const name& new_owner) {
    _check_initialized();
    require_auth(_gstate.owner);
    CHECKC(is_account(new_owner), err::ACCOUNT_INVALID, "invalid owner");

    _gstate.owner = new_owner;
    _save();
}

void unipooldist::setrewarddist(const name& distributor) {
    _check_initialized();
    require_auth(_gstate.owner);
    CHECKC(is_account(distributor), err::ACCOUNT_INVALID, "invalid reward distribution");

    _gstate.reward_distribution = distributor;
    _save();
}

void unipooldist::notifyreward(const asset& reward) {
    _check_initialized();
    require_auth(_gstate.reward_distribution);
    CHECKC(reward.symbol == _gstate.reward_symbol, err::SYMBOL_MISMATCH, "reward symbol mismatch");
    CHECKC(reward.amount >= 0, err::NOT_POSITIVE, "reward must not be negative");

    auto now = time_point_sec(current_time_point());
    _checkpoint(name(), now);

    uint128_t amount = to_u128(reward);
    if (now >= _pool.period_finish) {
        _pool.reward_rate = to_amount(amount / _gstate.duration, "reward rate");
    } else {
        uint128_t remaining = elapsed_seconds(now, _pool.period_finish);
        uint128_t leftover  = safe_mul(remaining, (uint128_t)_pool.reward_rate);
        _pool.reward_rate   = to_amount(safe_add(amount, leftover) / _gstate.duration, "reward rate");
    }
    _pool.last_update_time      = now;
    _pool.period_finish         = now + _gstate.duration;
    _pool.total_rewards_added   += reward;

    _save();

    rewardadded_action rewardadded_act(get_self(), { {get_self(), "active"_n} });
    rewardadded_act.send(reward);
}

void unipooldist::onhook(const name& from, const name& to, const asset& quantity) {
    _check_initialized();
    require_auth(_gstate.hook_source);
    CHECKC(from != name() || to != name(), err::PARAM_ERROR, "from and to cannot both be empty");

    auto now = time_point_sec(current_time_point());
    if (from == name()) {
        _stake(to, quantity, now);

    } else if (to == name()) {
        _withdraw(from, quantity, now);
        if (_staked_of(from).amount == 0)
            _pay_reward(from, now);

    } else {
        _withdraw(from, quantity, now);
        _stake(to, quantity, now);
    }

    _save();
}

void unipooldist::getreward(const name& owner) {
    _check_initialized();
    require_auth(owner);

    auto now = time_point_sec(current_time_point());
    _checkpoint(owner, now);
    _pay_reward(owner, now);

    _save();
}

asset unipooldist::earned(const name& owner) {
    _check_initialized();

    staker_t::idx_t stakers(get_self(), get_self().value);
    auto itr = stakers.find(owner.value);
    if (itr == stakers.end()) return asset(0, _gstate.reward_symbol);

    return _earned(*itr, _reward_per_unit(time_point_sec(current_time_point())));
}

uint128_t unipooldist::rewardperunit() {
    _check_initialized();
    return _reward_per_unit(time_point_sec(current_time_point()));
}

time_point_sec unipooldist::lasttimeapp() {
    _check_initialized();
    return _last_time_reward_applicable(time_point_sec(current_time_point()));
}

void unipooldist::rewardadded(const asset& reward) {
    require_auth(get_self());
}

void unipooldist::staked(const name& owner, const asset& quantity) {
    require_auth(get_self());
}

void unipooldist::withdrawn(const name& owner, const asset& quantity) {
    require_auth(get_self());
}

void unipooldist::rewardpaid(const name& owner, const asset& reward) {
    require_auth(get_self());
}

} // namespace unipool
