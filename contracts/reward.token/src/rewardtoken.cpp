#include "rewardtoken.hpp"
#include "unipool.dist/unipooldist.hpp"
#include "token.distro/tokendistro.hpp"

namespace unipool {

void rewardtoken::_check_initialized() const {
    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "contract not initialized");
}

void rewardtoken::_add_balance(const name& owner, const asset& value) {
    auto account = account_t(owner);
    if (!_db.get(account))
        account.balance = asset(0, value.symbol);

    account.balance += value;
    _db.set(account, get_self());
}

void rewardtoken::_sub_balance(const name& owner, const asset& value) {
    auto account = account_t(owner);
    CHECKC(_db.get(account) && account.balance >= value, err::QUANTITY_INSUFFICIENT, "overdrawn balance");

    account.balance -= value;
    _db.set(account, get_self());
}

void rewardtoken::init(const name& minter, const name& staker, const name& token_distro,
                       const name& reward_pool, const symbol& stake_symbol, const symbol& reward_symbol) {
    require_auth(get_self());
    CHECKC(!_gstate.initialized, err::ACTION_REDUNDANT, "already initialized");
    CHECKC(is_account(minter), err::ACCOUNT_INVALID, "invalid minter");
    CHECKC(is_account(staker), err::ACCOUNT_INVALID, "invalid staker");
    CHECKC(is_account(token_distro), err::ACCOUNT_INVALID, "invalid token distro");
    CHECKC(is_account(reward_pool), err::ACCOUNT_INVALID, "invalid reward pool");
    CHECKC(stake_symbol.is_valid() && reward_symbol.is_valid(), err::SYMBOL_MISMATCH, "invalid symbol");
    CHECKC(stake_symbol.precision() == reward_symbol.precision(), err::SYMBOL_MISMATCH, "symbol precision mismatch");

    _gstate.minter          = minter;
    _gstate.staker          = staker;
    _gstate.token_distro    = token_distro;
    _gstate.reward_pool     = reward_pool;
    _gstate.stake_symbol    = stake_symbol;
    _gstate.reward_symbol   = reward_symbol;
    _gstate.initialized     = true;
    _global.set(_gstate, get_self());

    _stat.set(stat_t{ asset(0, stake_symbol) }, get_self());
}

void rewardtoken::mint(const name& to, const asset& quantity) {
    _check_initialized();
    require_auth(_gstate.minter);
    CHECKC(to == _gstate.staker, err::NO_AUTH, "ONLY_TO_STAKER");
    CHECKC(quantity.symbol == _gstate.stake_symbol, err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "must mint positive quantity");

    auto stat = _stat.get();
    stat.supply += quantity;
    _stat.set(stat, get_self());

    _add_balance(to, quantity);

    unipooldist::onhook_action onhook_act(_gstate.reward_pool, { {get_self(), "active"_n} });
    onhook_act.send(name(), to, quantity);
}

void rewardtoken::transfer(const name& from, const name& to, const asset& quantity, const string& memo) {
    _check_initialized();
    require_auth(from);
    CHECKC(from == _gstate.staker, err::NO_AUTH, "ONLY_STAKER");
    CHECKC(from != to, err::ACCOUNT_INVALID, "cannot transfer to self");
    CHECKC(is_account(to), err::ACCOUNT_INVALID, "to account does not exist");
    CHECKC(quantity.symbol == _gstate.stake_symbol, err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(quantity.amount > 0, err::NOT_POSITIVE, "must transfer positive quantity");
    CHECKC(memo.size() <= MAX_MEMO_SIZE, err::INVALID_FORMAT, "memo has more than 256 bytes");

    require_recipient(from);
    require_recipient(to);

    _sub_balance(from, quantity);

    auto stat = _stat.get();
    stat.supply -= quantity;
    _stat.set(stat, get_self());

    // 销毁形态通知奖励池：from 取回质押
    unipooldist::onhook_action onhook_act(_gstate.reward_pool, { {get_self(), "active"_n} });
    onhook_act.send(from, name(), quantity);

    auto reward = asset(quantity.amount, _gstate.reward_symbol);
    tokendistro::allocate_action allocate_act(_gstate.token_distro, { {get_self(), "active"_n} });
    allocate_act.send(get_self(), to, reward);

    rewardpaid_action rewardpaid_act(get_self(), { {get_self(), "active"_n} });
    rewardpaid_act.send(to, reward);
}

void rewardtoken::rewardpaid(const name& owner, const asset& reward) {
    require_auth(get_self());
}

} // namespace unipool
