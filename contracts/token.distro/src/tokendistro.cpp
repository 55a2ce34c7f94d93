#include "tokendistro.hpp"

namespace unipool {

bool tokendistro::_is_distributor(const name& account) {
    auto distributor = distributor_t(account);
    return _db.get(distributor);
}

balance_t tokendistro::_get_balance(const name& owner) {
    auto balance = balance_t(owner);
    if (!_db.get(balance)) {
        balance.allocated   = asset(0, _gstate.total_tokens.symbol);
        balance.claimed     = asset(0, _gstate.total_tokens.symbol);
    }
    return balance;
}

void tokendistro::_check_initialized() const {
    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "contract not initialized");
}

asset tokendistro::_globally_claimable(const time_point_sec& t) const {
    const auto& sym = _gstate.total_tokens.symbol;
    if (t < _gstate.start_time) return asset(0, sym);
    if (t < _gstate.cliff_time) return _gstate.initial_amount;
    if (t > _gstate.end_time)   return _gstate.total_tokens;

    uint128_t since_start = elapsed_seconds(_gstate.start_time, t);
    uint128_t unlocked    = mul_div(since_start, to_u128(_gstate.locked_amount), _gstate.duration);
    return _gstate.initial_amount + asset(to_amount(unlocked, "unlocked"), sym);
}

asset tokendistro::_claimable_of(const balance_t& balance, const time_point_sec& now) const {
    auto unlocked   = _globally_claimable(now);
    uint128_t share = mul_div(to_u128(unlocked), to_u128(balance.allocated), to_u128(_gstate.total_tokens));
    auto amount     = to_amount(safe_sub(share, to_u128(balance.claimed)), "claimable");
    return asset(amount, _gstate.total_tokens.symbol);
}

void tokendistro::init(const name& admin, const asset& total, const time_point_sec& start_time,
                       const uint32_t& start_to_cliff, const uint32_t& start_to_end,
                       const uint16_t& initial_percentage) {
    require_auth(get_self());
    CHECKC(!_gstate.initialized, err::ACTION_REDUNDANT, "already initialized");
    CHECKC(is_account(admin), err::ACCOUNT_INVALID, "invalid admin");
    CHECKC(total.is_valid() && total.amount > 0, err::NOT_POSITIVE, "total must be positive");
    CHECKC(start_to_end > 0, err::PARAM_ERROR, "start_to_end must be positive");
    CHECKC(start_to_cliff <= start_to_end, err::PARAM_ERROR, "cliff must not exceed end");
    CHECKC(initial_percentage <= PERCENT_BOOST, err::PARAM_ERROR, "initial percentage exceeds 10000");

    auto initial = mul_div(to_u128(total), initial_percentage, PERCENT_BOOST);

    _gstate.admin               = admin;
    _gstate.total_tokens        = total;
    _gstate.start_time          = start_time;
    _gstate.cliff_time          = start_time + start_to_cliff;
    _gstate.end_time            = start_time + start_to_end;
    _gstate.duration            = start_to_end;
    _gstate.initial_percentage  = initial_percentage;
    _gstate.initial_amount      = asset(to_amount(initial, "initial amount"), total.symbol);
    _gstate.locked_amount       = total - _gstate.initial_amount;
    _gstate.initialized         = true;
    _global.set(_gstate, get_self());

    auto budget         = _get_balance(get_self());
    budget.allocated    = total;
    budget.updated_at   = time_point_sec(current_time_point());
    _db.set(budget, get_self());
}

void tokendistro::grantrole(const name& account) {
    _check_initialized();
    require_auth(_gstate.admin);
    CHECKC(account != get_self(), err::ACCOUNT_INVALID, "cannot grant role to self");
    CHECKC(is_account(account), err::ACCOUNT_INVALID, "invalid account: " + account.to_string());
    CHECKC(!_is_distributor(account), err::RECORD_EXISTS, "already a distributor: " + account.to_string());

    auto distributor        = distributor_t(account);
    distributor.granted_at  = time_point_sec(current_time_point());
    _db.set(distributor, get_self());
}

void tokendistro::revokerole(const name& account) {
    _check_initialized();
    require_auth(_gstate.admin);

    auto distributor = distributor_t(account);
    CHECKC(_db.get(distributor), err::RECORD_NOT_FOUND, "not a distributor: " + account.to_string());
    _db.del(distributor);
}

void tokendistro::assign(const name& distributor, const asset& amount) {
    _check_initialized();
    require_auth(_gstate.admin);
    CHECKC(_is_distributor(distributor), err::NO_AUTH, "ONLY_TO_DISTRIBUTOR_ROLE");
    CHECKC(amount.symbol == _gstate.total_tokens.symbol, err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(amount.amount > 0, err::NOT_POSITIVE, "amount must be positive");

    auto now    = time_point_sec(current_time_point());
    auto budget = _get_balance(get_self());
    CHECKC(budget.allocated >= amount, err::QUANTITY_INSUFFICIENT, "insufficient unassigned budget");
    budget.allocated    -= amount;
    budget.updated_at   = now;
    _db.set(budget, get_self());

    auto balance        = _get_balance(distributor);
    balance.allocated   += amount;
    balance.updated_at  = now;
    _db.set(balance, get_self());

    assigned_action assigned_act(get_self(), { {get_self(), "active"_n} });
    assigned_act.send(_gstate.admin, distributor, amount);
}

void tokendistro::allocate(const name& distributor, const name& recipient, const asset& amount) {
    _check_initialized();
    require_auth(distributor);
    CHECKC(_is_distributor(distributor), err::NO_AUTH, "ONLY_DISTRIBUTOR_ROLE");
    CHECKC(!_is_distributor(recipient), err::ACCOUNT_INVALID, "DISTRIBUTOR_NOT_VALID_RECIPIENT");
    CHECKC(recipient != get_self(), err::ACCOUNT_INVALID, "cannot allocate to self");
    CHECKC(is_account(recipient), err::ACCOUNT_INVALID, "invalid recipient: " + recipient.to_string());
    CHECKC(amount.symbol == _gstate.total_tokens.symbol, err::SYMBOL_MISMATCH, "symbol mismatch");
    CHECKC(amount.amount > 0, err::NOT_POSITIVE, "amount must be positive");

    auto now    = time_point_sec(current_time_point());
    auto budget = _get_balance(distributor);
    CHECKC(budget.allocated >= amount, err::QUANTITY_INSUFFICIENT, "insufficient distributor budget");
    budget.allocated    -= amount;
    budget.updated_at   = now;
    _db.set(budget, get_self());

    auto balance        = _get_balance(recipient);
    balance.allocated   += amount;
    balance.updated_at  = now;
    _db.set(balance, get_self());

    allocated_action allocated_act(get_self(), { {get_self(), "active"_n} });
    allocated_act.send(distributor, recipient, amount);
}

void tokendistro::claim(const name& account) {
    _check_initialized();
    require_auth(account);
    CHECKC(!_is_distributor(account), err::NO_AUTH, "distributors cannot claim");

    auto now        = time_point_sec(current_time_point());
    auto balance    = _get_balance(account);
    auto amount     = _claimable_of(balance, now);
    CHECKC(amount.amount > 0, err::NOT_POSITIVE, "nothing to claim");

    balance.claimed     += amount;
    balance.updated_at  = now;
    _db.set(balance, get_self());

    claimed_action claimed_act(get_self(), { {get_self(), "active"_n} });
    claimed_act.send(account, amount);
}

asset tokendistro::claimable(const name& account) {
    _check_initialized();
    CHECKC(!_is_distributor(account), err::NO_AUTH, "distributors cannot claim");

    return _claimable_of(_get_balance(account), time_point_sec(current_time_point()));
}

void tokendistro::assigned(const name& admin, const name& distributor, const asset& amount) {
    require_auth(get_self());
}

void tokendistro::allocated(const name& distributor, const name& recipient, const asset& amount) {
    require_auth(get_self());
}

void tokendistro::claimed(const name& account, const asset& amount) {
    require_auth(get_self());
    require_recipient(account);
}

} // namespace unipool
