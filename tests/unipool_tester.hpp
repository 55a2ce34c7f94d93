#pragma once

#include <boost/test/unit_test.hpp>
#include <eosio/testing/tester.hpp>
#include <eosio/chain/abi_serializer.hpp>
#include <eosio/chain/account_object.hpp>
#include <fc/variant_object.hpp>
#include <fc/io/raw.hpp>

#include <algorithm>
#include <cstring>
#include <map>

#include <contracts.hpp>

using namespace eosio::testing;
using namespace eosio;
using namespace eosio::chain;
using namespace fc;
using namespace std;

using mvo = fc::mutable_variant_object;
using uint128 = unsigned __int128;

static constexpr account_name POOL        = "unipool.dist"_n;
static constexpr account_name DISTRO      = "token.distro"_n;
static constexpr account_name GATE        = "reward.token"_n;

static constexpr account_name OWNER       = "owner"_n;
static constexpr account_name NOTIFIER    = "notifier"_n;
static constexpr account_name HOOKER      = "hooker"_n;
static constexpr account_name ADMIN       = "admin"_n;
static constexpr account_name MINTER      = "minter"_n;
static constexpr account_name STAKER      = "staker"_n;

static constexpr account_name alice       = "alice"_n;
static constexpr account_name bob         = "bob"_n;
static constexpr account_name carol       = "carol"_n;
static constexpr account_name dave        = "dave"_n;

static const symbol GIV = symbol(8, "GIV");
static const symbol GUR = symbol(8, "GUR");

inline asset giv(int64_t amount) { return asset(amount, GIV); }
inline asset gur(int64_t amount) { return asset(amount, GUR); }

/**
 * Mirror of the on-chain accrual math, driven with the same block seconds the
 * contract sees, so expected entitlements can be compared to the unit.
 */
struct pool_model {
   static constexpr uint128 SCALE = 1'000'000'000'000'000'000ULL;

   struct participant {
      int64_t  staked = 0;
      uint128  paid   = 0;
      int64_t  owed   = 0;
   };

   uint32_t                     duration     = 0;
   uint128                      stored       = 0;
   uint32_t                     last_update  = 0;
   int64_t                      rate         = 0;
   uint32_t                     finish       = 0;
   int64_t                      total        = 0;
   std::map<name, participant>  stakers;

   uint32_t applicable(uint32_t now) const { return std::min(now, finish); }

   uint128 per_unit(uint32_t now) const {
      if (total == 0) return stored;
      uint32_t to = applicable(now);
      if (to <= last_update) return stored;
      return stored + uint128(to - last_update) * uint128(rate) * SCALE / uint128(total);
   }

   int64_t earned(name who, uint32_t now) const {
      auto itr = stakers.find(who);
      if (itr == stakers.end()) return 0;
      const auto& p = itr->second;
      return int64_t(uint128(p.staked) * (per_unit(now) - p.paid) / SCALE) + p.owed;
   }

   void checkpoint(name who, uint32_t now) {
      stored      = per_unit(now);
      last_update = applicable(now);
      auto itr = stakers.find(who);
      if (itr == stakers.end()) return;
      itr->second.owed = earned(who, now);
      itr->second.paid = stored;
   }

   void stake(name who, int64_t amount, uint32_t now) {
      checkpoint(who, now);
      auto itr = stakers.find(who);
      if (itr == stakers.end())
         itr = stakers.emplace(who, participant{ 0, stored, 0 }).first;
      itr->second.staked += amount;
      total += amount;
   }

   void withdraw(name who, int64_t amount, uint32_t now) {
      checkpoint(who, now);
      stakers[who].staked -= amount;
      total -= amount;
   }

   void notify(int64_t amount, uint32_t now) {
      checkpoint(name(), now);
      if (now >= finish) {
         rate = amount / duration;
      } else {
         uint128 leftover = uint128(finish - now) * uint128(rate);
         rate = int64_t((uint128(amount) + leftover) / duration);
      }
      last_update = now;
      finish      = now + duration;
   }

   int64_t pay(name who, uint32_t now) {
      auto r = earned(who, now);
      if (r <= 0) return 0;
      auto& p = stakers[who];
      p.owed = 0;
      p.paid = stored;
      return r;
   }

   int64_t getreward(name who, uint32_t now) {
      checkpoint(who, now);
      return pay(who, now);
   }

   int64_t burn(name who, int64_t amount, uint32_t now) {
      withdraw(who, amount, now);
      return stakers[who].staked == 0 ? pay(who, now) : 0;
   }

   void transfer(name from, name to, int64_t amount, uint32_t now) {
      withdraw(from, amount, now);
      stake(to, amount, now);
   }
};

class unipool_tester : public tester {
public:
   unipool_tester() {
      produce_blocks(2);

      create_accounts({ POOL, DISTRO, GATE, OWNER, NOTIFIER, HOOKER, ADMIN, MINTER, STAKER,
                        alice, bob, carol, dave });
      produce_blocks(2);

      deploy(POOL,   contracts::unipool_dist_wasm(), contracts::unipool_dist_abi(), pool_abi);
      deploy(DISTRO, contracts::token_distro_wasm(), contracts::token_distro_abi(), distro_abi);
      deploy(GATE,   contracts::reward_token_wasm(), contracts::reward_token_abi(), gate_abi);
   }

   void deploy(name account, const std::vector<uint8_t>& wasm, const std::vector<char>& abi_json, abi_serializer& ser) {
      set_code(account, wasm);
      set_abi(account, abi_json.data());
      produce_blocks();

      const auto& accnt = control->db().get<account_object, by_name>(account);
      abi_def abi;
      BOOST_REQUIRE_EQUAL(abi_serializer::to_abi(accnt.abi, abi), true);
      ser.set_abi(abi, abi_serializer::create_yield_function(abi_serializer_max_time));
   }

   // ---------------------------------------------------------------------
   // push helpers
   // ---------------------------------------------------------------------

   // distinct expirations keep identical actions in the same block from being
   // rejected as duplicate transactions
   uint32_t next_expiration() { return DEFAULT_EXPIRATION_DELTA + (++expiration_bump % 1000); }

   action_result push(name code, name signer, name act, const variant_object& data) {
      try {
         base_tester::push_action(code, act, signer, data, next_expiration());
      } catch (const fc::exception& ex) {
         return error(ex.top_message());
      }
      return success();
   }

   transaction_trace_ptr push_trace(name code, name signer, name act, const variant_object& data) {
      auto trace = base_tester::push_action(code, act, signer, data, next_expiration());
      BOOST_REQUIRE(trace);
      BOOST_REQUIRE(!trace->except);
      return trace;
   }

   const action_trace* find_action(const transaction_trace_ptr& trace, name code, name act) const {
      for (const auto& at : trace->action_traces) {
         if (at.receiver == code && at.act.account == code && at.act.name == act)
            return &at;
      }
      return nullptr;
   }

   size_t count_actions(const transaction_trace_ptr& trace, name code, name act) const {
      return std::count_if(trace->action_traces.begin(), trace->action_traces.end(), [&](const action_trace& at) {
         return at.receiver == code && at.act.account == code && at.act.name == act;
      });
   }

   fc::variant action_data(const abi_serializer& ser, const action_trace& at) const {
      return ser.binary_to_variant(ser.get_action_type(at.act.name), at.act.data,
                                   abi_serializer::create_yield_function(abi_serializer_max_time));
   }

   const action_trace& return_trace(const transaction_trace_ptr& trace, name code, name act) const {
      auto at = find_action(trace, code, act);
      BOOST_REQUIRE(at != nullptr);
      BOOST_REQUIRE(!at->return_value.empty());
      return *at;
   }

   // ---------------------------------------------------------------------
   // time
   // ---------------------------------------------------------------------

   uint32_t now_sec() const {
      return fc::time_point_sec(control->pending_block_time()).sec_since_epoch();
   }

   // seals the pending block at its own time, then moves the pending block to `sec`
   void skip_to(uint32_t sec) {
      produce_block();
      auto target = fc::time_point(fc::seconds(sec));
      BOOST_REQUIRE(control->pending_block_time() <= target);
      if (control->pending_block_time() < target)
         produce_block(target - control->head_block_time() - fc::milliseconds(config::block_interval_ms));
      BOOST_REQUIRE(control->pending_block_time() == target);
   }

   void skip(uint32_t secs) { skip_to(now_sec() + secs); }

   // ---------------------------------------------------------------------
   // unipool.dist
   // ---------------------------------------------------------------------

   action_result pool_init(uint32_t duration, name hook_source = HOOKER) {
      auto r = push(POOL, POOL, "init"_n, mvo()
         ("owner", OWNER)
         ("reward_distribution", NOTIFIER)
         ("hook_source", hook_source)
         ("token_distro", DISTRO)
         ("stake_symbol", GUR)
         ("reward_symbol", GIV)
         ("duration", duration));
      if (r == success())
         model.duration = duration;
      return r;
   }

   action_result notify(const asset& reward, name signer = NOTIFIER) {
      auto now = now_sec();
      auto r = push(POOL, signer, "notifyreward"_n, mvo()("reward", reward));
      if (r == success())
         model.notify(reward.get_amount(), now);
      return r;
   }

   action_result hook(name from, name to, const asset& quantity, name signer = HOOKER) {
      auto now = now_sec();
      auto r = push(POOL, signer, "onhook"_n, mvo()("from", from)("to", to)("quantity", quantity));
      if (r == success()) {
         if (from == name())
            model.stake(to, quantity.get_amount(), now);
         else if (to == name())
            last_paid = model.burn(from, quantity.get_amount(), now);
         else
            model.transfer(from, to, quantity.get_amount(), now);
      }
      return r;
   }

   action_result stake(name owner, const asset& q)    { return hook(name(), owner, q); }
   action_result withdraw(name owner, const asset& q) { return hook(owner, name(), q); }

   transaction_trace_ptr getreward_trace(name owner) {
      auto now = now_sec();
      auto trace = push_trace(POOL, owner, "getreward"_n, mvo()("owner", owner));
      last_paid = model.getreward(owner, now);
      return trace;
   }

   action_result getreward(name owner, name signer) {
      return push(POOL, signer, "getreward"_n, mvo()("owner", owner));
   }

   action_result setrewarddist(name distributor, name signer) {
      return push(POOL, signer, "setrewarddist"_n, mvo()("distributor", distributor));
   }

   action_result setowner(name new_owner, name signer) {
      return push(POOL, signer, "setowner"_n, mvo()("new_owner", new_owner));
   }

   asset earned(name owner) {
      auto trace = push_trace(POOL, owner, "earned"_n, mvo()("owner", owner));
      return fc::raw::unpack<asset>(return_trace(trace, POOL, "earned"_n).return_value);
   }

   uint128 reward_per_unit() {
      auto trace = push_trace(POOL, alice, "rewardperunit"_n, mvo());
      const auto& rv = return_trace(trace, POOL, "rewardperunit"_n).return_value;
      BOOST_REQUIRE_EQUAL(rv.size(), sizeof(uint128));
      uint128 v = 0;
      std::memcpy(&v, rv.data(), sizeof(v));
      return v;
   }

   fc::time_point_sec last_time_applicable() {
      auto trace = push_trace(POOL, alice, "lasttimeapp"_n, mvo());
      return fc::raw::unpack<fc::time_point_sec>(return_trace(trace, POOL, "lasttimeapp"_n).return_value);
   }

   fc::variant get_pool() {
      auto data = get_row_by_account(POOL, POOL, "pool"_n, "pool"_n);
      return data.empty() ? fc::variant() : pool_abi.binary_to_variant("pool_t", data,
                                               abi_serializer::create_yield_function(abi_serializer_max_time));
   }

   fc::variant get_staker(name owner) {
      auto data = get_row_by_account(POOL, POOL, "stakers"_n, owner);
      return data.empty() ? fc::variant() : pool_abi.binary_to_variant("staker_t", data,
                                               abi_serializer::create_yield_function(abi_serializer_max_time));
   }

   asset staked_of(name owner) {
      auto row = get_staker(owner);
      return row.is_null() ? gur(0) : row["staked"].as<asset>();
   }

   asset total_staked() { return get_pool()["total_staked"].as<asset>(); }

   // ---------------------------------------------------------------------
   // token.distro
   // ---------------------------------------------------------------------

   action_result distro_init(const asset& total, uint32_t start_time, uint32_t start_to_cliff,
                             uint32_t start_to_end, uint16_t initial_percentage) {
      return push(DISTRO, DISTRO, "init"_n, mvo()
         ("admin", ADMIN)
         ("total", total)
         ("start_time", fc::time_point_sec(start_time))
         ("start_to_cliff", start_to_cliff)
         ("start_to_end", start_to_end)
         ("initial_percentage", initial_percentage));
   }

   action_result grantrole(name account, name signer = ADMIN) {
      return push(DISTRO, signer, "grantrole"_n, mvo()("account", account));
   }

   action_result revokerole(name account, name signer = ADMIN) {
      return push(DISTRO, signer, "revokerole"_n, mvo()("account", account));
   }

   action_result assign(name distributor, const asset& amount, name signer = ADMIN) {
      return push(DISTRO, signer, "assign"_n, mvo()("distributor", distributor)("amount", amount));
   }

   action_result allocate(name distributor, name recipient, const asset& amount) {
      return push(DISTRO, distributor, "allocate"_n, mvo()
         ("distributor", distributor)("recipient", recipient)("amount", amount));
   }

   action_result claim(name account) {
      return push(DISTRO, account, "claim"_n, mvo()("account", account));
   }

   asset claimable(name account) {
      auto trace = push_trace(DISTRO, alice, "claimable"_n, mvo()("account", account));
      return fc::raw::unpack<asset>(return_trace(trace, DISTRO, "claimable"_n).return_value);
   }

   fc::variant get_distro_balance(name owner) {
      auto data = get_row_by_account(DISTRO, DISTRO, "balances"_n, owner);
      return data.empty() ? fc::variant() : distro_abi.binary_to_variant("balance_t", data,
                                               abi_serializer::create_yield_function(abi_serializer_max_time));
   }

   asset allocated_of(name owner) {
      auto row = get_distro_balance(owner);
      return row.is_null() ? giv(0) : row["allocated"].as<asset>();
   }

   // ---------------------------------------------------------------------
   // reward.token
   // ---------------------------------------------------------------------

   action_result gate_init() {
      return push(GATE, GATE, "init"_n, mvo()
         ("minter", MINTER)
         ("staker", STAKER)
         ("token_distro", DISTRO)
         ("reward_pool", POOL)
         ("stake_symbol", GUR)
         ("reward_symbol", GIV));
   }

   action_result mint(name to, const asset& quantity, name signer = MINTER) {
      auto now = now_sec();
      auto r = push(GATE, signer, "mint"_n, mvo()("to", to)("quantity", quantity));
      if (r == success())
         model.stake(to, quantity.get_amount(), now);
      return r;
   }

   action_result transfer(name from, name to, const asset& quantity, const std::string& memo = "",
                          name signer = name()) {
      auto now = now_sec();
      auto r = push(GATE, signer == name() ? from : signer, "transfer"_n, mvo()
         ("from", from)("to", to)("quantity", quantity)("memo", memo));
      if (r == success())
         last_paid = model.burn(from, quantity.get_amount(), now);
      return r;
   }

   transaction_trace_ptr transfer_trace(name from, name to, const asset& quantity) {
      auto now = now_sec();
      auto trace = push_trace(GATE, from, "transfer"_n, mvo()
         ("from", from)("to", to)("quantity", quantity)("memo", ""));
      last_paid = model.burn(from, quantity.get_amount(), now);
      return trace;
   }

   asset gate_balance(name owner) {
      auto data = get_row_by_account(GATE, GATE, "accounts"_n, owner);
      if (data.empty()) return gur(0);
      return gate_abi.binary_to_variant("account_t", data,
                abi_serializer::create_yield_function(abi_serializer_max_time))["balance"].as<asset>();
   }

   asset gate_supply() {
      auto data = get_row_by_account(GATE, GATE, "stat"_n, "stat"_n);
      BOOST_REQUIRE(!data.empty());
      return gate_abi.binary_to_variant("stat_t", data,
                abi_serializer::create_yield_function(abi_serializer_max_time))["supply"].as<asset>();
   }

   abi_serializer  pool_abi;
   abi_serializer  distro_abi;
   abi_serializer  gate_abi;
   pool_model      model;
   int64_t         last_paid = 0;

private:
   uint32_t        expiration_bump = 0;
};
