#pragma once
#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

namespace unipool {

using namespace eosio;

/**
 * token.distro 对外接口
 * 仅声明其它合约需要内联调用的 action
 */
class [[eosio::contract("token.distro")]] tokendistro : public contract {
public:
    using contract::contract;

    /**
     * 分配方从自身预算中划拨给接收方（进入归属计划）
     * @param distributor 分配方（需持有 distributor 角色）
     * @param recipient   接收方
     * @param amount      数量
     */
    ACTION allocate(const name& distributor, const name& recipient, const asset& amount);

    using allocate_action = eosio::action_wrapper<"allocate"_n, &tokendistro::allocate>;
};

} // namespace unipool
