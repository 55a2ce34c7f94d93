#pragma once
#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

namespace unipool {

using namespace eosio;

/**
 * unipool.dist 对外接口
 * 包装代币的铸造/销毁/转账通过 onhook 通知奖励池
 */
class [[eosio::contract("unipool.dist")]] unipooldist : public contract {
public:
    using contract::contract;

    /**
     * @param from     空 name 表示铸造
     * @param to       空 name 表示销毁
     * @param quantity 变动数量（质押凭证币）
     */
    ACTION onhook(const name& from, const name& to, const asset& quantity);

    using onhook_action = eosio::action_wrapper<"onhook"_n, &unipooldist::onhook>;
};

} // namespace unipool
