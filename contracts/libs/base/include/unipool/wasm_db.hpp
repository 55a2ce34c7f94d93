#pragma once

#include <eosio/eosio.hpp>

namespace wasm { namespace db {

using namespace eosio;

/**
 * 以 code 为 scope 的单表读写封装
 * 记录类型需提供 primary_key() 与 idx_t
 */
class dbc {
private:
    name code;

public:
    dbc(const name& code): code(code) {}

    template<typename RecordType>
    bool get(RecordType& record) {
        typename RecordType::idx_t idx(code, code.value);
        auto itr = idx.find(record.primary_key());
        if (itr == idx.end())
            return false;

        record = *itr;
        return true;
    }

    template<typename RecordType>
    void set(const RecordType& record, const name& payer) {
        typename RecordType::idx_t idx(code, code.value);
        auto itr = idx.find(record.primary_key());
        if (itr != idx.end()) {
            idx.modify(itr, same_payer, [&](auto& item) {
                item = record;
            });
            return;
        }

        idx.emplace(payer, [&](auto& item) {
            item = record;
        });
    }

    template<typename RecordType>
    void del(const RecordType& record) {
        typename RecordType::idx_t idx(code, code.value);
        auto itr = idx.find(record.primary_key());
        if (itr != idx.end())
            idx.erase(itr);
    }
};

}}
