#pragma once

#include <string>
#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>

#include "consts.hpp"

#define CHECK(exp, msg) { if (!(exp)) eosio::check(false, msg); }

#ifndef ASSERT
    #define ASSERT(exp) CHECK(exp, #exp)
#endif

namespace unipool {

inline uint128_t safe_add(uint128_t a, uint128_t b) {
    CHECK(a <= UINT128_MAX_VALUE - b, "overflow exception of add");
    return a + b;
}

inline uint128_t safe_sub(uint128_t a, uint128_t b) {
    CHECK(a >= b, "underflow exception of sub");
    return a - b;
}

inline uint128_t safe_mul(uint128_t a, uint128_t b) {
    if (a == 0 || b == 0) return 0;
    CHECK(a <= UINT128_MAX_VALUE / b, "overflow exception of multiply");
    return a * b;
}

/**
 * @brief a * b / c，向下取整（截断）
 */
inline uint128_t mul_div(uint128_t a, uint128_t b, uint128_t c) {
    CHECK(c != 0, "divide by zero");
    return safe_mul(a, b) / c;
}

/**
 * @brief 收窄到 int64 资产数量，超过 asset::max_amount 即中止
 */
inline int64_t to_amount(uint128_t v, const char* err_title) {
    CHECK(v <= (uint128_t)eosio::asset::max_amount, std::string(err_title) + ": overflow exception of amount");
    return (int64_t)v;
}

inline uint128_t to_u128(const eosio::asset& a) {
    CHECK(a.amount >= 0, "negative asset amount");
    return (uint128_t)a.amount;
}

inline uint32_t elapsed_seconds(const eosio::time_point_sec& from, const eosio::time_point_sec& to) {
    return to > from ? to.sec_since_epoch() - from.sec_since_epoch() : 0;
}

}
