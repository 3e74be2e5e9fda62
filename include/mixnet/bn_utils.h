/**
 * BIGNUM 封装
 * Big/Ctx 为带删除器的 unique_ptr；BNUtils 汇总本库用到的大整数运算，
 * OpenSSL 调用失败统一抛 std::runtime_error("BN_xxx failed")。
 * BN_CTX 不可跨线程共享，不带 ctx 的重载每次新建。
 */

#pragma once

#include <openssl/bn.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace mixnet {

struct BNDeleter { void operator()(BIGNUM* bn) const { BN_free(bn); } };
struct CtxDeleter { void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); } };

using Big = std::unique_ptr<BIGNUM, BNDeleter>;
using Ctx = std::unique_ptr<BN_CTX, CtxDeleter>;

class BNUtils {
  public:
    BNUtils() = delete;

    // ---- 构造与转换 ----
    static Big make();
    static Ctx cmake();
    static Big dup(const BIGNUM* src);
    static Big dup(const Big& src);
    static Big from_uint(uint64_t value);

    /**
     * 十六进制串转大整数
     * @throws std::invalid_argument 串为空或含非十六进制字符
     */
    static Big from_hex(const std::string& hex);
    static std::string to_hex(const BIGNUM* bn);
    static std::string to_hex(const Big& bn);

    // @throws std::out_of_range 超过 64 位
    static uint64_t to_uint(const Big& bn);

    // 大端无符号字节
    static Big from_bytes(const uint8_t* data, size_t len);
    static Big from_bytes(const std::vector<uint8_t>& data);
    // 左侧补零到 width 字节，放不下时抛 std::runtime_error
    static std::vector<uint8_t> to_bytes(const Big& x, size_t width);
    static size_t num_bytes(const Big& x);

    // ---- 模运算，结果落在 [0, m) ----
    static Big mod(const Big& x, const Big& m, BN_CTX* ctx);
    static Big mod(const Big& x, const Big& m);
    static Big mod_add(const Big& x, const Big& y, const Big& m, BN_CTX* ctx);
    static Big mod_add(const Big& x, const Big& y, const Big& m);
    static Big mod_sub(const Big& x, const Big& y, const Big& m, BN_CTX* ctx);
    static Big mod_sub(const Big& x, const Big& y, const Big& m);
    static Big mod_mul(const Big& x, const Big& y, const Big& m, BN_CTX* ctx);
    static Big mod_mul(const Big& x, const Big& y, const Big& m);
    static Big mod_exp(const Big& base, const Big& e, const Big& m, BN_CTX* ctx);
    static Big mod_exp(const Big& base, const Big& e, const Big& m);
    static Big sqr(const Big& x, const Big& m, BN_CTX* ctx);

    // 不可逆时抛 std::runtime_error
    static Big mod_inv(const Big& x, const Big& m, BN_CTX* ctx);
    static Big mod_inv(const Big& x, const Big& m);

    // 素数模下的平方根，x 非二次剩余时抛 std::runtime_error
    static Big mod_sqrt(const Big& x, const Big& prime, BN_CTX* ctx);

    // ---- 原地小整数运算 ----
    static void add_word(Big& x, unsigned long w);
    static void sub_word(Big& x, unsigned long w);
    static void rshift1(Big& x);

    // ---- 比较与素性 ----
    static int cmp(const Big& x, const Big& y);
    static bool is_one(const Big& x);
    static bool is_zero(const Big& x);
    static bool is_prime(const Big& x, BN_CTX* ctx);
    // safe 为 true 时生成 p = 2q + 1
    static void generate_prime(Big& out, int bits, bool safe = true);
};

}  // namespace mixnet
