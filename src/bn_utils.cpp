#include "mixnet/bn_utils.h"

#include <openssl/crypto.h>

namespace mixnet {

// ---- 构造与转换 ----

Big BNUtils::make() {
    Big bn(BN_new());
    if (!bn) throw std::runtime_error("BN_new failed");
    return bn;
}

Ctx BNUtils::cmake() {
    Ctx ctx(BN_CTX_new());
    if (!ctx) throw std::runtime_error("BN_CTX_new failed");
    return ctx;
}

Big BNUtils::dup(const BIGNUM* src) {
    Big bn(BN_dup(src));
    if (!bn) throw std::runtime_error("BN_dup failed");
    return bn;
}

Big BNUtils::dup(const Big& src) { return dup(src.get()); }

Big BNUtils::from_uint(uint64_t value) {
    Big bn = make();
    if (!BN_set_word(bn.get(), value)) throw std::runtime_error("BN_set_word failed");
    return bn;
}

// BN_hex2bn 返回消耗的字符数，必须恰好是整个串
Big BNUtils::from_hex(const std::string& hex) {
    BIGNUM* raw = nullptr;
    int used = BN_hex2bn(&raw, hex.c_str());
    Big bn(raw);
    if (used == 0 || static_cast<size_t>(used) != hex.size())
        throw std::invalid_argument("invalid hex: " + hex);
    return bn;
}

std::string BNUtils::to_hex(const BIGNUM* bn) {
    char* hex = BN_bn2hex(bn);
    if (!hex) throw std::runtime_error("BN_bn2hex failed");
    std::string out(hex);
    OPENSSL_free(hex);
    return out;
}

std::string BNUtils::to_hex(const Big& bn) { return to_hex(bn.get()); }

// 超出 64 位时 BN_get_word 返回全 1，先检查位数
uint64_t BNUtils::to_uint(const Big& bn) {
    if (BN_num_bits(bn.get()) > 64) throw std::out_of_range("BIGNUM does not fit in 64 bits");
    return BN_get_word(bn.get());
}

Big BNUtils::from_bytes(const uint8_t* data, size_t len) {
    Big bn = make();
    if (!BN_bin2bn(data, static_cast<int>(len), bn.get())) throw std::runtime_error("BN_bin2bn failed");
    return bn;
}

Big BNUtils::from_bytes(const std::vector<uint8_t>& data) { return from_bytes(data.data(), data.size()); }

std::vector<uint8_t> BNUtils::to_bytes(const Big& x, size_t width) {
    std::vector<uint8_t> buf(width);
    if (BN_bn2binpad(x.get(), buf.data(), static_cast<int>(width)) < 0)
        throw std::runtime_error("BN_bn2binpad failed");
    return buf;
}

size_t BNUtils::num_bytes(const Big& x) { return static_cast<size_t>(BN_num_bytes(x.get())); }

// ---- 模运算 ----

Big BNUtils::mod(const Big& x, const Big& m, BN_CTX* ctx) {
    Big r = make();
    if (!BN_nnmod(r.get(), x.get(), m.get(), ctx)) throw std::runtime_error("BN_nnmod failed");
    return r;
}

Big BNUtils::mod(const Big& x, const Big& m) {
    auto ctx = cmake();
    return mod(x, m, ctx.get());
}

Big BNUtils::mod_add(const Big& x, const Big& y, const Big& m, BN_CTX* ctx) {
    Big r = make();
    if (!BN_mod_add(r.get(), x.get(), y.get(), m.get(), ctx)) throw std::runtime_error("BN_mod_add failed");
    return r;
}

Big BNUtils::mod_add(const Big& x, const Big& y, const Big& m) {
    auto ctx = cmake();
    return mod_add(x, y, m, ctx.get());
}

Big BNUtils::mod_sub(const Big& x, const Big& y, const Big& m, BN_CTX* ctx) {
    Big r = make();
    if (!BN_mod_sub(r.get(), x.get(), y.get(), m.get(), ctx)) throw std::runtime_error("BN_mod_sub failed");
    return r;
}

Big BNUtils::mod_sub(const Big& x, const Big& y, const Big& m) {
    auto ctx = cmake();
    return mod_sub(x, y, m, ctx.get());
}

Big BNUtils::mod_mul(const Big& x, const Big& y, const Big& m, BN_CTX* ctx) {
    Big r = make();
    if (!BN_mod_mul(r.get(), x.get(), y.get(), m.get(), ctx)) throw std::runtime_error("BN_mod_mul failed");
    return r;
}

Big BNUtils::mod_mul(const Big& x, const Big& y, const Big& m) {
    auto ctx = cmake();
    return mod_mul(x, y, m, ctx.get());
}

Big BNUtils::mod_exp(const Big& base, const Big& e, const Big& m, BN_CTX* ctx) {
    Big r = make();
    if (!BN_mod_exp(r.get(), base.get(), e.get(), m.get(), ctx)) throw std::runtime_error("BN_mod_exp failed");
    return r;
}

Big BNUtils::mod_exp(const Big& base, const Big& e, const Big& m) {
    auto ctx = cmake();
    return mod_exp(base, e, m, ctx.get());
}

Big BNUtils::sqr(const Big& x, const Big& m, BN_CTX* ctx) {
    Big r = make();
    if (!BN_mod_sqr(r.get(), x.get(), m.get(), ctx)) throw std::runtime_error("BN_mod_sqr failed");
    return r;
}

Big BNUtils::mod_inv(const Big& x, const Big& m, BN_CTX* ctx) {
    Big r = make();
    if (!BN_mod_inverse(r.get(), x.get(), m.get(), ctx)) throw std::runtime_error("BN_mod_inverse failed");
    return r;
}

Big BNUtils::mod_inv(const Big& x, const Big& m) {
    auto ctx = cmake();
    return mod_inv(x, m, ctx.get());
}

Big BNUtils::mod_sqrt(const Big& x, const Big& prime, BN_CTX* ctx) {
    Big r(BN_mod_sqrt(nullptr, x.get(), prime.get(), ctx));
    if (!r) throw std::runtime_error("BN_mod_sqrt failed");
    return r;
}

// ---- 原地小整数运算 ----

void BNUtils::add_word(Big& x, unsigned long w) {
    if (!BN_add_word(x.get(), w)) throw std::runtime_error("BN_add_word failed");
}

void BNUtils::sub_word(Big& x, unsigned long w) {
    if (!BN_sub_word(x.get(), w)) throw std::runtime_error("BN_sub_word failed");
}

void BNUtils::rshift1(Big& x) {
    if (!BN_rshift1(x.get(), x.get())) throw std::runtime_error("BN_rshift1 failed");
}

// ---- 比较与素性 ----

int BNUtils::cmp(const Big& x, const Big& y) { return BN_cmp(x.get(), y.get()); }

bool BNUtils::is_one(const Big& x) { return BN_is_one(x.get()); }

bool BNUtils::is_zero(const Big& x) { return BN_is_zero(x.get()); }

bool BNUtils::is_prime(const Big& x, BN_CTX* ctx) {
    int r = BN_check_prime(x.get(), ctx, nullptr);
    if (r < 0) throw std::runtime_error("BN_check_prime failed");
    return r == 1;
}

void BNUtils::generate_prime(Big& out, int bits, bool safe) {
    if (!BN_generate_prime_ex(out.get(), bits, safe ? 1 : 0, nullptr, nullptr, nullptr))
        throw std::runtime_error("BN_generate_prime_ex failed");
}

}  // namespace mixnet
