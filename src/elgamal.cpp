#include "mixnet/elgamal.h"

#include "mixnet/errors.h"

#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace mixnet {

namespace {

void ensure_nonce(const GroupParams& params, const Big& r) {
    if (!params.is_scalar(r) || BNUtils::is_zero(r))
        throw std::invalid_argument("randomness must lie in [1, q-1]");
}

std::string element_key(const GroupParams& params, const Big& x) {
    auto bytes = BNUtils::to_bytes(x, params.element_bytes());
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace

std::vector<Ciphertext> clone_all(const std::vector<Ciphertext>& cts) {
    std::vector<Ciphertext> out;
    out.reserve(cts.size());
    for (const auto& ct : cts) out.push_back(ct.clone());
    return out;
}

KeyPair ElGamal::generate_keypair(const GroupParams& params, RandomSource& rng) {
    SecretKey sk(params.random_exponent(rng));
    auto pk = derive_public_key(params, sk);
    return KeyPair(std::move(pk), std::move(sk));
}

PublicKey ElGamal::derive_public_key(const GroupParams& params, const SecretKey& sk) {
    if (!params.is_scalar(sk.x) || BNUtils::is_zero(sk.x))
        throw std::invalid_argument("secret key must lie in [1, q-1]");
    return PublicKey(params.pow_g(sk.x));
}

Ciphertext ElGamal::encrypt(const GroupParams& params, const PublicKey& pk, const Big& m,
                            RandomSource& rng) {
    return encrypt_with_witness(params, pk, m, rng).first;
}

Ciphertext ElGamal::encrypt(const GroupParams& params, const PublicKey& pk, const Big& m, const Big& r) {
    ensure_valid(params, pk);
    params.ensure_member(m, "plaintext");
    ensure_nonce(params, r);

    auto ctx = BNUtils::cmake();
    // c1 = g^r
    auto c1 = params.modpow(params.g, r, ctx.get());
    // c2 = m * h^r
    auto h_r = params.modpow(pk.h, r, ctx.get());
    auto c2 = params.mul_mod(m, h_r, ctx.get());
    return Ciphertext(std::move(c1), std::move(c2));
}

std::pair<Ciphertext, Big> ElGamal::encrypt_with_witness(const GroupParams& params, const PublicKey& pk,
                                                         const Big& m, RandomSource& rng) {
    auto r = params.random_exponent(rng);
    auto ct = encrypt(params, pk, m, r);
    return {std::move(ct), std::move(r)};
}

Big ElGamal::decrypt(const GroupParams& params, const SecretKey& sk, const Ciphertext& ct) {
    ensure_valid(params, ct);
    auto ctx = BNUtils::cmake();
    // c1^{-x} = c1^{q-x}
    auto neg_x = BNUtils::mod_sub(BNUtils::from_uint(0), sk.x, params.q, ctx.get());
    auto mask_inv = params.modpow(ct.c1, neg_x, ctx.get());
    return params.mul_mod(ct.c2, mask_inv, ctx.get());
}

Ciphertext ElGamal::combine(const GroupParams& params, const Ciphertext& a, const Ciphertext& b) {
    ensure_valid(params, a);
    ensure_valid(params, b);
    auto ctx = BNUtils::cmake();
    return Ciphertext(params.mul_mod(a.c1, b.c1, ctx.get()), params.mul_mod(a.c2, b.c2, ctx.get()));
}

Ciphertext ElGamal::reencrypt(const GroupParams& params, const PublicKey& pk, const Ciphertext& ct,
                              const Big& r) {
    ensure_valid(params, ct);
    // (c1, c2) * Enc(1; r)
    auto one = BNUtils::from_uint(1);
    auto blind = encrypt(params, pk, one, r);
    auto ctx = BNUtils::cmake();
    return Ciphertext(params.mul_mod(ct.c1, blind.c1, ctx.get()), params.mul_mod(ct.c2, blind.c2, ctx.get()));
}

Ciphertext ElGamal::reencrypt(const GroupParams& params, const PublicKey& pk, const Ciphertext& ct,
                              RandomSource& rng) {
    return reencrypt(params, pk, ct, params.random_exponent(rng));
}

PublicKey ElGamal::combine_public_keys(const GroupParams& params, const std::vector<PublicKey>& shares) {
    if (shares.empty()) throw std::invalid_argument("no public key shares");
    auto ctx = BNUtils::cmake();
    auto h = BNUtils::from_uint(1);
    for (const auto& share : shares) {
        ensure_valid(params, share);
        h = params.mul_mod(h, share.h, ctx.get());
    }
    return PublicKey(std::move(h));
}

Big ElGamal::encode_exponential(const GroupParams& params, uint64_t m) {
    return params.pow_g(BNUtils::from_uint(m));
}

uint64_t ElGamal::decode_exponential(const GroupParams& params, const Big& encoded, uint64_t max) {
    if (max > kMaxDecodablePlaintext) throw std::invalid_argument("decode: search bound above 2^40");
    params.ensure_member(encoded, "encoded plaintext");
    auto ctx = BNUtils::cmake();
    const uint64_t step = static_cast<uint64_t>(std::sqrt(static_cast<long double>(max))) + 1;

    // baby-step: g^j, 0 <= j < step
    std::unordered_map<std::string, uint64_t> table;
    table.reserve(step * 2);
    auto baby = BNUtils::from_uint(1);
    for (uint64_t j = 0; j < step; ++j) {
        table.emplace(element_key(params, baby), j);
        baby = params.mul_mod(baby, params.g, ctx.get());
    }

    // giant-step: encoded * g^{-step*i}
    auto factor = BNUtils::mod_inv(params.modpow(params.g, BNUtils::from_uint(step), ctx.get()), params.p,
                                   ctx.get());
    auto gamma = BNUtils::dup(encoded);
    for (uint64_t i = 0; i <= step; ++i) {
        auto it = table.find(element_key(params, gamma));
        if (it != table.end()) {
            uint64_t m = i * step + it->second;
            if (m <= max) return m;
            break;
        }
        gamma = params.mul_mod(gamma, factor, ctx.get());
    }
    throw std::out_of_range("plaintext outside [0, " + std::to_string(max) + "]");
}

Big ElGamal::encode_residue(const GroupParams& params, uint64_t k) {
    auto base = BNUtils::from_uint(k);
    BNUtils::add_word(base, 1);
    if (BNUtils::cmp(base, params.q) > 0) throw std::out_of_range("value too large for residue encoding");
    auto ctx = BNUtils::cmake();
    return BNUtils::sqr(base, params.p, ctx.get());
}

uint64_t ElGamal::decode_residue(const GroupParams& params, const Big& encoded) {
    params.ensure_member(encoded, "encoded plaintext");
    auto ctx = BNUtils::cmake();
    auto root = BNUtils::mod_sqrt(encoded, params.p, ctx.get());
    // 两个根 r 与 p-r 中取 <= q 的那个
    if (BNUtils::cmp(root, params.q) > 0) root = BNUtils::mod_sub(params.p, root, params.p, ctx.get());
    BNUtils::sub_word(root, 1);
    return BNUtils::to_uint(root);
}

void ElGamal::ensure_valid(const GroupParams& params, const PublicKey& pk) {
    params.ensure_member(pk.h, "public key");
    if (BNUtils::is_one(pk.h)) throw InvalidGroupElement("public key is the identity");
}

void ElGamal::ensure_valid(const GroupParams& params, const Ciphertext& ct) {
    params.ensure_member(ct.c1, "ciphertext c1");
    params.ensure_member(ct.c2, "ciphertext c2");
}

}  // namespace mixnet
