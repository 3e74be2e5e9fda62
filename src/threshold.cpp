#include "mixnet/threshold.h"

#include "mixnet/transcript.h"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace mixnet {

namespace {

Transcript decryption_context(const std::string& domain, size_t index) {
    Transcript t("mixnet/decryption");
    t.append_string("election", domain);
    t.append_u64("sealer", index);
    return t;
}

Transcript keygen_context(const std::string& domain, const std::string& sealer_id) {
    Transcript t("mixnet/keygen");
    t.append_string("election", domain);
    t.append_string("sealer", sealer_id);
    return t;
}

// Horner: f(x) = a_0 + a_1 x + ... mod q
Big eval_poly(const GroupParams& params, const std::vector<Big>& coeffs, size_t x) {
    auto ctx = BNUtils::cmake();
    auto x_bn = BNUtils::from_uint(x);
    auto res = BNUtils::from_uint(0);
    for (size_t i = coeffs.size(); i-- > 0;) {
        res = BNUtils::mod_mul(res, x_bn, params.q, ctx.get());
        res = BNUtils::mod_add(res, coeffs[i], params.q, ctx.get());
    }
    return res;
}

std::vector<size_t> indices_of(const std::vector<InvalidPartial>& rejected) {
    std::vector<size_t> out;
    for (const auto& r : rejected) out.push_back(r.index());
    return out;
}

// Π d_i^{λ_i}
Big interpolate_in_exponent(const GroupParams& params, const std::vector<size_t>& indices,
                            const std::vector<const Big*>& values) {
    auto ctx = BNUtils::cmake();
    auto acc = BNUtils::from_uint(1);
    for (size_t k = 0; k < indices.size(); ++k) {
        auto lambda = lagrange_coefficient(params, indices, indices[k]);
        acc = params.mul_mod(acc, params.modpow(*values[k], lambda, ctx.get()), ctx.get());
    }
    return acc;
}

}  // namespace

ShareCommitments ShareCommitments::clone() const {
    std::vector<Big> copies;
    for (const auto& c : coefficients) copies.push_back(BNUtils::dup(c));
    return ShareCommitments(std::move(copies));
}

DealtKey deal_shares(const GroupParams& params, size_t threshold, size_t total, RandomSource& rng) {
    SecretKey secret(params.random_exponent(rng));
    return deal_shares(params, secret, threshold, total, rng);
}

DealtKey deal_shares(const GroupParams& params, const SecretKey& secret, size_t threshold, size_t total,
                     RandomSource& rng) {
    if (threshold == 0 || threshold > total) throw std::invalid_argument("deal: require 1 <= t <= n");
    if (!params.is_scalar(secret.x) || BNUtils::is_zero(secret.x))
        throw std::invalid_argument("deal: secret must lie in [1, q-1]");

    // a_0 = x，其余系数随机
    std::vector<Big> coeffs;
    coeffs.push_back(BNUtils::dup(secret.x));
    for (size_t j = 1; j < threshold; ++j) coeffs.push_back(params.random_exponent(rng));

    // C_j = g^{a_j}
    std::vector<Big> commitments;
    for (const auto& a : coeffs) commitments.push_back(params.pow_g(a));

    std::vector<KeyShare> shares;
    for (size_t i = 1; i <= total; ++i) {
        auto x_i = eval_poly(params, coeffs, i);
        auto h_i = params.pow_g(x_i);
        shares.emplace_back(i, std::move(x_i), std::move(h_i));
    }

    PublicKey election_key(BNUtils::dup(commitments[0]));
    return DealtKey(std::move(election_key), ShareCommitments(std::move(commitments)), std::move(shares));
}

Big public_share_for(const GroupParams& params, const ShareCommitments& commitments, size_t index) {
    auto ctx = BNUtils::cmake();
    auto x = BNUtils::from_uint(index);
    auto x_pow = BNUtils::from_uint(1);
    auto acc = BNUtils::from_uint(1);
    for (const auto& c : commitments.coefficients) {
        params.ensure_member(c, "share commitment");
        acc = params.mul_mod(acc, params.modpow(c, x_pow, ctx.get()), ctx.get());
        x_pow = BNUtils::mod_mul(x_pow, x, params.q, ctx.get());
    }
    return acc;
}

bool verify_share(const GroupParams& params, const ShareCommitments& commitments, const KeyShare& share) {
    if (share.index == 0 || !params.is_scalar(share.secret)) return false;
    for (const auto& c : commitments.coefficients)
        if (!params.is_member(c)) return false;
    auto expected = public_share_for(params, commitments, share.index);
    auto left = params.pow_g(share.secret);
    return BNUtils::cmp(left, expected) == 0 && BNUtils::cmp(share.public_share, expected) == 0;
}

Big lagrange_coefficient(const GroupParams& params, const std::vector<size_t>& indices, size_t i) {
    std::set<size_t> unique(indices.begin(), indices.end());
    if (unique.size() != indices.size() || unique.count(0) || !unique.count(i))
        throw std::invalid_argument("lagrange: indices must be distinct, non-zero and contain i");

    auto ctx = BNUtils::cmake();
    auto num = BNUtils::from_uint(1);
    auto den = BNUtils::from_uint(1);
    auto x_i = BNUtils::from_uint(i);
    for (size_t j : indices) {
        if (j == i) continue;
        auto x_j = BNUtils::from_uint(j);
        // j / (j - i)
        num = BNUtils::mod_mul(num, x_j, params.q, ctx.get());
        den = BNUtils::mod_mul(den, BNUtils::mod_sub(x_j, x_i, params.q, ctx.get()), params.q, ctx.get());
    }
    return BNUtils::mod_mul(num, BNUtils::mod_inv(den, params.q, ctx.get()), params.q, ctx.get());
}

Big reconstruct_secret(const GroupParams& params, const std::vector<const KeyShare*>& shares) {
    std::vector<size_t> indices;
    for (const auto* s : shares) indices.push_back(s->index);
    auto ctx = BNUtils::cmake();
    auto result = BNUtils::from_uint(0);
    for (const auto* s : shares) {
        auto li = lagrange_coefficient(params, indices, s->index);
        result = BNUtils::mod_add(result, BNUtils::mod_mul(s->secret, li, params.q, ctx.get()), params.q, ctx.get());
    }
    return result;
}

DleqProof prove_key_share(const GroupParams& params, const KeyShare& share, const std::string& sealer_id,
                          RandomSource& rng, const std::string& domain) {
    std::vector<Big> bases, images;
    bases.push_back(BNUtils::dup(params.g));
    images.push_back(BNUtils::dup(share.public_share));
    return Sigma::prove(params, keygen_context(domain, sealer_id), bases, images, share.secret, rng);
}

bool verify_key_share(const GroupParams& params, const Big& public_share, const DleqProof& proof,
                      const std::string& sealer_id, const std::string& domain) {
    if (!public_share) return false;
    std::vector<Big> bases, images;
    bases.push_back(BNUtils::dup(params.g));
    images.push_back(BNUtils::dup(public_share));
    return Sigma::verify(params, keygen_context(domain, sealer_id), bases, images, proof);
}

std::pair<PartialDecryption, DleqProof> partial_decrypt(const GroupParams& params, const KeyShare& share,
                                                        const Ciphertext& ct, RandomSource& rng,
                                                        const std::string& domain) {
    ElGamal::ensure_valid(params, ct);
    auto d = params.modpow(ct.c1, share.secret);

    std::vector<Big> bases, images;
    bases.push_back(BNUtils::dup(params.g));
    bases.push_back(BNUtils::dup(ct.c1));
    images.push_back(BNUtils::dup(share.public_share));
    images.push_back(BNUtils::dup(d));
    auto proof = Sigma::prove(params, decryption_context(domain, share.index), bases, images, share.secret, rng);
    return {PartialDecryption(share.index, std::move(d)), std::move(proof)};
}

bool verify_partial(const GroupParams& params, const Big& public_share, const Ciphertext& ct,
                    const PartialDecryption& partial, const DleqProof& proof, const std::string& domain) {
    if (!public_share || !partial.value || !ct.c1) return false;
    std::vector<Big> bases, images;
    bases.push_back(BNUtils::dup(params.g));
    bases.push_back(BNUtils::dup(ct.c1));
    images.push_back(BNUtils::dup(public_share));
    images.push_back(BNUtils::dup(partial.value));
    return Sigma::verify(params, decryption_context(domain, partial.index), bases, images, proof);
}

CombineResult combine_decryptions(const GroupParams& params, const ShareCommitments& commitments,
                                  const Ciphertext& ct, const std::vector<DecryptionShare>& shares,
                                  const std::string& domain) {
    ElGamal::ensure_valid(params, ct);
    const size_t t = commitments.threshold();
    if (t == 0) throw std::invalid_argument("combine: empty share commitments");

    CombineResult result;
    std::vector<size_t> indices;
    std::vector<const Big*> values;
    for (const auto& share : shares) {
        size_t idx = share.partial.index;
        bool duplicate = std::find(indices.begin(), indices.end(), idx) != indices.end();
        if (idx == 0 || duplicate ||
            !verify_partial(params, public_share_for(params, commitments, idx), ct, share.partial, share.proof,
                            domain)) {
            result.rejected.emplace_back(idx);
            continue;
        }
        indices.push_back(idx);
        values.push_back(&share.partial.value);
    }
    if (indices.size() < t) throw InsufficientShares(indices.size(), t, indices_of(result.rejected));

    // m = c2 / c1^x
    auto c1_x = interpolate_in_exponent(params, indices, values);
    result.plaintext = params.div_mod(ct.c2, c1_x);
    return result;
}

BatchDecryptionShare partial_decrypt_batch(const GroupParams& params, const KeyShare& share,
                                           const std::vector<Ciphertext>& cts, RandomSource& rng,
                                           const std::string& domain) {
    std::vector<Big> bases, images, values;
    bases.push_back(BNUtils::dup(params.g));
    images.push_back(BNUtils::dup(share.public_share));
    for (const auto& ct : cts) {
        ElGamal::ensure_valid(params, ct);
        auto d = params.modpow(ct.c1, share.secret);
        bases.push_back(BNUtils::dup(ct.c1));
        images.push_back(BNUtils::dup(d));
        values.push_back(std::move(d));
    }
    auto proof = Sigma::prove(params, decryption_context(domain, share.index), bases, images, share.secret, rng);
    return BatchDecryptionShare(share.index, std::move(values), std::move(proof));
}

bool verify_partial_batch(const GroupParams& params, const Big& public_share, const std::vector<Ciphertext>& cts,
                          const BatchDecryptionShare& share, const std::string& domain) {
    if (!public_share || share.values.size() != cts.size()) return false;
    std::vector<Big> bases, images;
    bases.push_back(BNUtils::dup(params.g));
    images.push_back(BNUtils::dup(public_share));
    for (size_t k = 0; k < cts.size(); ++k) {
        if (!cts[k].c1 || !share.values[k]) return false;
        bases.push_back(BNUtils::dup(cts[k].c1));
        images.push_back(BNUtils::dup(share.values[k]));
    }
    return Sigma::verify(params, decryption_context(domain, share.index), bases, images, share.proof);
}

BatchCombineResult combine_decryptions_batch(const GroupParams& params, const ShareCommitments& commitments,
                                             const std::vector<Ciphertext>& cts,
                                             const std::vector<BatchDecryptionShare>& shares,
                                             const std::string& domain) {
    for (const auto& ct : cts) ElGamal::ensure_valid(params, ct);
    const size_t t = commitments.threshold();
    if (t == 0) throw std::invalid_argument("combine: empty share commitments");

    BatchCombineResult result;
    std::vector<size_t> indices;
    std::vector<const BatchDecryptionShare*> accepted;
    for (const auto& share : shares) {
        bool duplicate = std::find(indices.begin(), indices.end(), share.index) != indices.end();
        if (share.index == 0 || duplicate ||
            !verify_partial_batch(params, public_share_for(params, commitments, share.index), cts, share, domain)) {
            result.rejected.emplace_back(share.index);
            continue;
        }
        indices.push_back(share.index);
        accepted.push_back(&share);
    }
    if (indices.size() < t) throw InsufficientShares(indices.size(), t, indices_of(result.rejected));

    for (size_t k = 0; k < cts.size(); ++k) {
        std::vector<const Big*> values;
        for (const auto* s : accepted) values.push_back(&s->values[k]);
        auto c1_x = interpolate_in_exponent(params, indices, values);
        result.plaintexts.push_back(params.div_mod(cts[k].c2, c1_x));
    }
    return result;
}

}  // namespace mixnet
