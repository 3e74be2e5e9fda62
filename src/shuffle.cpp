#include "mixnet/shuffle.h"

#include "mixnet/errors.h"
#include "mixnet/transcript.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace mixnet {

namespace {

// 按步长把 [0, n) 分给 workers 个线程，子线程异常在 join 后重新抛出。
// 线程创建失败时，未启动的分段由当前线程执行。
template <typename Fn>
void parallel_for(size_t n, unsigned workers, Fn fn) {
    if (workers <= 1 || n < 2) {
        for (size_t i = 0; i < n; ++i) fn(i);
        return;
    }
    const size_t count = std::min<size_t>(workers, n);
    std::vector<std::exception_ptr> errors(count);
    auto stripe = [&](size_t w) {
        try {
            for (size_t i = w; i < n; i += count) fn(i);
        } catch (...) {
            errors[w] = std::current_exception();
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(count);
    size_t started = 0;
    try {
        for (; started < count; ++started) threads.emplace_back(stripe, started);
    } catch (const std::system_error&) {
        // 资源不足，剩余分段退回串行
    }
    for (size_t w = started; w < count; ++w) stripe(w);
    for (auto& t : threads) t.join();
    for (auto& e : errors)
        if (e) std::rethrow_exception(e);
}

// prod base(i)^exp(i)
template <typename BaseFn, typename ExpFn>
Big prod_pow(const GroupParams& params, size_t n, unsigned workers, BaseFn base, ExpFn exp) {
    std::vector<Big> terms(n);
    parallel_for(n, workers, [&](size_t i) { terms[i] = params.modpow(base(i), exp(i)); });
    return params.product(terms);
}

Big neg_q(const GroupParams& params, const Big& a) { return params.sub_q(BNUtils::from_uint(0), a); }

struct Generators {
    Big base;               // H，承诺链起点
    std::vector<Big> h;     // h_1..h_N
};

Generators shuffle_generators(const GroupParams& params, const std::string& domain, size_t n) {
    auto gens = params.derive_generators(domain + "/shuffle", n + 1);
    Generators out;
    out.base = std::move(gens[0]);
    for (size_t i = 1; i < gens.size(); ++i) out.h.push_back(std::move(gens[i]));
    return out;
}

std::vector<Big> column(const std::vector<Ciphertext>& cts, bool first) {
    std::vector<Big> out;
    out.reserve(cts.size());
    for (const auto& ct : cts) out.push_back(BNUtils::dup(first ? ct.c1 : ct.c2));
    return out;
}

// 陈述：pk、输入、输出、置换承诺
Transcript statement(const GroupParams& params, const PublicKey& pk, const std::vector<Ciphertext>& inputs,
                     const std::vector<Ciphertext>& outputs, const std::vector<Big>& commitment,
                     const std::string& domain) {
    Transcript t("mixnet/shuffle");
    t.append_string("election", domain);
    t.append_group(params);
    t.append_element(params, "pk", pk.h);
    t.append_elements(params, "in.c1", column(inputs, true));
    t.append_elements(params, "in.c2", column(inputs, false));
    t.append_elements(params, "out.c1", column(outputs, true));
    t.append_elements(params, "out.c2", column(outputs, false));
    t.append_elements(params, "perm", commitment);
    return t;
}

Big final_challenge(const GroupParams& params, Transcript t, const std::vector<Big>& chain, const Big& t1,
                    const Big& t2, const Big& t3, const Big& t41, const Big& t42, const std::vector<Big>& t_hat) {
    t.append_elements(params, "chain", chain);
    t.append_element(params, "t1", t1);
    t.append_element(params, "t2", t2);
    t.append_element(params, "t3", t3);
    t.append_element(params, "t4.1", t41);
    t.append_element(params, "t4.2", t42);
    t.append_elements(params, "t_hat", t_hat);
    return t.challenge(params);
}

bool is_permutation(const std::vector<size_t>& perm) {
    std::vector<bool> seen(perm.size(), false);
    for (size_t j : perm) {
        if (j >= perm.size() || seen[j]) return false;
        seen[j] = true;
    }
    return true;
}

}  // namespace

std::pair<std::vector<Ciphertext>, ShuffleProof> shuffle_with_proof(const GroupParams& params, const PublicKey& pk,
                                                                    const std::vector<Ciphertext>& inputs,
                                                                    RandomSource& rng,
                                                                    const ShuffleOptions& options) {
    if (inputs.empty()) throw std::invalid_argument("shuffle: empty input");
    ElGamal::ensure_valid(params, pk);
    for (const auto& ct : inputs) ElGamal::ensure_valid(params, ct);

    const size_t n = inputs.size();
    // 置换和随机数一次取定，之后只读
    const std::vector<size_t> perm = random_permutation(rng, n);
    std::vector<Big> randomizers;
    randomizers.reserve(n);
    for (size_t i = 0; i < n; ++i) randomizers.push_back(params.random_exponent(rng));

    std::vector<Big> c1(n), c2(n);
    parallel_for(n, options.threads, [&](size_t i) {
        auto ct = ElGamal::reencrypt(params, pk, inputs[perm[i]], randomizers[i]);
        c1[i] = std::move(ct.c1);
        c2[i] = std::move(ct.c2);
    });
    std::vector<Ciphertext> outputs;
    outputs.reserve(n);
    for (size_t i = 0; i < n; ++i) outputs.emplace_back(std::move(c1[i]), std::move(c2[i]));

    auto proof = prove_shuffle(params, pk, inputs, outputs, perm, randomizers, rng, options);
    return {std::move(outputs), std::move(proof)};
}

ShuffleProof prove_shuffle(const GroupParams& params, const PublicKey& pk, const std::vector<Ciphertext>& inputs,
                           const std::vector<Ciphertext>& outputs, const std::vector<size_t>& permutation,
                           const std::vector<Big>& randomizers, RandomSource& rng,
                           const ShuffleOptions& options) {
    const size_t n = inputs.size();
    if (n == 0 || outputs.size() != n || permutation.size() != n || randomizers.size() != n)
        throw std::invalid_argument("shuffle proof: length mismatch");
    if (!is_permutation(permutation)) throw std::invalid_argument("shuffle proof: not a permutation");
    const unsigned workers = options.threads;
    auto gens = shuffle_generators(params, options.domain, n);

    // 所有随机数先在当前线程取好，rng 不进入工作线程
    std::vector<Big> r(n), r_hat(n), w_hat(n), w_tilde(n);
    for (size_t i = 0; i < n; ++i) r[permutation[i]] = params.random_exponent(rng);
    for (size_t i = 0; i < n; ++i) r_hat[i] = params.random_exponent(rng);
    auto w1 = params.random_exponent(rng);
    auto w2 = params.random_exponent(rng);
    auto w3 = params.random_exponent(rng);
    auto w4 = params.random_exponent(rng);
    for (size_t i = 0; i < n; ++i) w_hat[i] = params.random_exponent(rng);
    for (size_t i = 0; i < n; ++i) w_tilde[i] = params.random_exponent(rng);

    // 置换承诺 c_{perm[i]} = g^{r_{perm[i]}} h_i
    std::vector<Big> commitment(n);
    parallel_for(n, workers, [&](size_t i) {
        size_t j = permutation[i];
        commitment[j] = params.mul_mod(params.pow_g(r[j]), gens.h[i]);
    });

    Transcript base = statement(params, pk, inputs, outputs, commitment, options.domain);
    std::vector<Big> u(n), u_tilde(n);
    for (size_t j = 0; j < n; ++j) u[j] = base.derive_scalar(params, j);
    for (size_t i = 0; i < n; ++i) u_tilde[i] = BNUtils::dup(u[permutation[i]]);

    // 承诺链 ĉ_i = g^{r̂_i} ĉ_{i-1}^{ũ_i}
    std::vector<Big> g_r_hat(n);
    parallel_for(n, workers, [&](size_t i) { g_r_hat[i] = params.pow_g(r_hat[i]); });
    std::vector<Big> chain;
    chain.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const Big& prev = i == 0 ? gens.base : chain[i - 1];
        chain.push_back(params.mul_mod(g_r_hat[i], params.modpow(prev, u_tilde[i])));
    }

    // 承诺
    auto t1 = params.pow_g(w1);
    auto t2 = params.pow_g(w2);
    auto t3 = params.mul_mod(params.pow_g(w3),
                             prod_pow(params, n, workers, [&](size_t i) -> const Big& { return gens.h[i]; },
                                      [&](size_t i) -> const Big& { return w_tilde[i]; }));
    auto neg_w4 = neg_q(params, w4);
    auto t41 = params.mul_mod(params.pow_g(neg_w4),
                              prod_pow(params, n, workers, [&](size_t i) -> const Big& { return outputs[i].c1; },
                                       [&](size_t i) -> const Big& { return w_tilde[i]; }));
    auto t42 = params.mul_mod(params.modpow(pk.h, neg_w4),
                              prod_pow(params, n, workers, [&](size_t i) -> const Big& { return outputs[i].c2; },
                                       [&](size_t i) -> const Big& { return w_tilde[i]; }));
    std::vector<Big> t_hat(n);
    parallel_for(n, workers, [&](size_t i) {
        const Big& prev = i == 0 ? gens.base : chain[i - 1];
        t_hat[i] = params.mul_mod(params.pow_g(w_hat[i]), params.modpow(prev, w_tilde[i]));
    });

    // 聚合挑战：等待全部逐元素承诺
    auto c = final_challenge(params, base, chain, t1, t2, t3, t41, t42, t_hat);

    // r̄ = Σ r_j
    auto r_bar = BNUtils::from_uint(0);
    for (size_t j = 0; j < n; ++j) r_bar = params.add_q(r_bar, r[j]);

    // v_{N-1} = 1, v_i = ũ_{i+1} v_{i+1}; r̂ = Σ r̂_i v_i
    std::vector<Big> v(n);
    v[n - 1] = BNUtils::from_uint(1);
    for (size_t i = n - 1; i > 0; --i) v[i - 1] = params.mul_q(u_tilde[i], v[i]);
    auto r_hat_sum = BNUtils::from_uint(0);
    for (size_t i = 0; i < n; ++i) r_hat_sum = params.add_q(r_hat_sum, params.mul_q(r_hat[i], v[i]));

    // r = Σ r_j u_j
    auto r_u = BNUtils::from_uint(0);
    for (size_t j = 0; j < n; ++j) r_u = params.add_q(r_u, params.mul_q(r[j], u[j]));

    // r̃ = Σ r'_i ũ_i
    auto r_tilde = BNUtils::from_uint(0);
    for (size_t i = 0; i < n; ++i) r_tilde = params.add_q(r_tilde, params.mul_q(randomizers[i], u_tilde[i]));

    ShuffleProof proof;
    proof.s1 = params.sub_q(w1, params.mul_q(c, r_bar));
    proof.s2 = params.sub_q(w2, params.mul_q(c, r_hat_sum));
    proof.s3 = params.sub_q(w3, params.mul_q(c, r_u));
    proof.s4 = params.sub_q(w4, params.mul_q(c, r_tilde));
    for (size_t i = 0; i < n; ++i) {
        proof.s_hat.push_back(params.sub_q(w_hat[i], params.mul_q(c, r_hat[i])));
        proof.s_tilde.push_back(params.sub_q(w_tilde[i], params.mul_q(c, u_tilde[i])));
    }
    proof.challenge = std::move(c);
    proof.permutation_commitment = std::move(commitment);
    proof.commitment_chain = std::move(chain);
    return proof;
}

bool verify_shuffle(const GroupParams& params, const PublicKey& pk, const std::vector<Ciphertext>& inputs,
                    const std::vector<Ciphertext>& outputs, const ShuffleProof& proof,
                    const ShuffleOptions& options) {
    const size_t n = inputs.size();
    if (n == 0 || outputs.size() != n) return false;
    if (proof.permutation_commitment.size() != n || proof.commitment_chain.size() != n ||
        proof.s_hat.size() != n || proof.s_tilde.size() != n)
        return false;

    // 结构检查
    if (!params.is_member(pk.h)) return false;
    for (const Big* s : {&proof.challenge, &proof.s1, &proof.s2, &proof.s3, &proof.s4})
        if (!params.is_scalar(*s)) return false;
    for (size_t i = 0; i < n; ++i) {
        if (!params.is_scalar(proof.s_hat[i]) || !params.is_scalar(proof.s_tilde[i])) return false;
    }
    const unsigned workers = options.threads;
    std::vector<char> members(n, 0);
    parallel_for(n, workers, [&](size_t i) {
        members[i] = params.is_member(inputs[i].c1) && params.is_member(inputs[i].c2) &&
                     params.is_member(outputs[i].c1) && params.is_member(outputs[i].c2) &&
                     params.is_member(proof.permutation_commitment[i]) &&
                     params.is_member(proof.commitment_chain[i]);
    });
    if (std::find(members.begin(), members.end(), 0) != members.end()) return false;

    auto gens = shuffle_generators(params, options.domain, n);
    Transcript base = statement(params, pk, inputs, outputs, proof.permutation_commitment, options.domain);
    std::vector<Big> u(n);
    for (size_t j = 0; j < n; ++j) u[j] = base.derive_scalar(params, j);
    const Big& c = proof.challenge;

    // c̄ = Π c_j / Π h_j
    auto c_bar = params.div_mod(params.product(proof.permutation_commitment), params.product(gens.h));
    // ĉ = ĉ_N / H^{Π u_j}
    auto u_prod = BNUtils::from_uint(1);
    for (size_t j = 0; j < n; ++j) u_prod = params.mul_q(u_prod, u[j]);
    auto c_hat = params.div_mod(proof.commitment_chain[n - 1], params.modpow(gens.base, u_prod));
    // c̃ = Π c_j^{u_j}, A = Π c1_j^{u_j}, B = Π c2_j^{u_j}
    auto u_at = [&](size_t j) -> const Big& { return u[j]; };
    auto c_tilde = prod_pow(
        params, n, workers, [&](size_t j) -> const Big& { return proof.permutation_commitment[j]; }, u_at);
    auto a_prod = prod_pow(params, n, workers, [&](size_t j) -> const Big& { return inputs[j].c1; }, u_at);
    auto b_prod = prod_pow(params, n, workers, [&](size_t j) -> const Big& { return inputs[j].c2; }, u_at);

    auto s_tilde_at = [&](size_t i) -> const Big& { return proof.s_tilde[i]; };
    auto neg_s4 = neg_q(params, proof.s4);

    auto t1 = params.mul_mod(params.modpow(c_bar, c), params.pow_g(proof.s1));
    auto t2 = params.mul_mod(params.modpow(c_hat, c), params.pow_g(proof.s2));
    auto t3 = params.mul_mod(params.mul_mod(params.modpow(c_tilde, c), params.pow_g(proof.s3)),
                             prod_pow(params, n, workers, [&](size_t i) -> const Big& { return gens.h[i]; },
                                      s_tilde_at));
    auto t41 = params.mul_mod(params.mul_mod(params.modpow(a_prod, c), params.pow_g(neg_s4)),
                              prod_pow(params, n, workers, [&](size_t i) -> const Big& { return outputs[i].c1; },
                                       s_tilde_at));
    auto t42 = params.mul_mod(params.mul_mod(params.modpow(b_prod, c), params.modpow(pk.h, neg_s4)),
                              prod_pow(params, n, workers, [&](size_t i) -> const Big& { return outputs[i].c2; },
                                       s_tilde_at));
    std::vector<Big> t_hat(n);
    parallel_for(n, workers, [&](size_t i) {
        const Big& prev = i == 0 ? gens.base : proof.commitment_chain[i - 1];
        auto lhs = params.mul_mod(params.modpow(proof.commitment_chain[i], c), params.pow_g(proof.s_hat[i]));
        t_hat[i] = params.mul_mod(lhs, params.modpow(prev, proof.s_tilde[i]));
    });

    auto expected = final_challenge(params, base, proof.commitment_chain, t1, t2, t3, t41, t42, t_hat);
    return BNUtils::cmp(expected, c) == 0;
}

void ensure_shuffle(const GroupParams& params, const PublicKey& pk, const std::vector<Ciphertext>& inputs,
                    const std::vector<Ciphertext>& outputs, const ShuffleProof& proof,
                    const ShuffleOptions& options) {
    if (!verify_shuffle(params, pk, inputs, outputs, proof, options)) throw InvalidProof("shuffle");
}

}  // namespace mixnet
