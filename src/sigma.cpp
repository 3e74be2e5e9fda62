#include "mixnet/sigma.h"

#include <stdexcept>

namespace mixnet {

DleqProof DleqProof::clone() const {
    std::vector<Big> copies;
    copies.reserve(commitments.size());
    for (const auto& a : commitments) copies.push_back(BNUtils::dup(a));
    return DleqProof(std::move(copies), BNUtils::dup(challenge), BNUtils::dup(response));
}

Big Sigma::challenge(const GroupParams& params, Transcript context, const std::vector<Big>& bases,
                     const std::vector<Big>& images, const std::vector<Big>& commitments) {
    context.append_group(params);
    context.append_elements(params, "bases", bases);
    context.append_elements(params, "images", images);
    context.append_elements(params, "commitments", commitments);
    return context.challenge(params);
}

DleqProof Sigma::prove(const GroupParams& params, Transcript context, const std::vector<Big>& bases,
                       const std::vector<Big>& images, const Big& witness, RandomSource& rng) {
    if (bases.empty() || bases.size() != images.size())
        throw std::invalid_argument("sigma: bases and images must be non-empty and of equal size");

    auto ctx = BNUtils::cmake();
    // commit
    auto w = params.random_exponent(rng);
    std::vector<Big> commitments;
    commitments.reserve(bases.size());
    for (const auto& base : bases) commitments.push_back(params.modpow(base, w, ctx.get()));

    // challenge
    auto c = challenge(params, std::move(context), bases, images, commitments);

    // s = w + c·x mod q
    auto cx = BNUtils::mod_mul(c, witness, params.q, ctx.get());
    auto s = BNUtils::mod_add(w, cx, params.q, ctx.get());
    return DleqProof(std::move(commitments), std::move(c), std::move(s));
}

bool Sigma::verify(const GroupParams& params, Transcript context, const std::vector<Big>& bases,
                   const std::vector<Big>& images, const DleqProof& proof) {
    if (bases.empty() || bases.size() != images.size() || proof.commitments.size() != bases.size())
        return false;
    if (!params.is_scalar(proof.challenge) || !params.is_scalar(proof.response)) return false;
    for (size_t j = 0; j < bases.size(); ++j) {
        if (!params.is_member(bases[j]) || !params.is_member(images[j]) ||
            !params.is_member(proof.commitments[j]))
            return false;
    }

    auto c = challenge(params, std::move(context), bases, images, proof.commitments);
    if (BNUtils::cmp(c, proof.challenge) != 0) return false;

    auto ctx = BNUtils::cmake();
    for (size_t j = 0; j < bases.size(); ++j) {
        // g_j^s == a_j * y_j^c
        auto lhs = params.modpow(bases[j], proof.response, ctx.get());
        auto y_c = params.modpow(images[j], proof.challenge, ctx.get());
        auto rhs = params.mul_mod(proof.commitments[j], y_c, ctx.get());
        if (BNUtils::cmp(lhs, rhs) != 0) return false;
    }
    return true;
}

}  // namespace mixnet
