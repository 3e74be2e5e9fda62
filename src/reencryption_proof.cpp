#include "mixnet/reencryption_proof.h"

#include "mixnet/errors.h"

namespace mixnet {

namespace {

Transcript context_for(const std::string& domain) {
    Transcript t("mixnet/reencryption");
    t.append_string("election", domain);
    return t;
}

std::vector<Big> bases_for(const GroupParams& params, const PublicKey& pk) {
    std::vector<Big> bases;
    bases.push_back(BNUtils::dup(params.g));
    bases.push_back(BNUtils::dup(pk.h));
    return bases;
}

// (c1'/c1, c2'/c2)
std::vector<Big> images_for(const GroupParams& params, const Ciphertext& original, const Ciphertext& reencrypted) {
    std::vector<Big> images;
    images.push_back(params.div_mod(reencrypted.c1, original.c1));
    images.push_back(params.div_mod(reencrypted.c2, original.c2));
    return images;
}

}  // namespace

ReEncryptionProof ReEncryptionProof::clone() const {
    return ReEncryptionProof(BNUtils::dup(a), BNUtils::dup(b), BNUtils::dup(challenge), BNUtils::dup(response));
}

ReEncryptionProof prove_reencryption(const GroupParams& params, const PublicKey& pk, const Ciphertext& original,
                                     const Ciphertext& reencrypted, const Big& r, RandomSource& rng,
                                     const std::string& domain) {
    ElGamal::ensure_valid(params, pk);
    ElGamal::ensure_valid(params, original);
    ElGamal::ensure_valid(params, reencrypted);

    auto proof = Sigma::prove(params, context_for(domain), bases_for(params, pk),
                              images_for(params, original, reencrypted), r, rng);
    return ReEncryptionProof(std::move(proof.commitments[0]), std::move(proof.commitments[1]),
                             std::move(proof.challenge), std::move(proof.response));
}

std::pair<Ciphertext, ReEncryptionProof> reencrypt_with_proof(const GroupParams& params, const PublicKey& pk,
                                                              const Ciphertext& ct, RandomSource& rng,
                                                              const std::string& domain) {
    auto r = params.random_exponent(rng);
    auto reencrypted = ElGamal::reencrypt(params, pk, ct, r);
    auto proof = prove_reencryption(params, pk, ct, reencrypted, r, rng, domain);
    return {std::move(reencrypted), std::move(proof)};
}

bool verify_reencryption(const GroupParams& params, const PublicKey& pk, const Ciphertext& original,
                         const Ciphertext& reencrypted, const ReEncryptionProof& proof,
                         const std::string& domain) {
    if (!params.is_member(pk.h) || !params.is_member(original.c1) || !params.is_member(original.c2) ||
        !params.is_member(reencrypted.c1) || !params.is_member(reencrypted.c2))
        return false;
    if (!proof.a || !proof.b || !proof.challenge || !proof.response) return false;

    std::vector<Big> commitments;
    commitments.push_back(BNUtils::dup(proof.a));
    commitments.push_back(BNUtils::dup(proof.b));
    DleqProof dleq(std::move(commitments), BNUtils::dup(proof.challenge), BNUtils::dup(proof.response));
    return Sigma::verify(params, context_for(domain), bases_for(params, pk),
                         images_for(params, original, reencrypted), dleq);
}

void ensure_reencryption(const GroupParams& params, const PublicKey& pk, const Ciphertext& original,
                         const Ciphertext& reencrypted, const ReEncryptionProof& proof,
                         const std::string& domain) {
    if (!verify_reencryption(params, pk, original, reencrypted, proof, domain))
        throw InvalidProof("re-encryption");
}

}  // namespace mixnet
