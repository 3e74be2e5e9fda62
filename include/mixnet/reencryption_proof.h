#pragma once

#include "mixnet/elgamal.h"
#include "mixnet/group.h"
#include "mixnet/random.h"
#include "mixnet/sigma.h"

#include <string>
#include <utility>

namespace mixnet {

/**
 * 重加密证明：ct' / ct = (g^r', h^r')
 * (a, b) = (g^w, h^w)，s = w + c·r'
 */
struct ReEncryptionProof {
    Big a;
    Big b;
    Big challenge;
    Big response;

    ReEncryptionProof(Big a_in, Big b_in, Big challenge_in, Big response_in)
        : a(std::move(a_in)), b(std::move(b_in)), challenge(std::move(challenge_in)),
          response(std::move(response_in)) {}

    ReEncryptionProof clone() const;
};

/**
 * 以见证 r' 证明 reencrypted = reencrypt(original, r')
 * @param domain 域分隔串（选举 id）
 */
ReEncryptionProof prove_reencryption(const GroupParams& params, const PublicKey& pk, const Ciphertext& original,
                                     const Ciphertext& reencrypted, const Big& r, RandomSource& rng,
                                     const std::string& domain = "");

/**
 * 重加密并附带证明，r' 与 w 都现取
 * @throws InvalidGroupElement 输入不在子群内
 * @throws RandomnessFailure
 */
std::pair<Ciphertext, ReEncryptionProof> reencrypt_with_proof(const GroupParams& params, const PublicKey& pk,
                                                              const Ciphertext& ct, RandomSource& rng,
                                                              const std::string& domain = "");

// g^s == a·(c1'/c1)^c 且 h^s == b·(c2'/c2)^c，全部成立才接受
bool verify_reencryption(const GroupParams& params, const PublicKey& pk, const Ciphertext& original,
                         const Ciphertext& reencrypted, const ReEncryptionProof& proof,
                         const std::string& domain = "");

// 不成立时抛 InvalidProof
void ensure_reencryption(const GroupParams& params, const PublicKey& pk, const Ciphertext& original,
                         const Ciphertext& reencrypted, const ReEncryptionProof& proof,
                         const std::string& domain = "");

}  // namespace mixnet
