/**
 * 可验证洗牌（mix-net 核心）
 * 输出 i = reencrypt(输入 perm[i], r'_i)，附带 Wikström-Terelius 洗牌证明：
 *   - 置换承诺 c_{perm[i]} = g^{r_{perm[i]}} · h_i，h_i 为哈希派生的独立生成元；
 *   - 承诺链 ĉ_i = g^{r̂_i} · ĉ_{i-1}^{ũ_i}，ĉ_0 = H；
 *   - 单一聚合挑战，证明大小 O(N)。
 * 验证要么整体接受，要么整体拒绝。
 */

#pragma once

#include "mixnet/elgamal.h"
#include "mixnet/group.h"
#include "mixnet/random.h"

#include <string>
#include <utility>
#include <vector>

namespace mixnet {

struct ShuffleOptions {
    std::string domain;    // 选举 id，分隔生成元和挑战
    unsigned threads = 1;  // 逐元素模幂的工作线程数
};

struct ShuffleProof {
    Big challenge;
    Big s1;
    Big s2;
    Big s3;
    Big s4;
    std::vector<Big> s_hat;
    std::vector<Big> s_tilde;
    std::vector<Big> permutation_commitment;
    std::vector<Big> commitment_chain;

    size_t size() const { return permutation_commitment.size(); }
};

/**
 * 洗牌并生成证明
 * @param inputs 同一公钥下的 N 个密文，N >= 1
 * @throws std::invalid_argument 输入为空
 * @throws InvalidGroupElement 输入不在子群内
 * @throws RandomnessFailure
 */
std::pair<std::vector<Ciphertext>, ShuffleProof> shuffle_with_proof(const GroupParams& params, const PublicKey& pk,
                                                                    const std::vector<Ciphertext>& inputs,
                                                                    RandomSource& rng,
                                                                    const ShuffleOptions& options = {});

/**
 * 已知置换和重加密随机数时生成证明
 * @param permutation outputs[i] 由 inputs[permutation[i]] 重加密得到
 * @param randomizers outputs[i] 使用的 r'_i
 * @throws std::invalid_argument 长度不一致或 permutation 不是置换
 */
ShuffleProof prove_shuffle(const GroupParams& params, const PublicKey& pk, const std::vector<Ciphertext>& inputs,
                           const std::vector<Ciphertext>& outputs, const std::vector<size_t>& permutation,
                           const std::vector<Big>& randomizers, RandomSource& rng,
                           const ShuffleOptions& options = {});

bool verify_shuffle(const GroupParams& params, const PublicKey& pk, const std::vector<Ciphertext>& inputs,
                    const std::vector<Ciphertext>& outputs, const ShuffleProof& proof,
                    const ShuffleOptions& options = {});

// 不通过时抛 InvalidProof
void ensure_shuffle(const GroupParams& params, const PublicKey& pk, const std::vector<Ciphertext>& inputs,
                    const std::vector<Ciphertext>& outputs, const ShuffleProof& proof,
                    const ShuffleOptions& options = {});

}  // namespace mixnet
