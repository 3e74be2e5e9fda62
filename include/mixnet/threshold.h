/**
 * 门限解密
 * (t, n) Shamir 分享私钥 x，Feldman 承诺 C_j = g^{a_j} 公开可验证；
 * sealer i 输出 d_i = c1^{x_i} 及 DLEQ 证明 (g, g^{x_i}) ~ (c1, d_i)；
 * 合并方逐个验证，剔除无效部分解密，有效数 >= t 时
 *   c1^x = Π d_i^{λ_i}，m = c2 / c1^x。
 */

#pragma once

#include "mixnet/elgamal.h"
#include "mixnet/errors.h"
#include "mixnet/group.h"
#include "mixnet/random.h"
#include "mixnet/sigma.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mixnet {

// sealer i 的私钥份额 x_i = f(i) 及公开份额 g^{x_i}，index 从 1 开始
struct KeyShare {
    size_t index;
    Big secret;
    Big public_share;

    KeyShare(size_t index_in, Big secret_in, Big public_in)
        : index(index_in), secret(std::move(secret_in)), public_share(std::move(public_in)) {}
};

// Feldman 承诺 C_j = g^{a_j}，个数即门限 t >= 1，C_0 为选举公钥
struct ShareCommitments {
    std::vector<Big> coefficients;

    // @throws std::invalid_argument 承诺为空
    explicit ShareCommitments(std::vector<Big> coefficients_in) : coefficients(std::move(coefficients_in)) {
        if (coefficients.empty()) throw std::invalid_argument("share commitments: empty");
    }

    size_t threshold() const { return coefficients.size(); }
    ShareCommitments clone() const;
};

struct DealtKey {
    PublicKey election_key;
    ShareCommitments commitments;
    std::vector<KeyShare> shares;

    DealtKey(PublicKey key_in, ShareCommitments commitments_in, std::vector<KeyShare> shares_in)
        : election_key(std::move(key_in)),
          commitments(std::move(commitments_in)),
          shares(std::move(shares_in)) {}
};

// d_i = c1^{x_i}
struct PartialDecryption {
    size_t index;
    Big value;

    PartialDecryption(size_t index_in, Big value_in) : index(index_in), value(std::move(value_in)) {}
    PartialDecryption clone() const { return PartialDecryption(index, BNUtils::dup(value)); }
};

// sealer 提交给合并方的数据，只含公开值
struct DecryptionShare {
    PartialDecryption partial;
    DleqProof proof;

    DecryptionShare(PartialDecryption partial_in, DleqProof proof_in)
        : partial(std::move(partial_in)), proof(std::move(proof_in)) {}
};

// 批量部分解密：同一份额作用于整批密文，一个证明
struct BatchDecryptionShare {
    size_t index;
    std::vector<Big> values;
    DleqProof proof;

    BatchDecryptionShare(size_t index_in, std::vector<Big> values_in, DleqProof proof_in)
        : index(index_in), values(std::move(values_in)), proof(std::move(proof_in)) {}
};

struct CombineResult {
    Big plaintext;
    std::vector<InvalidPartial> rejected;
};

struct BatchCombineResult {
    std::vector<Big> plaintexts;
    std::vector<InvalidPartial> rejected;
};

/**
 * 分发新私钥的份额
 * @param threshold t，1 <= t <= n
 * @param total n
 * @throws std::invalid_argument 参数不合法
 */
DealtKey deal_shares(const GroupParams& params, size_t threshold, size_t total, RandomSource& rng);

// 分发给定私钥的份额
DealtKey deal_shares(const GroupParams& params, const SecretKey& secret, size_t threshold, size_t total,
                     RandomSource& rng);

/**
 * 份额 i 对应的公开份额 g^{f(i)} = Π C_j^{i^j}
 */
Big public_share_for(const GroupParams& params, const ShareCommitments& commitments, size_t index);

// g^{x_i} == Π C_j^{i^j}，且与 share.public_share 一致
bool verify_share(const GroupParams& params, const ShareCommitments& commitments, const KeyShare& share);

/**
 * 拉格朗日系数 λ_i = Π_{j != i} j / (j - i) mod q
 * @throws std::invalid_argument 下标重复、为 0 或 i 不在集合中
 */
Big lagrange_coefficient(const GroupParams& params, const std::vector<size_t>& indices, size_t i);

// 由至少 t 个份额在 0 处插值恢复 x，仅供审计与测试
Big reconstruct_secret(const GroupParams& params, const std::vector<const KeyShare*>& shares);

/**
 * sealer 对其公开份额的 Schnorr 知识证明，绑定选举 id 与 sealer id
 */
DleqProof prove_key_share(const GroupParams& params, const KeyShare& share, const std::string& sealer_id,
                          RandomSource& rng, const std::string& domain = "");
bool verify_key_share(const GroupParams& params, const Big& public_share, const DleqProof& proof,
                      const std::string& sealer_id, const std::string& domain = "");

/**
 * 部分解密 d_i = c1^{x_i} 及其证明
 * @throws InvalidGroupElement 密文不在子群内
 */
std::pair<PartialDecryption, DleqProof> partial_decrypt(const GroupParams& params, const KeyShare& share,
                                                        const Ciphertext& ct, RandomSource& rng,
                                                        const std::string& domain = "");

bool verify_partial(const GroupParams& params, const Big& public_share, const Ciphertext& ct,
                    const PartialDecryption& partial, const DleqProof& proof, const std::string& domain = "");

/**
 * 合并部分解密
 * 逐个验证，失败者记入 rejected 而不中止；有效数不足 t 时抛异常
 * @throws InsufficientShares
 * @throws InvalidGroupElement 密文不在子群内
 * @throws std::invalid_argument 承诺为空
 */
CombineResult combine_decryptions(const GroupParams& params, const ShareCommitments& commitments,
                                  const Ciphertext& ct, const std::vector<DecryptionShare>& shares,
                                  const std::string& domain = "");

// 批量版本
BatchDecryptionShare partial_decrypt_batch(const GroupParams& params, const KeyShare& share,
                                           const std::vector<Ciphertext>& cts, RandomSource& rng,
                                           const std::string& domain = "");
bool verify_partial_batch(const GroupParams& params, const Big& public_share, const std::vector<Ciphertext>& cts,
                          const BatchDecryptionShare& share, const std::string& domain = "");
BatchCombineResult combine_decryptions_batch(const GroupParams& params, const ShareCommitments& commitments,
                                             const std::vector<Ciphertext>& cts,
                                             const std::vector<BatchDecryptionShare>& shares,
                                             const std::string& domain = "");

}  // namespace mixnet
