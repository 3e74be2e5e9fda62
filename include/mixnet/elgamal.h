#pragma once

#include "mixnet/bn_utils.h"
#include "mixnet/group.h"
#include "mixnet/random.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mixnet {

// 指数编码解码时离散对数搜索的默认上界
constexpr uint64_t kDefaultMaxPlaintext = 1u << 20;
// 离散对数搜索上界，baby-step 表约 2^20 项
constexpr uint64_t kMaxDecodablePlaintext = uint64_t(1) << 40;

// 公钥 h = g^x，需要时按 const 引用共享。
struct PublicKey {
    Big h;

    explicit PublicKey(Big h_in) : h(std::move(h_in)) {}
    PublicKey clone() const { return PublicKey(BNUtils::dup(h)); }
};

// 私钥 x ∈ [1, q-1]，只能移动，由持有者独占。
struct SecretKey {
    Big x;

    explicit SecretKey(Big x_in) : x(std::move(x_in)) {}
};

struct KeyPair {
    PublicKey pk;
    SecretKey sk;

    KeyPair(PublicKey pk_in, SecretKey sk_in) : pk(std::move(pk_in)), sk(std::move(sk_in)) {}
};

// 密文 (c1, c2) = (g^r, m·h^r)，r 不保存。
struct Ciphertext {
    Big c1;
    Big c2;

    Ciphertext(Big c1_in, Big c2_in) : c1(std::move(c1_in)), c2(std::move(c2_in)) {}

    Ciphertext clone() const { return Ciphertext(BNUtils::dup(c1), BNUtils::dup(c2)); }
    bool operator==(const Ciphertext& other) const {
        return BNUtils::cmp(c1, other.c1) == 0 && BNUtils::cmp(c2, other.c2) == 0;
    }
    bool operator!=(const Ciphertext& other) const { return !(*this == other); }
    std::string to_string() const { return "(" + BNUtils::to_hex(c1) + ", " + BNUtils::to_hex(c2) + ")"; }
};

std::vector<Ciphertext> clone_all(const std::vector<Ciphertext>& cts);

// ElGamal 工具类：所有成员静态，群参数显式传入。
class ElGamal {
  public:
    ElGamal() = delete;

    static KeyPair generate_keypair(const GroupParams& params, RandomSource& rng);
    static PublicKey derive_public_key(const GroupParams& params, const SecretKey& sk);

    /**
     * 加密群元素 m，随机数 r 现取
     * @throws InvalidGroupElement m 或 pk 不在子群内
     * @throws RandomnessFailure
     */
    static Ciphertext encrypt(const GroupParams& params, const PublicKey& pk, const Big& m,
                              RandomSource& rng);

    /**
     * 使用调用方跟踪的见证 r 加密，之后可对 r 做证明
     * @throws std::invalid_argument r 不在 [1, q-1]
     */
    static Ciphertext encrypt(const GroupParams& params, const PublicKey& pk, const Big& m, const Big& r);

    // 加密并返回所用的随机数
    static std::pair<Ciphertext, Big> encrypt_with_witness(const GroupParams& params, const PublicKey& pk,
                                                           const Big& m, RandomSource& rng);

    // m = c2 · c1^{-x}
    static Big decrypt(const GroupParams& params, const SecretKey& sk, const Ciphertext& ct);

    // 分量相乘：明文相乘，指数编码下明文相加
    static Ciphertext combine(const GroupParams& params, const Ciphertext& a, const Ciphertext& b);

    // (c1·g^r, c2·h^r)，明文不变
    static Ciphertext reencrypt(const GroupParams& params, const PublicKey& pk, const Ciphertext& ct,
                                const Big& r);
    static Ciphertext reencrypt(const GroupParams& params, const PublicKey& pk, const Ciphertext& ct,
                                RandomSource& rng);

    // 选举公钥：各 sealer 公钥份额之积
    static PublicKey combine_public_keys(const GroupParams& params, const std::vector<PublicKey>& shares);

    // 指数编码 g^m，解码用 baby-step giant-step 在 [0, max] 内搜索
    static Big encode_exponential(const GroupParams& params, uint64_t m);

    /**
     * @throws std::out_of_range 明文不在 [0, max] 内
     * @throws std::invalid_argument max 超过 kMaxDecodablePlaintext
     */
    static uint64_t decode_exponential(const GroupParams& params, const Big& encoded,
                                       uint64_t max = kDefaultMaxPlaintext);

    // 直接编码：k -> (k+1)^2 mod p，要求 k+1 <= q
    static Big encode_residue(const GroupParams& params, uint64_t k);
    static uint64_t decode_residue(const GroupParams& params, const Big& encoded);

    // 校验公钥/密文各分量在子群内
    static void ensure_valid(const GroupParams& params, const PublicKey& pk);
    static void ensure_valid(const GroupParams& params, const Ciphertext& ct);
};

}  // namespace mixnet
