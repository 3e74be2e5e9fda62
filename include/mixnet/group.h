/**
 * 群运算
 * 安全素数 p = 2q + 1 下的 q 阶二次剩余子群，生成元 g。
 * 所有外部输入的群元素在使用前都必须通过 is_member 检查。
 */

#pragma once

#include "mixnet/bn_utils.h"
#include "mixnet/random.h"

#include <string>
#include <utility>
#include <vector>

namespace mixnet {

// 模数比特数下限（仅测试规模）与推荐值
constexpr int kMinimumModulusBits = 32;
constexpr int kDefaultModulusBits = 2048;

// 预置参数集的名字
constexpr const char* kDefaultPreset = "256";

/**
 * 群参数 (p, q, g)，进程内不可变，按 const 引用共享
 */
struct GroupParams {
    Big p;
    Big q;
    Big g;

    GroupParams(Big p_in, Big q_in, Big g_in)
        : p(std::move(p_in)), q(std::move(q_in)), g(std::move(g_in)) {}

    /**
     * 由安全素数和生成元构造并校验
     * @throws std::invalid_argument p 或 (p-1)/2 不是素数，或 g 不是 q 阶生成元
     */
    static GroupParams from_safe_prime(const Big& p, const Big& g);

    /**
     * 预置参数集：sm(48) 256 512 md(1024) lg(2048) xl(3072)，g = 4
     * @throws std::invalid_argument 未知名字
     */
    static GroupParams preset(const std::string& name);
    static std::vector<std::string> preset_names();

    /**
     * 生成新的安全素数参数
     * @param bits 模数比特数
     * @throws std::invalid_argument bits 低于 kMinimumModulusBits
     */
    static GroupParams generate(int bits);

    GroupParams clone() const;
    bool same_as(const GroupParams& other) const;

    // 定长序列化宽度
    size_t element_bytes() const;
    size_t scalar_bytes() const;

    Big modpow(const Big& base, const Big& exp) const;
    Big modpow(const Big& base, const Big& exp, BN_CTX* ctx) const;
    Big pow_g(const Big& exp) const;
    Big mul_mod(const Big& a, const Big& b) const;
    Big mul_mod(const Big& a, const Big& b, BN_CTX* ctx) const;
    Big inv_mod(const Big& a) const;
    Big div_mod(const Big& a, const Big& b) const;  // a * b^{-1} mod p

    Big product(const std::vector<Big>& elems) const;

    // Z_q 上的标量运算
    Big add_q(const Big& a, const Big& b) const;
    Big sub_q(const Big& a, const Big& b) const;
    Big mul_q(const Big& a, const Big& b) const;
    Big reduce_q(const Big& a) const;

    // 0 < x < p 且 x^q == 1 mod p
    bool is_member(const Big& x) const;

    /**
     * 成员检查，失败抛异常
     * @param what 出错时的描述
     * @throws InvalidGroupElement
     */
    void ensure_member(const Big& x, const std::string& what) const;

    // 0 <= s < q
    bool is_scalar(const Big& s) const;

    /**
     * 在 [1, q-1] 内均匀取随机指数，每次加密/承诺都必须重新抽取
     * @throws RandomnessFailure
     */
    Big random_exponent(RandomSource& rng) const;

    /**
     * 由哈希派生相互独立的生成元，没有人知道它们之间的离散对数
     * h_i = (H(domain, "ggen", i, ctr) mod p)^2，跳过 0 和 1
     * @param domain 域分隔串（选举 id）
     * @param count 个数
     */
    std::vector<Big> derive_generators(const std::string& domain, size_t count) const;
};

}  // namespace mixnet
