#pragma once

#include "mixnet/bn_utils.h"

#include <cstdint>
#include <string>
#include <vector>

namespace mixnet {

/**
 * 随机源接口
 * 需要新鲜随机数的调用都显式传入 RandomSource，而不是使用全局单例，
 * 测试可以注入确定性种子。实例不可跨线程共享。
 */
class RandomSource {
  public:
    virtual ~RandomSource() = default;

    /**
     * 填充随机字节
     * @throws RandomnessFailure 熵源不可用
     */
    virtual void fill(uint8_t* out, size_t len) = 0;

    /**
     * 均匀采样 [0, bound)，默认实现为按位掩码的拒绝采样
     * @throws std::invalid_argument bound 为 0
     */
    virtual Big uniform(const Big& bound);

    // 均匀采样 [0, bound) 的小整数
    uint64_t uniform_index(uint64_t bound);
};

// 系统随机源：OpenSSL 私有 DRBG，失败直接抛 RandomnessFailure。
class SystemRandom : public RandomSource {
  public:
    void fill(uint8_t* out, size_t len) override;
    Big uniform(const Big& bound) override;
};

// 确定性随机源：SHA256(seed || counter) 字节流，仅供测试复现。
class DeterministicRandom : public RandomSource {
  public:
    explicit DeterministicRandom(const std::string& seed);

    void fill(uint8_t* out, size_t len) override;

  private:
    std::vector<uint8_t> seed_;
    uint32_t counter_ = 0;
    std::vector<uint8_t> buffer_;
    size_t offset_ = 0;
};

/**
 * 均匀随机置换 (Fisher-Yates)
 * @return perm，perm[i] 为第 i 个输出位置取用的输入下标
 */
std::vector<size_t> random_permutation(RandomSource& rng, size_t n);

}  // namespace mixnet
