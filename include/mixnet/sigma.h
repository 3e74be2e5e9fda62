/**
 * Sigma 证明工具
 * 离散对数相等 (DLEQ) 的三步协议，经 Fiat-Shamir 变为非交互：
 *   陈述：底 g_1..g_k，像 y_j = g_j^x
 *   承诺：a_j = g_j^w
 *   挑战：c = H(上下文, 底, 像, 承诺) mod q
 *   响应：s = w + c·x mod q
 *   验证：g_j^s == a_j · y_j^c，且 c 可重算
 * k = 1 即 Schnorr 知识证明。
 */

#pragma once

#include "mixnet/bn_utils.h"
#include "mixnet/group.h"
#include "mixnet/random.h"
#include "mixnet/transcript.h"

#include <utility>
#include <vector>

namespace mixnet {

struct DleqProof {
    std::vector<Big> commitments;
    Big challenge;
    Big response;

    DleqProof(std::vector<Big> commitments_in, Big challenge_in, Big response_in)
        : commitments(std::move(commitments_in)),
          challenge(std::move(challenge_in)),
          response(std::move(response_in)) {}

    DleqProof clone() const;
};

class Sigma {
  public:
    Sigma() = delete;

    /**
     * 生成证明，w 每次从 rng 现取
     * @param context 调用方预先写入协议标签和附加绑定数据的转录
     * @param bases 底，须为子群元素
     * @param images 像 y_j = g_j^x
     * @param witness x
     * @throws std::invalid_argument 底与像个数不一致或为空
     * @throws RandomnessFailure
     */
    static DleqProof prove(const GroupParams& params, Transcript context, const std::vector<Big>& bases,
                           const std::vector<Big>& images, const Big& witness, RandomSource& rng);

    /**
     * 验证证明，纯函数，不抛验证类异常
     */
    static bool verify(const GroupParams& params, Transcript context, const std::vector<Big>& bases,
                       const std::vector<Big>& images, const DleqProof& proof);

    // 绑定底、像、承诺后的挑战
    static Big challenge(const GroupParams& params, Transcript context, const std::vector<Big>& bases,
                         const std::vector<Big>& images, const std::vector<Big>& commitments);
};

}  // namespace mixnet
