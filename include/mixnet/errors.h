#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mixnet {

// 所有 mix-net 错误的基类。
class MixnetError : public std::runtime_error {
  public:
    explicit MixnetError(const std::string& what) : std::runtime_error(what) {}
};

// 值不在 q 阶子群内，使用前拒绝，绝不截断或修正。
class InvalidGroupElement : public MixnetError {
  public:
    explicit InvalidGroupElement(const std::string& what)
        : MixnetError("invalid group element: " + what) {}
};

// 验证方程不成立。
class InvalidProof : public MixnetError {
  public:
    explicit InvalidProof(const std::string& what) : MixnetError("invalid proof: " + what) {}
};

// 某个 sealer 的部分解密未通过验证，index 为其份额序号（从 1 开始）。
class InvalidPartial : public MixnetError {
  public:
    explicit InvalidPartial(size_t index)
        : MixnetError("invalid partial decryption from share " + std::to_string(index)),
          index_(index) {}

    size_t index() const { return index_; }

  private:
    size_t index_;
};

// 通过验证的部分解密不足门限 t。rejected 记录被剔除的份额序号。
class InsufficientShares : public MixnetError {
  public:
    InsufficientShares(size_t available, size_t required, std::vector<size_t> rejected)
        : MixnetError("insufficient shares: " + std::to_string(available) + " of " +
                      std::to_string(required)),
          available_(available),
          required_(required),
          rejected_(std::move(rejected)) {}

    size_t available() const { return available_; }
    size_t required() const { return required_; }
    const std::vector<size_t>& rejected() const { return rejected_; }

  private:
    size_t available_;
    size_t required_;
    std::vector<size_t> rejected_;
};

// 安全熵源不可用，致命错误，不允许退回弱随机源。
class RandomnessFailure : public MixnetError {
  public:
    explicit RandomnessFailure(const std::string& what)
        : MixnetError("randomness failure: " + what) {}
};

}  // namespace mixnet
