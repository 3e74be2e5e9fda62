#pragma once

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mixnet {

struct MdCtxDeleter { void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); } };
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

using Digest = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

// 增量 SHA-256，封装 EVP 接口。
class Sha256 {
  public:
    Sha256();

    Sha256& update(const uint8_t* data, size_t len);
    Sha256& update(const std::vector<uint8_t>& data);
    Sha256& update(const std::string& data);
    Sha256& update_u32(uint32_t value);  // 大端 4 字节
    Digest finish();

  private:
    MdCtx ctx_;
};

Digest sha256(const std::vector<uint8_t>& data);

/**
 * SHA-256 计数器模式扩展
 * out = SHA256(seed||0) || SHA256(seed||1) || ... 截断到 length
 * @param seed 种子
 * @param length 输出长度
 */
std::vector<uint8_t> sha256_expand(const std::vector<uint8_t>& seed, size_t length);

}  // namespace mixnet
