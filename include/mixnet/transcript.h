#pragma once

#include "mixnet/bn_utils.h"
#include "mixnet/group.h"

#include <cstdint>
#include <string>
#include <vector>

namespace mixnet {

/**
 * Fiat-Shamir 转录
 * 每个字段按 (标签长度, 标签, 值长度, 值) 追加，群元素和标量定长大端编码，
 * 挑战为 SHA-256 计数器扩展后模 q。可拷贝，便于从同一前缀派生多个挑战。
 */
class Transcript {
  public:
    /**
     * @param domain 协议标签，例如 "reencryption"
     */
    explicit Transcript(const std::string& domain);

    Transcript& append_bytes(const std::string& label, const std::vector<uint8_t>& value);
    Transcript& append_string(const std::string& label, const std::string& value);
    Transcript& append_u64(const std::string& label, uint64_t value);
    Transcript& append_element(const GroupParams& params, const std::string& label, const Big& value);
    Transcript& append_elements(const GroupParams& params, const std::string& label,
                                const std::vector<Big>& values);

    // 群参数本身也进入转录
    Transcript& append_group(const GroupParams& params);

    /**
     * 当前转录的挑战，落在 [0, q)
     */
    Big challenge(const GroupParams& params) const;

    /**
     * 由当前转录和下标派生标量 H(i, H(transcript)) mod q
     */
    Big derive_scalar(const GroupParams& params, uint64_t index) const;

  private:
    std::vector<uint8_t> data_;
};

}  // namespace mixnet
