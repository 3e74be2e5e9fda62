/**
 * 定长大端序列化
 * 群元素按 p 的字节宽度，标量按 q 的字节宽度，计数为 4 字节大端。
 * 解码时校验长度、子群成员和标量范围，截断或多余字节一律拒绝。
 */

#pragma once

#include "mixnet/elgamal.h"
#include "mixnet/group.h"
#include "mixnet/reencryption_proof.h"
#include "mixnet/shuffle.h"
#include "mixnet/sigma.h"
#include "mixnet/threshold.h"

#include <cstdint>
#include <string>
#include <vector>

namespace mixnet {

using Bytes = std::vector<uint8_t>;

class ByteWriter {
  public:
    explicit ByteWriter(const GroupParams& params) : params_(params) {}

    ByteWriter& element(const Big& x);
    ByteWriter& scalar(const Big& s);
    ByteWriter& u32(uint32_t v);
    ByteWriter& elements(const std::vector<Big>& xs);  // 带计数
    const Bytes& bytes() const { return out_; }

  private:
    const GroupParams& params_;
    Bytes out_;
};

class ByteReader {
  public:
    ByteReader(const GroupParams& params, const Bytes& data) : params_(params), data_(data) {}

    /**
     * @throws std::invalid_argument 数据不足
     * @throws InvalidGroupElement 不在子群内
     */
    Big element();
    Big scalar();
    uint32_t u32();
    std::vector<Big> elements();

    // 必须恰好读完
    void finish() const;

  private:
    const uint8_t* take(size_t len);

    const GroupParams& params_;
    const Bytes& data_;
    size_t offset_ = 0;
};

Bytes encode_element(const GroupParams& params, const Big& x);
Big decode_element(const GroupParams& params, const Bytes& data);
Bytes encode_scalar(const GroupParams& params, const Big& s);
Big decode_scalar(const GroupParams& params, const Bytes& data);

Bytes encode_ciphertext(const GroupParams& params, const Ciphertext& ct);
Ciphertext decode_ciphertext(const GroupParams& params, const Bytes& data);
Bytes encode_ciphertexts(const GroupParams& params, const std::vector<Ciphertext>& cts);
std::vector<Ciphertext> decode_ciphertexts(const GroupParams& params, const Bytes& data);

Bytes encode_reencryption_proof(const GroupParams& params, const ReEncryptionProof& proof);
ReEncryptionProof decode_reencryption_proof(const GroupParams& params, const Bytes& data);

Bytes encode_dleq_proof(const GroupParams& params, const DleqProof& proof);
DleqProof decode_dleq_proof(const GroupParams& params, const Bytes& data);

Bytes encode_shuffle_proof(const GroupParams& params, const ShuffleProof& proof);
ShuffleProof decode_shuffle_proof(const GroupParams& params, const Bytes& data);

Bytes encode_decryption_share(const GroupParams& params, const DecryptionShare& share);
DecryptionShare decode_decryption_share(const GroupParams& params, const Bytes& data);

std::string to_hex(const Bytes& buf);

/**
 * @throws std::invalid_argument 奇数长度或非十六进制字符
 */
Bytes hex_to_bytes(const std::string& hex);

}  // namespace mixnet
