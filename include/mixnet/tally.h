#pragma once

#include "mixnet/elgamal.h"
#include "mixnet/group.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mixnet {

// 选票明文编码方式
enum class Encoding {
    kExponential,  // g^m，可同态求和，解码需离散对数搜索
    kResidue,      // (m+1)^2 mod p，直接开方解码
};

Encoding parse_encoding(const std::string& name);

class Tally {
  public:
    Tally() = delete;

    static Big encode(const GroupParams& params, uint64_t value, Encoding encoding);

    /**
     * @throws std::out_of_range 指数编码下明文超过 max
     * @throws InvalidGroupElement
     */
    static uint64_t decode(const GroupParams& params, const Big& plaintext, Encoding encoding,
                           uint64_t max = kDefaultMaxPlaintext);

    // 解码后按取值计数
    static std::map<uint64_t, size_t> count(const GroupParams& params, const std::vector<Big>& plaintexts,
                                            Encoding encoding, uint64_t max = kDefaultMaxPlaintext);

    /**
     * 同态累加全部密文，指数编码下解密即得总和
     * @throws std::invalid_argument 密文列表为空
     */
    static Ciphertext accumulate(const GroupParams& params, const std::vector<Ciphertext>& cts);
};

}  // namespace mixnet
