#include "mixnet/tally.h"

#include <stdexcept>

namespace mixnet {

Encoding parse_encoding(const std::string& name) {
    if (name == "exp" || name == "exponential") return Encoding::kExponential;
    if (name == "residue") return Encoding::kResidue;
    throw std::invalid_argument("unknown encoding: " + name);
}

Big Tally::encode(const GroupParams& params, uint64_t value, Encoding encoding) {
    if (encoding == Encoding::kExponential) return ElGamal::encode_exponential(params, value);
    return ElGamal::encode_residue(params, value);
}

uint64_t Tally::decode(const GroupParams& params, const Big& plaintext, Encoding encoding, uint64_t max) {
    if (encoding == Encoding::kExponential) return ElGamal::decode_exponential(params, plaintext, max);
    return ElGamal::decode_residue(params, plaintext);
}

std::map<uint64_t, size_t> Tally::count(const GroupParams& params, const std::vector<Big>& plaintexts,
                                        Encoding encoding, uint64_t max) {
    std::map<uint64_t, size_t> counts;
    for (const auto& m : plaintexts) ++counts[decode(params, m, encoding, max)];
    return counts;
}

Ciphertext Tally::accumulate(const GroupParams& params, const std::vector<Ciphertext>& cts) {
    if (cts.empty()) throw std::invalid_argument("accumulate: no ciphertexts");
    auto acc = cts[0].clone();
    ElGamal::ensure_valid(params, acc);
    for (size_t i = 1; i < cts.size(); ++i) acc = ElGamal::combine(params, acc, cts[i]);
    return acc;
}

}  // namespace mixnet
