#include "mixnet/hash.h"

#include <algorithm>
#include <stdexcept>

namespace mixnet {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("EVP_DigestInit_ex failed");
}

Sha256& Sha256::update(const uint8_t* data, size_t len) {
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) throw std::runtime_error("EVP_DigestUpdate failed");
    return *this;
}

Sha256& Sha256::update(const std::vector<uint8_t>& data) { return update(data.data(), data.size()); }

Sha256& Sha256::update(const std::string& data) {
    return update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Sha256& Sha256::update_u32(uint32_t value) {
    uint8_t bytes[4] = {static_cast<uint8_t>((value >> 24) & 0xFF),
                        static_cast<uint8_t>((value >> 16) & 0xFF),
                        static_cast<uint8_t>((value >> 8) & 0xFF),
                        static_cast<uint8_t>(value & 0xFF)};
    return update(bytes, sizeof(bytes));
}

Digest Sha256::finish() {
    Digest digest{};
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), nullptr) != 1)
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    return digest;
}

Digest sha256(const std::vector<uint8_t>& data) { return Sha256().update(data).finish(); }

std::vector<uint8_t> sha256_expand(const std::vector<uint8_t>& seed, size_t length) {
    std::vector<uint8_t> out(length);
    size_t produced = 0;
    uint32_t counter = 0;
    while (produced < length) {
        Digest block = Sha256().update(seed).update_u32(counter).finish();
        size_t to_copy = std::min(block.size(), length - produced);
        std::copy_n(block.begin(), to_copy, out.begin() + produced);
        produced += to_copy;
        ++counter;
    }
    return out;
}

}  // namespace mixnet
