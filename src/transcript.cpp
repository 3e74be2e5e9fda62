#include "mixnet/transcript.h"

#include "mixnet/hash.h"

namespace mixnet {

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

Big digest_to_scalar(const GroupParams& params, const Digest& seed) {
    // 多取 16 字节，模 q 的偏差可忽略
    auto wide = sha256_expand(std::vector<uint8_t>(seed.begin(), seed.end()), params.scalar_bytes() + 16);
    return params.reduce_q(BNUtils::from_bytes(wide));
}

}  // namespace

Transcript::Transcript(const std::string& domain) { append_string("domain", domain); }

Transcript& Transcript::append_bytes(const std::string& label, const std::vector<uint8_t>& value) {
    put_u32(data_, static_cast<uint32_t>(label.size()));
    data_.insert(data_.end(), label.begin(), label.end());
    put_u32(data_, static_cast<uint32_t>(value.size()));
    data_.insert(data_.end(), value.begin(), value.end());
    return *this;
}

Transcript& Transcript::append_string(const std::string& label, const std::string& value) {
    return append_bytes(label, std::vector<uint8_t>(value.begin(), value.end()));
}

Transcript& Transcript::append_u64(const std::string& label, uint64_t value) {
    std::vector<uint8_t> bytes(8);
    for (int i = 7; i >= 0; --i) {
        bytes[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return append_bytes(label, bytes);
}

Transcript& Transcript::append_element(const GroupParams& params, const std::string& label, const Big& value) {
    return append_bytes(label, BNUtils::to_bytes(value, params.element_bytes()));
}

Transcript& Transcript::append_elements(const GroupParams& params, const std::string& label,
                                        const std::vector<Big>& values) {
    append_u64(label + ".len", values.size());
    for (const auto& v : values) append_element(params, label, v);
    return *this;
}

Transcript& Transcript::append_group(const GroupParams& params) {
    append_element(params, "p", params.p);
    return append_element(params, "g", params.g);
}

Big Transcript::challenge(const GroupParams& params) const {
    return digest_to_scalar(params, sha256(data_));
}

Big Transcript::derive_scalar(const GroupParams& params, uint64_t index) const {
    Digest inner = sha256(data_);
    Digest outer = Sha256()
                       .update_u32(static_cast<uint32_t>(index >> 32))
                       .update_u32(static_cast<uint32_t>(index & 0xFFFFFFFFu))
                       .update(inner.data(), inner.size())
                       .finish();
    return digest_to_scalar(params, outer);
}

}  // namespace mixnet
