#include "mixnet/serialization.h"

#include "mixnet/errors.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mixnet {

ByteWriter& ByteWriter::element(const Big& x) {
    auto b = BNUtils::to_bytes(x, params_.element_bytes());
    out_.insert(out_.end(), b.begin(), b.end());
    return *this;
}

ByteWriter& ByteWriter::scalar(const Big& s) {
    auto b = BNUtils::to_bytes(s, params_.scalar_bytes());
    out_.insert(out_.end(), b.begin(), b.end());
    return *this;
}

ByteWriter& ByteWriter::u32(uint32_t v) {
    out_.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out_.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out_.push_back(static_cast<uint8_t>(v & 0xFF));
    return *this;
}

ByteWriter& ByteWriter::elements(const std::vector<Big>& xs) {
    u32(static_cast<uint32_t>(xs.size()));
    for (const auto& x : xs) element(x);
    return *this;
}

const uint8_t* ByteReader::take(size_t len) {
    if (data_.size() - offset_ < len) throw std::invalid_argument("truncated blob");
    const uint8_t* p = data_.data() + offset_;
    offset_ += len;
    return p;
}

Big ByteReader::element() {
    auto x = BNUtils::from_bytes(take(params_.element_bytes()), params_.element_bytes());
    params_.ensure_member(x, "decoded element");
    return x;
}

Big ByteReader::scalar() {
    auto s = BNUtils::from_bytes(take(params_.scalar_bytes()), params_.scalar_bytes());
    if (!params_.is_scalar(s)) throw std::invalid_argument("decoded scalar not below q");
    return s;
}

uint32_t ByteReader::u32() {
    const uint8_t* b = take(4);
    return (static_cast<uint32_t>(b[0]) << 24) | (static_cast<uint32_t>(b[1]) << 16) |
           (static_cast<uint32_t>(b[2]) << 8) | static_cast<uint32_t>(b[3]);
}

std::vector<Big> ByteReader::elements() {
    uint32_t n = u32();
    // 计数不能超过剩余数据能容纳的个数
    if (n > (data_.size() - offset_) / params_.element_bytes()) throw std::invalid_argument("bad element count");
    std::vector<Big> xs;
    xs.reserve(n);
    for (uint32_t i = 0; i < n; ++i) xs.push_back(element());
    return xs;
}

void ByteReader::finish() const {
    if (offset_ != data_.size()) throw std::invalid_argument("trailing bytes in blob");
}

Bytes encode_element(const GroupParams& params, const Big& x) { return ByteWriter(params).element(x).bytes(); }

Big decode_element(const GroupParams& params, const Bytes& data) {
    ByteReader r(params, data);
    auto x = r.element();
    r.finish();
    return x;
}

Bytes encode_scalar(const GroupParams& params, const Big& s) { return ByteWriter(params).scalar(s).bytes(); }

Big decode_scalar(const GroupParams& params, const Bytes& data) {
    ByteReader r(params, data);
    auto s = r.scalar();
    r.finish();
    return s;
}

Bytes encode_ciphertext(const GroupParams& params, const Ciphertext& ct) {
    return ByteWriter(params).element(ct.c1).element(ct.c2).bytes();
}

Ciphertext decode_ciphertext(const GroupParams& params, const Bytes& data) {
    ByteReader r(params, data);
    auto c1 = r.element();
    auto c2 = r.element();
    r.finish();
    return Ciphertext(std::move(c1), std::move(c2));
}

Bytes encode_ciphertexts(const GroupParams& params, const std::vector<Ciphertext>& cts) {
    ByteWriter w(params);
    w.u32(static_cast<uint32_t>(cts.size()));
    for (const auto& ct : cts) w.element(ct.c1).element(ct.c2);
    return w.bytes();
}

std::vector<Ciphertext> decode_ciphertexts(const GroupParams& params, const Bytes& data) {
    ByteReader r(params, data);
    uint32_t n = r.u32();
    if (n > data.size() / (2 * params.element_bytes())) throw std::invalid_argument("bad ciphertext count");
    std::vector<Ciphertext> cts;
    cts.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        auto c1 = r.element();
        auto c2 = r.element();
        cts.emplace_back(std::move(c1), std::move(c2));
    }
    r.finish();
    return cts;
}

Bytes encode_reencryption_proof(const GroupParams& params, const ReEncryptionProof& proof) {
    return ByteWriter(params).element(proof.a).element(proof.b).scalar(proof.challenge).scalar(proof.response).bytes();
}

ReEncryptionProof decode_reencryption_proof(const GroupParams& params, const Bytes& data) {
    ByteReader r(params, data);
    auto a = r.element();
    auto b = r.element();
    auto c = r.scalar();
    auto s = r.scalar();
    r.finish();
    return ReEncryptionProof(std::move(a), std::move(b), std::move(c), std::move(s));
}

Bytes encode_dleq_proof(const GroupParams& params, const DleqProof& proof) {
    return ByteWriter(params).elements(proof.commitments).scalar(proof.challenge).scalar(proof.response).bytes();
}

namespace {

DleqProof read_dleq(ByteReader& r) {
    auto commitments = r.elements();
    auto c = r.scalar();
    auto s = r.scalar();
    return DleqProof(std::move(commitments), std::move(c), std::move(s));
}

}  // namespace

DleqProof decode_dleq_proof(const GroupParams& params, const Bytes& data) {
    ByteReader r(params, data);
    auto proof = read_dleq(r);
    r.finish();
    return proof;
}

// N | c s1 s2 s3 s4 | ŝ[N] | s̃[N] | c[N] | ĉ[N]
Bytes encode_shuffle_proof(const GroupParams& params, const ShuffleProof& proof) {
    ByteWriter w(params);
    w.u32(static_cast<uint32_t>(proof.size()));
    w.scalar(proof.challenge).scalar(proof.s1).scalar(proof.s2).scalar(proof.s3).scalar(proof.s4);
    for (const auto& s : proof.s_hat) w.scalar(s);
    for (const auto& s : proof.s_tilde) w.scalar(s);
    for (const auto& c : proof.permutation_commitment) w.element(c);
    for (const auto& c : proof.commitment_chain) w.element(c);
    return w.bytes();
}

ShuffleProof decode_shuffle_proof(const GroupParams& params, const Bytes& data) {
    ByteReader r(params, data);
    uint32_t n = r.u32();
    size_t per_item = 2 * params.scalar_bytes() + 2 * params.element_bytes();
    if (n == 0 || n > data.size() / per_item) throw std::invalid_argument("bad shuffle proof size");

    ShuffleProof proof;
    proof.challenge = r.scalar();
    proof.s1 = r.scalar();
    proof.s2 = r.scalar();
    proof.s3 = r.scalar();
    proof.s4 = r.scalar();
    for (uint32_t i = 0; i < n; ++i) proof.s_hat.push_back(r.scalar());
    for (uint32_t i = 0; i < n; ++i) proof.s_tilde.push_back(r.scalar());
    for (uint32_t i = 0; i < n; ++i) proof.permutation_commitment.push_back(r.element());
    for (uint32_t i = 0; i < n; ++i) proof.commitment_chain.push_back(r.element());
    r.finish();
    return proof;
}

Bytes encode_decryption_share(const GroupParams& params, const DecryptionShare& share) {
    if (share.partial.index > UINT32_MAX) throw std::invalid_argument("share index does not fit in 4 bytes");
    ByteWriter w(params);
    w.u32(static_cast<uint32_t>(share.partial.index)).element(share.partial.value);
    auto proof = encode_dleq_proof(params, share.proof);
    Bytes out = w.bytes();
    out.insert(out.end(), proof.begin(), proof.end());
    return out;
}

DecryptionShare decode_decryption_share(const GroupParams& params, const Bytes& data) {
    ByteReader r(params, data);
    uint32_t index = r.u32();
    auto d = r.element();
    auto proof = read_dleq(r);
    r.finish();
    return DecryptionShare(PartialDecryption(index, std::move(d)), std::move(proof));
}

std::string to_hex(const Bytes& buf) {
    std::ostringstream oss;
    for (uint8_t c : buf) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

Bytes hex_to_bytes(const std::string& hex) {
    if (hex.size() % 2 != 0) throw std::invalid_argument("odd-length hex string");
    for (char ch : hex)
        if (!std::isxdigit(static_cast<unsigned char>(ch))) throw std::invalid_argument("non-hex character");
    Bytes buf(hex.size() / 2);
    for (size_t i = 0; i < buf.size(); ++i)
        buf[i] = static_cast<uint8_t>(std::stoul(hex.substr(2 * i, 2), nullptr, 16));
    return buf;
}

}  // namespace mixnet
