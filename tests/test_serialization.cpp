#include "mixnet/serialization.h"
#include "test_util.h"

using namespace mixnet;
using mixnet_test::non_member;
using mixnet_test::run;
using mixnet_test::same;
using mixnet_test::throws;

bool test_fixed_widths() {
    auto params = GroupParams::preset("256");
    SystemRandom rng;
    auto kp = ElGamal::generate_keypair(params, rng);
    auto ct = ElGamal::encrypt(params, kp.pk, ElGamal::encode_exponential(params, 1), rng);
    auto small = BNUtils::from_uint(4);  // 高位补零

    auto elem = encode_element(params, small);
    auto ct_bytes = encode_ciphertext(params, ct);
    std::vector<Ciphertext> list;
    list.push_back(ct.clone());
    list.push_back(ct.clone());
    auto list_bytes = encode_ciphertexts(params, list);

    return params.element_bytes() == 32 && elem.size() == 32 && elem[0] == 0 && elem[31] == 4 &&
           ct_bytes.size() == 64 && list_bytes.size() == 4 + 128 && list_bytes[3] == 2 &&
           same(decode_element(params, elem), small) && decode_ciphertext(params, ct_bytes) == ct &&
           decode_ciphertexts(params, list_bytes).size() == 2;
}

bool test_rejects_bad_lengths() {
    auto params = GroupParams::preset("256");
    auto elem = encode_element(params, params.g);
    auto longer = elem;
    longer.push_back(0);
    auto shorter = elem;
    shorter.pop_back();
    Bytes huge_count = {0xFF, 0xFF, 0xFF, 0xFF};

    return throws<std::invalid_argument>([&] { decode_element(params, longer); }) &&
           throws<std::invalid_argument>([&] { decode_element(params, shorter); }) &&
           throws<std::invalid_argument>([&] { decode_element(params, Bytes()); }) &&
           throws<std::invalid_argument>([&] { decode_ciphertext(params, elem); }) &&
           throws<std::invalid_argument>([&] { decode_ciphertexts(params, huge_count); }) &&
           throws<std::invalid_argument>([&] { decode_dleq_proof(params, huge_count); });
}

bool test_rejects_non_members() {
    auto params = GroupParams::preset("256");
    auto zero = Bytes(params.element_bytes(), 0);
    auto minus_one = encode_element(params, non_member(params));
    // p 本身超出范围
    auto p_bytes = BNUtils::to_bytes(params.p, params.element_bytes());

    Bytes ct = minus_one;
    auto g = encode_element(params, params.g);
    ct.insert(ct.end(), g.begin(), g.end());

    return throws<InvalidGroupElement>([&] { decode_element(params, zero); }) &&
           throws<InvalidGroupElement>([&] { decode_element(params, minus_one); }) &&
           throws<InvalidGroupElement>([&] { decode_element(params, p_bytes); }) &&
           throws<InvalidGroupElement>([&] { decode_ciphertext(params, ct); });
}

bool test_scalar_range() {
    auto params = GroupParams::preset("256");
    auto q_bytes = BNUtils::to_bytes(params.q, params.scalar_bytes());
    auto top = BNUtils::dup(params.q);
    BNUtils::sub_word(top, 1);
    return same(decode_scalar(params, encode_scalar(params, top)), top) &&
           throws<std::invalid_argument>([&] { decode_scalar(params, q_bytes); });
}

bool test_proof_blobs() {
    auto params = GroupParams::preset("256");
    SystemRandom rng;
    auto dealt = deal_shares(params, 2, 3, rng);
    auto ct = ElGamal::encrypt(params, dealt.election_key, ElGamal::encode_exponential(params, 3), rng);
    auto pd = partial_decrypt(params, dealt.shares[1], ct, rng, "e");
    DecryptionShare share(std::move(pd.first), std::move(pd.second));

    auto blob = encode_decryption_share(params, share);
    auto decoded = decode_decryption_share(params, blob);
    bool share_ok = decoded.partial.index == 2 &&
                    verify_partial(params, dealt.shares[1].public_share, ct, decoded.partial, decoded.proof, "e");

    auto trailing = blob;
    trailing.push_back(1);

    auto re = reencrypt_with_proof(params, dealt.election_key, ct, rng);
    auto re_blob = encode_reencryption_proof(params, re.second);
    auto re_decoded = decode_reencryption_proof(params, re_blob);

    // 序号写成 4 字节，放不下时拒绝而不是截断
    DecryptionShare wide(PartialDecryption(size_t(1) << 32, BNUtils::dup(share.partial.value)), share.proof.clone());
    bool wide_rejected = throws<std::invalid_argument>([&] { encode_decryption_share(params, wide); });

    return share_ok && wide_rejected && re_blob.size() == 128 &&
           verify_reencryption(params, dealt.election_key, ct, re.first, re_decoded) &&
           throws<std::invalid_argument>([&] { decode_decryption_share(params, trailing); }) &&
           throws<std::invalid_argument>(
               [&] { decode_reencryption_proof(params, Bytes(re_blob.begin(), re_blob.end() - 1)); });
}

bool test_hex() {
    Bytes buf = {0x00, 0xab, 0x10, 0xff};
    return to_hex(buf) == "00ab10ff" && hex_to_bytes("00AB10ff") == buf && hex_to_bytes("").empty() &&
           throws<std::invalid_argument>([] { hex_to_bytes("abc"); }) &&
           throws<std::invalid_argument>([] { hex_to_bytes("zz"); });
}

int main() {
    bool ok = true;
    ok &= run("FixedWidths", test_fixed_widths);
    ok &= run("RejectsBadLengths", test_rejects_bad_lengths);
    ok &= run("RejectsNonMembers", test_rejects_non_members);
    ok &= run("ScalarRange", test_scalar_range);
    ok &= run("ProofBlobs", test_proof_blobs);
    ok &= run("Hex", test_hex);
    return ok ? 0 : 1;
}
