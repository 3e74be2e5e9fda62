#include "mixnet/elgamal.h"
#include "mixnet/errors.h"
#include "test_util.h"

using namespace mixnet;
using mixnet_test::run;
using mixnet_test::same;
using mixnet_test::throws;

bool test_encrypt_decrypt() {
    auto params = GroupParams::preset("256");
    SystemRandom rng;
    auto kp = ElGamal::generate_keypair(params, rng);
    for (uint64_t v = 0; v < 20; ++v) {
        auto m = ElGamal::encode_exponential(params, v);
        auto ct = ElGamal::encrypt(params, kp.pk, m, rng);
        if (!same(ElGamal::decrypt(params, kp.sk, ct), m)) return false;
    }
    // 任意子群元素
    auto m = params.pow_g(params.random_exponent(rng));
    return same(ElGamal::decrypt(params, kp.sk, ElGamal::encrypt(params, kp.pk, m, rng)), m);
}

bool test_reencrypt_preserves_plaintext() {
    auto params = GroupParams::preset("256");
    SystemRandom rng;
    auto kp = ElGamal::generate_keypair(params, rng);
    auto m = ElGamal::encode_exponential(params, 7);
    auto ct = ElGamal::encrypt(params, kp.pk, m, rng);
    auto ct2 = ElGamal::reencrypt(params, kp.pk, ct, rng);
    auto ct3 = ElGamal::reencrypt(params, kp.pk, ct2, rng);
    return ct != ct2 && ct2 != ct3 && same(ElGamal::decrypt(params, kp.sk, ct3), m);
}

bool test_witness_encryption() {
    auto params = GroupParams::preset("256");
    SystemRandom rng;
    auto kp = ElGamal::generate_keypair(params, rng);
    auto m = ElGamal::encode_exponential(params, 3);
    auto [ct, r] = ElGamal::encrypt_with_witness(params, kp.pk, m, rng);
    auto again = ElGamal::encrypt(params, kp.pk, m, r);
    auto zero = BNUtils::from_uint(0);
    return ct == again && same(ct.c1, params.pow_g(r)) &&
           throws<std::invalid_argument>([&] { ElGamal::encrypt(params, kp.pk, m, zero); }) &&
           throws<std::invalid_argument>([&] { ElGamal::encrypt(params, kp.pk, m, params.q); });
}

bool test_homomorphic_sum() {
    auto params = GroupParams::preset("256");
    SystemRandom rng;
    auto kp = ElGamal::generate_keypair(params, rng);
    auto a = ElGamal::encrypt(params, kp.pk, ElGamal::encode_exponential(params, 12), rng);
    auto b = ElGamal::encrypt(params, kp.pk, ElGamal::encode_exponential(params, 30), rng);
    auto sum = ElGamal::combine(params, a, b);
    return ElGamal::decode_exponential(params, ElGamal::decrypt(params, kp.sk, sum), 100) == 42;
}

bool test_exponential_decode_bounds() {
    auto params = GroupParams::preset("256");
    auto m = ElGamal::encode_exponential(params, 1000);
    return ElGamal::decode_exponential(params, m, 1000) == 1000 &&
           ElGamal::decode_exponential(params, ElGamal::encode_exponential(params, 0), 0) == 0 &&
           throws<std::out_of_range>([&] { ElGamal::decode_exponential(params, m, 999); }) &&
           throws<std::invalid_argument>(
               [&] { ElGamal::decode_exponential(params, m, kMaxDecodablePlaintext + 1); }) &&
           throws<std::invalid_argument>([&] { ElGamal::decode_exponential(params, m, UINT64_MAX); });
}

bool test_residue_encoding() {
    auto params = GroupParams::preset("sm");
    for (uint64_t k = 0; k < 64; ++k) {
        auto m = ElGamal::encode_residue(params, k);
        if (!params.is_member(m) || ElGamal::decode_residue(params, m) != k) return false;
    }
    uint64_t q = BNUtils::to_uint(params.q);
    return ElGamal::decode_residue(params, ElGamal::encode_residue(params, q - 1)) == q - 1 &&
           throws<std::out_of_range>([&] { ElGamal::encode_residue(params, q); });
}

bool test_rejects_non_members() {
    auto params = GroupParams::preset("256");
    SystemRandom rng;
    auto kp = ElGamal::generate_keypair(params, rng);
    auto bad = mixnet_test::non_member(params);
    auto good = ElGamal::encode_exponential(params, 1);
    Ciphertext bad_ct(BNUtils::dup(bad), BNUtils::dup(good));
    PublicKey bad_pk(BNUtils::dup(bad));
    return throws<InvalidGroupElement>([&] { ElGamal::encrypt(params, kp.pk, bad, rng); }) &&
           throws<InvalidGroupElement>([&] { ElGamal::decrypt(params, kp.sk, bad_ct); }) &&
           throws<InvalidGroupElement>([&] { ElGamal::reencrypt(params, kp.pk, bad_ct, rng); }) &&
           throws<InvalidGroupElement>([&] { ElGamal::encrypt(params, bad_pk, good, rng); });
}

bool test_combined_public_key() {
    auto params = GroupParams::preset("256");
    SystemRandom rng;
    auto a = ElGamal::generate_keypair(params, rng);
    auto b = ElGamal::generate_keypair(params, rng);
    std::vector<PublicKey> shares;
    shares.push_back(a.pk.clone());
    shares.push_back(b.pk.clone());
    auto joint = ElGamal::combine_public_keys(params, shares);
    SecretKey joint_sk(params.add_q(a.sk.x, b.sk.x));
    auto m = ElGamal::encode_exponential(params, 5);
    auto ct = ElGamal::encrypt(params, joint, m, rng);
    return same(ElGamal::decrypt(params, joint_sk, ct), m) &&
           same(ElGamal::derive_public_key(params, joint_sk).h, joint.h);
}

int main() {
    bool ok = true;
    ok &= run("EncryptDecrypt", test_encrypt_decrypt);
    ok &= run("ReencryptPreservesPlaintext", test_reencrypt_preserves_plaintext);
    ok &= run("WitnessEncryption", test_witness_encryption);
    ok &= run("HomomorphicSum", test_homomorphic_sum);
    ok &= run("ExponentialDecodeBounds", test_exponential_decode_bounds);
    ok &= run("ResidueEncoding", test_residue_encoding);
    ok &= run("RejectsNonMembers", test_rejects_non_members);
    ok &= run("CombinedPublicKey", test_combined_public_key);
    return ok ? 0 : 1;
}
