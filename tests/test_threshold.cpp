#include "mixnet/serialization.h"
#include "mixnet/threshold.h"
#include "test_util.h"

using namespace mixnet;
using mixnet_test::run;
using mixnet_test::same;
using mixnet_test::throws;

namespace {

const std::string kElection = "election-7";

struct Fixture {
    GroupParams params = GroupParams::preset("256");
    SystemRandom rng;
    DealtKey dealt = deal_shares(params, 3, 5, rng);

    Ciphertext ballot(uint64_t v) {
        return ElGamal::encrypt(params, dealt.election_key, ElGamal::encode_exponential(params, v), rng);
    }

    DecryptionShare share_for(size_t i, const Ciphertext& ct) {
        auto result = partial_decrypt(params, dealt.shares[i - 1], ct, rng, kElection);
        return DecryptionShare(std::move(result.first), std::move(result.second));
    }

    uint64_t decode(const Big& m) { return ElGamal::decode_exponential(params, m, 1000); }
};

}  // namespace

bool test_deal_and_verify_shares() {
    Fixture f;
    if (f.dealt.shares.size() != 5 || f.dealt.commitments.threshold() != 3) return false;
    if (!same(f.dealt.election_key.h, f.dealt.commitments.coefficients[0])) return false;
    for (const auto& share : f.dealt.shares) {
        if (!verify_share(f.params, f.dealt.commitments, share)) return false;
    }

    // 私钥份额被篡改
    KeyShare tampered(2, f.params.add_q(f.dealt.shares[1].secret, BNUtils::from_uint(1)),
                      BNUtils::dup(f.dealt.shares[1].public_share));
    // 序号错位
    KeyShare misplaced(3, BNUtils::dup(f.dealt.shares[1].secret), BNUtils::dup(f.dealt.shares[1].public_share));

    return !verify_share(f.params, f.dealt.commitments, tampered) &&
           !verify_share(f.params, f.dealt.commitments, misplaced) &&
           throws<std::invalid_argument>([&] { deal_shares(f.params, 4, 3, f.rng); }) &&
           throws<std::invalid_argument>([&] { deal_shares(f.params, 0, 3, f.rng); });
}

bool test_reconstruct_known_secret() {
    auto params = GroupParams::preset("256");
    SystemRandom rng;
    auto kp = ElGamal::generate_keypair(params, rng);
    auto dealt = deal_shares(params, kp.sk, 3, 5, rng);

    std::vector<const KeyShare*> subset = {&dealt.shares[4], &dealt.shares[0], &dealt.shares[2]};
    std::vector<const KeyShare*> all;
    for (const auto& s : dealt.shares) all.push_back(&s);
    return same(dealt.election_key.h, kp.pk.h) && same(reconstruct_secret(params, subset), kp.sk.x) &&
           same(reconstruct_secret(params, all), kp.sk.x);
}

bool test_every_threshold_subset_decrypts() {
    Fixture f;
    auto ct = f.ballot(17);
    std::vector<DecryptionShare> all;
    for (size_t i = 1; i <= 5; ++i) all.push_back(f.share_for(i, ct));

    size_t subsets = 0;
    for (size_t a = 0; a < 5; ++a)
        for (size_t b = a + 1; b < 5; ++b)
            for (size_t c = b + 1; c < 5; ++c) {
                std::vector<DecryptionShare> chosen;
                for (size_t k : {c, a, b})
                    chosen.emplace_back(all[k].partial.clone(), all[k].proof.clone());
                auto result = combine_decryptions(f.params, f.dealt.commitments, ct, chosen, kElection);
                if (!result.rejected.empty() || f.decode(result.plaintext) != 17) return false;
                ++subsets;
            }
    return subsets == 10;
}

bool test_below_threshold_fails() {
    Fixture f;
    auto ct = f.ballot(4);
    std::vector<DecryptionShare> two;
    two.push_back(f.share_for(1, ct));
    two.push_back(f.share_for(5, ct));
    try {
        combine_decryptions(f.params, f.dealt.commitments, ct, two, kElection);
    } catch (const InsufficientShares& ex) {
        return ex.available() == 2 && ex.required() == 3 && ex.rejected().empty();
    }
    return false;
}

bool test_corrupted_share_is_rejected() {
    Fixture f;
    auto ct = f.ballot(23);
    std::vector<DecryptionShare> shares;
    for (size_t i = 1; i <= 5; ++i) shares.push_back(f.share_for(i, ct));
    // sealer 4 提交了错误的 d_4，证明随之失效
    shares[3].partial.value = f.params.mul_mod(shares[3].partial.value, f.params.g);

    auto result = combine_decryptions(f.params, f.dealt.commitments, ct, shares, kElection);
    return result.rejected.size() == 1 && result.rejected[0].index() == 4 && f.decode(result.plaintext) == 23;
}

bool test_wrong_context_is_rejected() {
    Fixture f;
    auto ct = f.ballot(2);
    auto other = f.ballot(2);
    std::vector<DecryptionShare> shares;
    for (size_t i = 1; i <= 4; ++i) shares.push_back(f.share_for(i, ct));

    // 证明属于另一张密文
    auto moved = partial_decrypt(f.params, f.dealt.shares[0], other, f.rng, kElection);
    bool cross_ct = !verify_partial(f.params, f.dealt.shares[0].public_share, ct, moved.first, moved.second, kElection);
    // 选举 id 不同
    bool cross_election = !verify_partial(f.params, f.dealt.shares[1].public_share, ct, shares[1].partial,
                                          shares[1].proof, "election-8");
    // 把 sealer 2 的数据冒充为 sealer 3
    bool cross_sealer = !verify_partial(f.params, f.dealt.shares[2].public_share, ct,
                                        PartialDecryption(3, BNUtils::dup(shares[1].partial.value)), shares[1].proof,
                                        kElection);
    return cross_ct && cross_election && cross_sealer &&
           verify_partial(f.params, f.dealt.shares[0].public_share, ct, shares[0].partial, shares[0].proof, kElection);
}

bool test_duplicate_index_is_rejected() {
    Fixture f;
    auto ct = f.ballot(9);
    std::vector<DecryptionShare> shares;
    shares.push_back(f.share_for(2, ct));
    shares.push_back(f.share_for(2, ct));
    shares.push_back(f.share_for(1, ct));
    shares.push_back(f.share_for(5, ct));

    auto result = combine_decryptions(f.params, f.dealt.commitments, ct, shares, kElection);
    bool first_ok = result.rejected.size() == 1 && result.rejected[0].index() == 2 && f.decode(result.plaintext) == 9;

    // 重复后有效数不足
    shares.pop_back();
    try {
        combine_decryptions(f.params, f.dealt.commitments, ct, shares, kElection);
    } catch (const InsufficientShares& ex) {
        return first_ok && ex.available() == 2 && ex.rejected() == std::vector<size_t>{2};
    }
    return false;
}

bool test_invalid_shares_reported_when_insufficient() {
    Fixture f;
    auto ct = f.ballot(6);
    std::vector<DecryptionShare> shares;
    shares.push_back(f.share_for(1, ct));
    shares.push_back(f.share_for(2, ct));
    shares.push_back(f.share_for(3, ct));
    shares[2].proof.response = f.params.add_q(shares[2].proof.response, BNUtils::from_uint(1));

    try {
        combine_decryptions(f.params, f.dealt.commitments, ct, shares, kElection);
    } catch (const InsufficientShares& ex) {
        return ex.available() == 2 && ex.required() == 3 && ex.rejected() == std::vector<size_t>{3};
    }
    return false;
}

bool test_batch_decryption() {
    Fixture f;
    std::vector<uint64_t> votes = {0, 5, 11, 3};
    std::vector<Ciphertext> cts;
    for (auto v : votes) cts.push_back(f.ballot(v));

    std::vector<BatchDecryptionShare> shares;
    for (size_t i : {2, 3, 5})
        shares.push_back(partial_decrypt_batch(f.params, f.dealt.shares[i - 1], cts, f.rng, kElection));
    auto result = combine_decryptions_batch(f.params, f.dealt.commitments, cts, shares, kElection);
    if (!result.rejected.empty() || result.plaintexts.size() != votes.size()) return false;
    for (size_t k = 0; k < votes.size(); ++k)
        if (f.decode(result.plaintexts[k]) != votes[k]) return false;

    // 篡改批量中的一个值
    shares[1].values[2] = f.params.mul_mod(shares[1].values[2], f.params.g);
    bool rejected = !verify_partial_batch(f.params, f.dealt.shares[2].public_share, cts, shares[1], kElection);
    bool insufficient = throws<InsufficientShares>(
        [&] { combine_decryptions_batch(f.params, f.dealt.commitments, cts, shares, kElection); });

    shares.push_back(partial_decrypt_batch(f.params, f.dealt.shares[0], cts, f.rng, kElection));
    auto recovered = combine_decryptions_batch(f.params, f.dealt.commitments, cts, shares, kElection);
    return rejected && insufficient && recovered.rejected.size() == 1 && recovered.rejected[0].index() == 3 &&
           f.decode(recovered.plaintexts[2]) == 11;
}

bool test_lagrange_coefficient_inputs() {
    auto params = GroupParams::preset("sm");
    // {1, 2}: λ_1 = 2, λ_2 = -1
    auto l1 = lagrange_coefficient(params, {1, 2}, 1);
    auto l2 = lagrange_coefficient(params, {1, 2}, 2);
    auto minus_one = BNUtils::dup(params.q);
    BNUtils::sub_word(minus_one, 1);
    return same(l1, BNUtils::from_uint(2)) && same(l2, minus_one) &&
           throws<std::invalid_argument>([&] { lagrange_coefficient(params, {1, 1, 2}, 1); }) &&
           throws<std::invalid_argument>([&] { lagrange_coefficient(params, {0, 1}, 1); }) &&
           throws<std::invalid_argument>([&] { lagrange_coefficient(params, {1, 2}, 3); });
}

// 没有承诺就没有门限，合并必须拒绝而不是直接返回 c2
bool test_empty_commitments_rejected() {
    Fixture f;
    auto ct = f.ballot(5);
    auto blob = hex_to_bytes("00000000");
    bool decoded = throws<std::invalid_argument>([&] {
        ByteReader reader(f.params, blob);
        ShareCommitments commitments(reader.elements());
    });

    auto cleared = f.dealt.commitments.clone();
    cleared.coefficients.clear();
    std::vector<DecryptionShare> none;
    std::vector<Ciphertext> cts;
    cts.push_back(ct.clone());
    std::vector<BatchDecryptionShare> no_batch;
    return decoded && throws<std::invalid_argument>([] { ShareCommitments empty{std::vector<Big>()}; }) &&
           throws<std::invalid_argument>(
               [&] { combine_decryptions(f.params, cleared, ct, none, kElection); }) &&
           throws<std::invalid_argument>(
               [&] { combine_decryptions_batch(f.params, cleared, cts, no_batch, kElection); });
}

bool test_key_share_proof() {
    Fixture f;
    const auto& share = f.dealt.shares[1];
    auto proof = prove_key_share(f.params, share, "sealer-b", f.rng, kElection);
    return verify_key_share(f.params, share.public_share, proof, "sealer-b", kElection) &&
           !verify_key_share(f.params, share.public_share, proof, "sealer-c", kElection) &&
           !verify_key_share(f.params, f.dealt.shares[0].public_share, proof, "sealer-b", kElection);
}

int main() {
    bool ok = true;
    ok &= run("DealAndVerifyShares", test_deal_and_verify_shares);
    ok &= run("ReconstructKnownSecret", test_reconstruct_known_secret);
    ok &= run("EveryThresholdSubsetDecrypts", test_every_threshold_subset_decrypts);
    ok &= run("BelowThresholdFails", test_below_threshold_fails);
    ok &= run("CorruptedShareIsRejected", test_corrupted_share_is_rejected);
    ok &= run("WrongContextIsRejected", test_wrong_context_is_rejected);
    ok &= run("DuplicateIndexIsRejected", test_duplicate_index_is_rejected);
    ok &= run("InvalidSharesReportedWhenInsufficient", test_invalid_shares_reported_when_insufficient);
    ok &= run("BatchDecryption", test_batch_decryption);
    ok &= run("LagrangeCoefficientInputs", test_lagrange_coefficient_inputs);
    ok &= run("EmptyCommitmentsRejected", test_empty_commitments_rejected);
    ok &= run("KeyShareProof", test_key_share_proof);
    return ok ? 0 : 1;
}
