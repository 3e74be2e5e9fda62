#include "mixnet/errors.h"
#include "mixnet/group.h"
#include "mixnet/random.h"
#include "test_util.h"

#include <algorithm>
#include <set>

using namespace mixnet;
using mixnet_test::run;
using mixnet_test::same;
using mixnet_test::throws;

bool test_presets() {
    auto sm = GroupParams::preset("sm");
    auto p256 = GroupParams::preset("256");
    auto md = GroupParams::preset("1024");
    return BN_num_bits(sm.p.get()) == 48 && sm.element_bytes() == 6 && p256.element_bytes() == 32 &&
           BN_num_bits(md.p.get()) == 1024 && same(p256.g, BNUtils::from_uint(4)) &&
           GroupParams::preset_names().size() == 6 && md.same_as(GroupParams::preset("md")) &&
           sm.clone().same_as(sm) && !sm.same_as(p256) &&
           throws<std::invalid_argument>([] { GroupParams::preset("nope"); });
}

bool test_membership() {
    auto params = GroupParams::preset("256");
    auto one = BNUtils::from_uint(1);
    auto zero = BNUtils::from_uint(0);
    auto h = params.pow_g(BNUtils::from_uint(12345));
    return params.is_member(params.g) && params.is_member(one) && params.is_member(h) &&
           !params.is_member(zero) && !params.is_member(params.p) &&
           !params.is_member(mixnet_test::non_member(params)) &&
           throws<InvalidGroupElement>([&] { params.ensure_member(mixnet_test::non_member(params), "x"); });
}

bool test_random_exponent_range() {
    auto params = GroupParams::preset("sm");
    SystemRandom rng;
    for (int i = 0; i < 200; ++i) {
        auto r = params.random_exponent(rng);
        if (BNUtils::is_zero(r) || BNUtils::cmp(r, params.q) >= 0) return false;
    }
    return true;
}

bool test_from_safe_prime_rejects() {
    auto four = BNUtils::from_uint(4);
    auto p = GroupParams::preset("sm");
    // 4294967311 为素数但 (p-1)/2 不是
    bool not_safe = throws<std::invalid_argument>(
        [&] { GroupParams::from_safe_prime(BNUtils::from_uint(4294967311ULL), four); });
    bool small = throws<std::invalid_argument>([&] { GroupParams::from_safe_prime(BNUtils::from_uint(23), four); });
    bool bad_g = throws<std::invalid_argument>(
        [&] { GroupParams::from_safe_prime(p.p, mixnet_test::non_member(p)); });
    bool identity = throws<std::invalid_argument>(
        [&] { GroupParams::from_safe_prime(p.p, BNUtils::from_uint(1)); });
    return not_safe && small && bad_g && identity;
}

bool test_generate() {
    auto params = GroupParams::generate(64);
    auto ctx = BNUtils::cmake();
    return BN_num_bits(params.p.get()) == 64 && BNUtils::is_prime(params.q, ctx.get()) &&
           params.is_member(params.g);
}

bool test_derive_generators() {
    auto params = GroupParams::preset("256");
    auto a = params.derive_generators("election-1", 8);
    auto b = params.derive_generators("election-1", 8);
    auto c = params.derive_generators("election-2", 8);
    std::set<std::string> seen;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!params.is_member(a[i]) || BNUtils::is_one(a[i]) || !same(a[i], b[i]) || same(a[i], c[i]))
            return false;
        seen.insert(BNUtils::to_hex(a[i]));
    }
    return seen.size() == a.size();
}

bool test_deterministic_random() {
    auto params = GroupParams::preset("256");
    DeterministicRandom a("seed"), b("seed"), c("other");
    for (int i = 0; i < 5; ++i) {
        auto x = params.random_exponent(a);
        auto y = params.random_exponent(b);
        auto z = params.random_exponent(c);
        if (!same(x, y) || same(x, z)) return false;
    }
    return true;
}

bool test_random_permutation() {
    SystemRandom rng;
    auto perm = random_permutation(rng, 50);
    auto sorted = perm;
    std::sort(sorted.begin(), sorted.end());
    for (size_t i = 0; i < sorted.size(); ++i)
        if (sorted[i] != i) return false;
    return rng.uniform_index(1) == 0 && random_permutation(rng, 0).empty();
}

bool test_scalar_ops() {
    auto params = GroupParams::preset("sm");
    auto q_minus_1 = BNUtils::dup(params.q);
    BNUtils::sub_word(q_minus_1, 1);
    auto one = BNUtils::from_uint(1);
    // (q-1) + 1 = 0, 0 - 1 = q-1
    return BNUtils::is_zero(params.add_q(q_minus_1, one)) &&
           same(params.sub_q(BNUtils::from_uint(0), one), q_minus_1) &&
           same(params.mul_q(q_minus_1, q_minus_1), one) && params.is_scalar(q_minus_1) &&
           !params.is_scalar(params.q);
}

int main() {
    bool ok = true;
    ok &= run("Presets", test_presets);
    ok &= run("Membership", test_membership);
    ok &= run("RandomExponentRange", test_random_exponent_range);
    ok &= run("SafePrimeValidation", test_from_safe_prime_rejects);
    ok &= run("Generate", test_generate);
    ok &= run("DeriveGenerators", test_derive_generators);
    ok &= run("DeterministicRandom", test_deterministic_random);
    ok &= run("RandomPermutation", test_random_permutation);
    ok &= run("ScalarOps", test_scalar_ops);
    return ok ? 0 : 1;
}
