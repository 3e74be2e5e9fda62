#include "mixnet/random.h"

#include "mixnet/errors.h"
#include "mixnet/hash.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <numeric>
#include <utility>

namespace mixnet {

Big RandomSource::uniform(const Big& bound) {
    if (BNUtils::is_zero(bound) || BN_is_negative(bound.get()))
        throw std::invalid_argument("uniform: bound must be positive");
    int bits = BN_num_bits(bound.get());
    size_t nbytes = static_cast<size_t>((bits + 7) / 8);
    int top_bits = bits % 8;
    uint8_t mask = top_bits == 0 ? 0xFF : static_cast<uint8_t>((1u << top_bits) - 1);

    std::vector<uint8_t> buf(nbytes);
    while (true) {
        fill(buf.data(), buf.size());
        buf[0] &= mask;
        Big candidate = BNUtils::from_bytes(buf);
        if (BNUtils::cmp(candidate, bound) < 0) return candidate;
    }
}

uint64_t RandomSource::uniform_index(uint64_t bound) {
    return BNUtils::to_uint(uniform(BNUtils::from_uint(bound)));
}

void SystemRandom::fill(uint8_t* out, size_t len) {
    if (len == 0) return;
    if (RAND_priv_bytes(out, static_cast<int>(len)) != 1)
        throw RandomnessFailure("RAND_priv_bytes failed (error " + std::to_string(ERR_get_error()) + ")");
}

Big SystemRandom::uniform(const Big& bound) {
    if (BNUtils::is_zero(bound) || BN_is_negative(bound.get()))
        throw std::invalid_argument("uniform: bound must be positive");
    Big r = BNUtils::make();
    if (!BN_priv_rand_range(r.get(), bound.get()))
        throw RandomnessFailure("BN_priv_rand_range failed");
    return r;
}

DeterministicRandom::DeterministicRandom(const std::string& seed) : seed_(seed.begin(), seed.end()) {}

void DeterministicRandom::fill(uint8_t* out, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        if (offset_ == buffer_.size()) {
            Digest block = Sha256().update(seed_).update_u32(counter_++).finish();
            buffer_.assign(block.begin(), block.end());
            offset_ = 0;
        }
        out[i] = buffer_[offset_++];
    }
}

std::vector<size_t> random_permutation(RandomSource& rng, size_t n) {
    std::vector<size_t> perm(n);
    std::iota(perm.begin(), perm.end(), 0);
    for (size_t i = n; i > 1; --i) {
        size_t j = static_cast<size_t>(rng.uniform_index(i));
        std::swap(perm[i - 1], perm[j]);
    }
    return perm;
}

}  // namespace mixnet
