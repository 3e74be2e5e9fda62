#include "mixnet/group.h"

#include "mixnet/errors.h"
#include "mixnet/hash.h"

#include <map>
#include <stdexcept>

namespace mixnet {

namespace {

// 预置安全素数，生成元统一取 4
const std::map<std::string, std::string>& preset_table() {
    static const std::map<std::string, std::string> table = {
        {"sm", "B7E151629927"},
        {"256", "B7E151628AED2A6ABF7158809CF4F3C762E7160F38B4DA56A784D904519216D3"},
        {"512",
         "B7E151628AED2A6ABF7158809CF4F3C762E7160F38B4DA56A784D9045190CFEF324E7738926CFBE5F4BF8D8D8C31D7"
         "63DA06C80ABB1185EB4F7C7B5757F5F9E3"},
        {"md",
         "B7E151628AED2A6ABF7158809CF4F3C762E7160F38B4DA56A784D9045190CFEF324E7738926CFBE5F4BF8D8D8C31D7"
         "63DA06C80ABB1185EB4F7C7B5757F5958490CFD47D7C19BB42158D9554F7B46BCED55C4D79FD5F24D6613C31C3839A"
         "2DDF8A9A276BCFBFA1C877C56284DAB79CD4C2B3293D20E9E5EAF02AC60ACC942593"},
        {"lg",
         "B7E151628AED2A6ABF7158809CF4F3C762E7160F38B4DA56A784D9045190CFEF324E7738926CFBE5F4BF8D8D8C31D7"
         "63DA06C80ABB1185EB4F7C7B5757F5958490CFD47D7C19BB42158D9554F7B46BCED55C4D79FD5F24D6613C31C3839A"
         "2DDF8A9A276BCFBFA1C877C56284DAB79CD4C2B3293D20E9E5EAF02AC60ACC93ED874422A52ECB238FEEE5AB6ADD83"
         "5FD1A0753D0A8F78E537D2B95BB79D8DCAEC642C1E9F23B829B5C2780BF38737DF8BB300D01334A0D0BD8645CBFA73"
         "A6160FFE393C48CBBBCA060F0FF8EC6D31BEB5CCEED7F2F0BB088017163BC60DF45A0ECB1BCD289B06CBBFEA21AD08"
         "E1847F3F7378D56CED94640D6EF0D3D37BE69D0063"},
        {"xl",
         "B7E151628AED2A6ABF7158809CF4F3C762E7160F38B4DA56A784D9045190CFEF324E7738926CFBE5F4BF8D8D8C31D7"
         "63DA06C80ABB1185EB4F7C7B5757F5958490CFD47D7C19BB42158D9554F7B46BCED55C4D79FD5F24D6613C31C3839A"
         "2DDF8A9A276BCFBFA1C877C56284DAB79CD4C2B3293D20E9E5EAF02AC60ACC93ED874422A52ECB238FEEE5AB6ADD83"
         "5FD1A0753D0A8F78E537D2B95BB79D8DCAEC642C1E9F23B829B5C2780BF38737DF8BB300D01334A0D0BD8645CBFA73"
         "A6160FFE393C48CBBBCA060F0FF8EC6D31BEB5CCEED7F2F0BB088017163BC60DF45A0ECB1BCD289B06CBBFEA21AD08"
         "E1847F3F7378D56CED94640D6EF0D3D37BE67008E186D1BF275B9B241DEB64749A47DFDFB96632C3EB061B6472BBF8"
         "4C26144E49C2D04C324EF10DE513D3F5114B8B5D374D93CB8879C7D52FFD72BA0AAE7277DA7BA1B4AF1488D8E836AF"
         "14865E6C37AB6876FE690B571121382AF341AFE94F77BCF06C83B8FF5675F0979074AD9A787BC5B9BD4B0C5937D3ED"
         "E4C3A79396419CD7"},
    };
    return table;
}

const std::map<std::string, std::string>& preset_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"48", "sm"}, {"1024", "md"}, {"2048", "lg"}, {"3072", "xl"}};
    return aliases;
}

}  // namespace

GroupParams GroupParams::from_safe_prime(const Big& p, const Big& g) {
    auto ctx = BNUtils::cmake();
    if (BN_num_bits(p.get()) < kMinimumModulusBits)
        throw std::invalid_argument("modulus below " + std::to_string(kMinimumModulusBits) + " bits");
    if (!BNUtils::is_prime(p, ctx.get())) throw std::invalid_argument("p is not prime");

    // q = (p - 1) / 2
    auto q = BNUtils::dup(p);
    BNUtils::sub_word(q, 1);
    BNUtils::rshift1(q);
    if (!BNUtils::is_prime(q, ctx.get())) throw std::invalid_argument("p is not a safe prime");

    GroupParams params(BNUtils::dup(p), std::move(q), BNUtils::dup(g));
    // q 为素数，子群内除 1 外都是生成元
    if (!params.is_member(g) || BNUtils::is_one(g))
        throw std::invalid_argument("g does not generate the order-q subgroup");
    return params;
}

GroupParams GroupParams::preset(const std::string& name) {
    std::string key = name;
    auto alias = preset_aliases().find(name);
    if (alias != preset_aliases().end()) key = alias->second;

    auto it = preset_table().find(key);
    if (it == preset_table().end()) throw std::invalid_argument("unknown parameter set: " + name);
    return from_safe_prime(BNUtils::from_hex(it->second), BNUtils::from_uint(4));
}

std::vector<std::string> GroupParams::preset_names() {
    std::vector<std::string> names;
    for (const auto& kv : preset_table()) names.push_back(kv.first);
    return names;
}

GroupParams GroupParams::generate(int bits) {
    if (bits < kMinimumModulusBits)
        throw std::invalid_argument("modulus below " + std::to_string(kMinimumModulusBits) + " bits");
    auto p = BNUtils::make();
    BNUtils::generate_prime(p, bits, true);
    return from_safe_prime(p, BNUtils::from_uint(4));
}

GroupParams GroupParams::clone() const {
    return GroupParams(BNUtils::dup(p), BNUtils::dup(q), BNUtils::dup(g));
}

bool GroupParams::same_as(const GroupParams& other) const {
    return BNUtils::cmp(p, other.p) == 0 && BNUtils::cmp(q, other.q) == 0 &&
           BNUtils::cmp(g, other.g) == 0;
}

size_t GroupParams::element_bytes() const { return BNUtils::num_bytes(p); }

size_t GroupParams::scalar_bytes() const { return BNUtils::num_bytes(q); }

Big GroupParams::modpow(const Big& base, const Big& exp) const { return BNUtils::mod_exp(base, exp, p); }

Big GroupParams::modpow(const Big& base, const Big& exp, BN_CTX* ctx) const {
    return BNUtils::mod_exp(base, exp, p, ctx);
}

Big GroupParams::pow_g(const Big& exp) const { return BNUtils::mod_exp(g, exp, p); }

Big GroupParams::mul_mod(const Big& a, const Big& b) const { return BNUtils::mod_mul(a, b, p); }

Big GroupParams::mul_mod(const Big& a, const Big& b, BN_CTX* ctx) const {
    return BNUtils::mod_mul(a, b, p, ctx);
}

Big GroupParams::inv_mod(const Big& a) const { return BNUtils::mod_inv(a, p); }

Big GroupParams::div_mod(const Big& a, const Big& b) const { return mul_mod(a, inv_mod(b)); }

Big GroupParams::product(const std::vector<Big>& elems) const {
    auto ctx = BNUtils::cmake();
    auto acc = BNUtils::from_uint(1);
    for (const auto& e : elems) acc = BNUtils::mod_mul(acc, e, p, ctx.get());
    return acc;
}

Big GroupParams::add_q(const Big& a, const Big& b) const { return BNUtils::mod_add(a, b, q); }

Big GroupParams::sub_q(const Big& a, const Big& b) const { return BNUtils::mod_sub(a, b, q); }

Big GroupParams::mul_q(const Big& a, const Big& b) const { return BNUtils::mod_mul(a, b, q); }

Big GroupParams::reduce_q(const Big& a) const { return BNUtils::mod(a, q); }

bool GroupParams::is_member(const Big& x) const {
    if (!x || BN_is_negative(x.get()) || BNUtils::is_zero(x)) return false;
    if (BNUtils::cmp(x, p) >= 0) return false;
    return BNUtils::is_one(BNUtils::mod_exp(x, q, p));
}

void GroupParams::ensure_member(const Big& x, const std::string& what) const {
    if (!is_member(x)) throw InvalidGroupElement(what);
}

bool GroupParams::is_scalar(const Big& s) const {
    return s && !BN_is_negative(s.get()) && BNUtils::cmp(s, q) < 0;
}

Big GroupParams::random_exponent(RandomSource& rng) const {
    // [0, q-2] + 1
    auto bound = BNUtils::dup(q);
    BNUtils::sub_word(bound, 1);
    auto r = rng.uniform(bound);
    BNUtils::add_word(r, 1);
    return r;
}

std::vector<Big> GroupParams::derive_generators(const std::string& domain, size_t count) const {
    std::vector<Big> gens;
    gens.reserve(count);
    auto ctx = BNUtils::cmake();
    // 多取 16 字节，降低取模偏差
    size_t width = element_bytes() + 16;
    for (size_t i = 0; i < count; ++i) {
        for (uint32_t ctr = 0;; ++ctr) {
            Digest seed = Sha256()
                              .update_u32(static_cast<uint32_t>(domain.size()))
                              .update(domain)
                              .update(std::string("ggen"))
                              .update_u32(static_cast<uint32_t>(i))
                              .update_u32(ctr)
                              .finish();
            auto wide = sha256_expand(std::vector<uint8_t>(seed.begin(), seed.end()), width);
            auto x = BNUtils::mod(BNUtils::from_bytes(wide), p, ctx.get());
            auto h = BNUtils::sqr(x, p, ctx.get());
            if (!BNUtils::is_zero(h) && !BNUtils::is_one(h)) {
                gens.push_back(std::move(h));
                break;
            }
        }
    }
    return gens;
}

}  // namespace mixnet
