// mix-net 命令行工具：按子命令驱动库接口，十六进制输入输出。
// 群元素与证明均为定长大端序列化后的十六进制串。

#include "mixnet/elgamal.h"
#include "mixnet/errors.h"
#include "mixnet/group.h"
#include "mixnet/random.h"
#include "mixnet/reencryption_proof.h"
#include "mixnet/serialization.h"
#include "mixnet/shuffle.h"
#include "mixnet/tally.h"
#include "mixnet/threshold.h"

#include <iostream>
#include <string>
#include <vector>

using namespace mixnet;

namespace {

void usage() {
    std::cerr << "用法:\n"
              << "  mixnet_cli [--params sm|256|512|md|lg|xl] [--domain <id>] [--threads <k>] <command> ...\n"
              << "  params\n"
              << "  keygen\n"
              << "  deal <t> <n>\n"
              << "  encrypt <h> <value>\n"
              << "  decrypt <x> <ct>\n"
              << "  reencrypt <h> <ct>\n"
              << "  verify-reencryption <h> <ct> <ct2> <proof>\n"
              << "  shuffle <h> <ct>...\n"
              << "  verify-shuffle <h> <proof> <n> <in_ct>... <out_ct>...\n"
              << "  partial <i:x_i> <ct>\n"
              << "  combine <commitments> <ct> <share>...\n"
              << "  tally <x> <max> <ct>...\n";
}

Ciphertext read_ct(const GroupParams& params, const std::string& hex) {
    return decode_ciphertext(params, hex_to_bytes(hex));
}

PublicKey read_pk(const GroupParams& params, const std::string& hex) {
    PublicKey pk(BNUtils::from_hex(hex));
    ElGamal::ensure_valid(params, pk);
    return pk;
}

// "i:x_hex"
KeyShare read_share(const GroupParams& params, const std::string& s) {
    auto pos = s.find(':');
    if (pos == std::string::npos) throw std::invalid_argument("share must be i:x_hex");
    size_t index = std::stoul(s.substr(0, pos));
    auto x = BNUtils::from_hex(s.substr(pos + 1));
    auto h = params.pow_g(x);
    return KeyShare(index, std::move(x), std::move(h));
}

int run(const std::vector<std::string>& args, const GroupParams& params, const ShuffleOptions& options) {
    SystemRandom rng;
    const std::string& mode = args[0];
    const std::string& domain = options.domain;

    if (mode == "params") {
        std::cout << BNUtils::to_hex(params.p) << "\n" << BNUtils::to_hex(params.q) << "\n"
                  << BNUtils::to_hex(params.g) << "\n";
    } else if (mode == "keygen") {
        auto kp = ElGamal::generate_keypair(params, rng);
        std::cout << BNUtils::to_hex(kp.sk.x) << " " << BNUtils::to_hex(kp.pk.h) << "\n";
    } else if (mode == "deal") {
        if (args.size() != 3) throw std::invalid_argument("deal <t> <n>");
        auto dealt = deal_shares(params, std::stoul(args[1]), std::stoul(args[2]), rng);
        std::cout << BNUtils::to_hex(dealt.election_key.h) << "\n";
        std::cout << to_hex(ByteWriter(params).elements(dealt.commitments.coefficients).bytes()) << "\n";
        for (const auto& s : dealt.shares) std::cout << s.index << ":" << BNUtils::to_hex(s.secret) << "\n";
    } else if (mode == "encrypt") {
        if (args.size() != 3) throw std::invalid_argument("encrypt <h> <value>");
        auto pk = read_pk(params, args[1]);
        auto m = ElGamal::encode_exponential(params, std::stoull(args[2]));
        std::cout << to_hex(encode_ciphertext(params, ElGamal::encrypt(params, pk, m, rng))) << "\n";
    } else if (mode == "decrypt") {
        if (args.size() != 3) throw std::invalid_argument("decrypt <x> <ct>");
        SecretKey sk(BNUtils::from_hex(args[1]));
        auto m = ElGamal::decrypt(params, sk, read_ct(params, args[2]));
        std::cout << ElGamal::decode_exponential(params, m) << "\n";
    } else if (mode == "reencrypt") {
        if (args.size() != 3) throw std::invalid_argument("reencrypt <h> <ct>");
        auto pk = read_pk(params, args[1]);
        auto [ct2, proof] = reencrypt_with_proof(params, pk, read_ct(params, args[2]), rng, domain);
        std::cout << to_hex(encode_ciphertext(params, ct2)) << " "
                  << to_hex(encode_reencryption_proof(params, proof)) << "\n";
    } else if (mode == "verify-reencryption") {
        if (args.size() != 5) throw std::invalid_argument("verify-reencryption <h> <ct> <ct2> <proof>");
        auto pk = read_pk(params, args[1]);
        auto proof = decode_reencryption_proof(params, hex_to_bytes(args[4]));
        bool ok = verify_reencryption(params, pk, read_ct(params, args[2]), read_ct(params, args[3]), proof, domain);
        std::cout << (ok ? "OK" : "FAIL") << "\n";
        return ok ? 0 : 1;
    } else if (mode == "shuffle") {
        if (args.size() < 3) throw std::invalid_argument("shuffle <h> <ct>...");
        auto pk = read_pk(params, args[1]);
        std::vector<Ciphertext> inputs;
        for (size_t i = 2; i < args.size(); ++i) inputs.push_back(read_ct(params, args[i]));
        auto [outputs, proof] = shuffle_with_proof(params, pk, inputs, rng, options);
        for (const auto& ct : outputs) std::cout << to_hex(encode_ciphertext(params, ct)) << "\n";
        std::cout << to_hex(encode_shuffle_proof(params, proof)) << "\n";
    } else if (mode == "verify-shuffle") {
        if (args.size() < 4) throw std::invalid_argument("verify-shuffle <h> <proof> <n> <in_ct>... <out_ct>...");
        auto pk = read_pk(params, args[1]);
        auto proof = decode_shuffle_proof(params, hex_to_bytes(args[2]));
        size_t n = std::stoul(args[3]);
        if (args.size() != 4 + 2 * n) throw std::invalid_argument("verify-shuffle: expected 2n ciphertexts");
        std::vector<Ciphertext> inputs, outputs;
        for (size_t i = 0; i < n; ++i) inputs.push_back(read_ct(params, args[4 + i]));
        for (size_t i = 0; i < n; ++i) outputs.push_back(read_ct(params, args[4 + n + i]));
        bool ok = verify_shuffle(params, pk, inputs, outputs, proof, options);
        std::cout << (ok ? "OK" : "FAIL") << "\n";
        return ok ? 0 : 1;
    } else if (mode == "partial") {
        if (args.size() != 3) throw std::invalid_argument("partial <i:x_i> <ct>");
        auto share = read_share(params, args[1]);
        auto [partial, proof] = partial_decrypt(params, share, read_ct(params, args[2]), rng, domain);
        DecryptionShare out(std::move(partial), std::move(proof));
        std::cout << to_hex(encode_decryption_share(params, out)) << "\n";
    } else if (mode == "combine") {
        if (args.size() < 3) throw std::invalid_argument("combine <commitments> <ct> <share>...");
        auto blob = hex_to_bytes(args[1]);
        ByteReader reader(params, blob);
        ShareCommitments commitments(reader.elements());
        reader.finish();
        auto ct = read_ct(params, args[2]);
        std::vector<DecryptionShare> shares;
        for (size_t i = 3; i < args.size(); ++i)
            shares.push_back(decode_decryption_share(params, hex_to_bytes(args[i])));
        auto result = combine_decryptions(params, commitments, ct, shares, domain);
        for (const auto& bad : result.rejected) std::cerr << "rejected: " << bad.index() << "\n";
        std::cout << ElGamal::decode_exponential(params, result.plaintext) << "\n";
    } else if (mode == "tally") {
        if (args.size() < 3) throw std::invalid_argument("tally <x> <max> <ct>...");
        SecretKey sk(BNUtils::from_hex(args[1]));
        uint64_t max = std::stoull(args[2]);
        std::vector<Big> plaintexts;
        for (size_t i = 3; i < args.size(); ++i)
            plaintexts.push_back(ElGamal::decrypt(params, sk, read_ct(params, args[i])));
        for (const auto& kv : Tally::count(params, plaintexts, Encoding::kExponential, max))
            std::cout << kv.first << " " << kv.second << "\n";
    } else {
        std::cerr << "未知模式: " << mode << "\n";
        usage();
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::string preset = kDefaultPreset;
    ShuffleOptions options;
    std::vector<std::string> args;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if ((a == "--params" || a == "--domain" || a == "--threads") && i + 1 < argc) {
                std::string v = argv[++i];
                if (a == "--params") preset = v;
                else if (a == "--domain") options.domain = v;
                else options.threads = static_cast<unsigned>(std::stoul(v));
            } else {
                args.push_back(a);
            }
        }
        if (args.empty()) {
            usage();
            return 1;
        }
        auto params = GroupParams::preset(preset);
        return run(args, params, options);
    } catch (const InsufficientShares& ex) {
        std::cerr << "error: " << ex.what() << "\n";
        for (size_t idx : ex.rejected()) std::cerr << "rejected: " << idx << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return 1;
    }
}
