#include "rng.hpp"

#include "picosha2.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <sodium.h>

namespace rv {

#ifndef crypto_vrf_PROOFBYTES
#error "libsodium must provide crypto_vrf_* support (version >= 1.0.18)"
#endif

static_assert(kVrfSeedBytes == crypto_vrf_SEEDBYTES, "VRF seed length mismatch");

namespace {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

void requireSodium() {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
}

constexpr std::string_view kVrfDomainTag = "raffle-vrf:coordinator:v1";

VrfKeyPair exportKeypair(std::vector<unsigned char>& publicKey,
                         std::vector<unsigned char>& secretKey) {
    VrfKeyPair pair{
        bytesToHex(publicKey.data(), publicKey.size()),
        bytesToHex(secretKey.data(), secretKey.size()),
    };
    secureZero(secretKey.data(), secretKey.size());
    return pair;
}

} // namespace

bool isHexString(const std::string& value) {
    if (value.empty() || (value.size() % 2) != 0) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isxdigit(ch) != 0;
    });
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    std::string_view digits(hex);
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits.remove_prefix(2);
    }
    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }

    std::vector<unsigned char> out;
    out.reserve(digits.size() / 2);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(digits[i])) ||
            !std::isxdigit(static_cast<unsigned char>(digits[i + 1]))) {
            throw std::invalid_argument("hex string contains a non-hex character");
        }
        out.push_back(static_cast<unsigned char>(std::stoul(std::string(digits.substr(i, 2)), nullptr, 16)));
    }
    return out;
}

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string secureRandomHex(std::size_t numBytes) {
    requireSodium();
    std::vector<unsigned char> bytes(numBytes);
    if (!bytes.empty()) {
        randombytes_buf(bytes.data(), bytes.size());
    }
    std::string hex = bytesToHex(bytes.data(), bytes.size());
    secureZero(bytes.data(), bytes.size());
    return hex;
}

std::string keyHashFor(const std::string& publicKeyHex) {
    auto publicKey = hexToBytes(publicKeyHex);
    if (publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
        throw std::invalid_argument("VRF public key length invalid");
    }
    std::string raw(publicKey.begin(), publicKey.end());
    return "0x" + sha256Hex(raw);
}

std::string buildAlpha(const std::string& keyHash,
                       RequestId requestId,
                       SubscriptionId subId,
                       const Address& consumer,
                       std::uint64_t nonce) {
    std::ostringstream oss;
    oss << kVrfDomainTag << "|" << keyHash << "|" << requestId << "|" << subId << "|" << consumer
        << ":" << nonce;
    return oss.str();
}

std::vector<Uint256> expandRandomWords(const std::string& vrfOutputHex, std::uint32_t numWords) {
    auto output = hexToBytes(vrfOutputHex);
    if (output.size() != crypto_vrf_OUTPUTBYTES) {
        throw std::invalid_argument("VRF output length invalid");
    }

    std::vector<Uint256> words;
    words.reserve(numWords);
    for (std::uint32_t i = 0; i < numWords; ++i) {
        std::string input(output.begin(), output.end());
        input.push_back(':');
        input.append(std::to_string(i));

        std::array<std::uint8_t, 32> hash{};
        picosha2::hash256(input.begin(), input.end(), hash.begin(), hash.end());
        Uint256 word = 0;
        for (auto byte : hash) {
            word = (word << 8) | byte;
        }
        words.push_back(word);
    }
    return words;
}

VrfProver::VrfProver(std::string secretKeyHex, std::string publicKeyHex)
    : publicKeyHex_(std::move(publicKeyHex)) {
    requireSodium();

    auto secretBytes = hexToBytes(secretKeyHex);
    secureZero(secretKeyHex);
    if (secretBytes.size() != crypto_vrf_SECRETKEYBYTES) {
        secureZero(secretBytes.data(), secretBytes.size());
        throw std::invalid_argument("VRF secret key length invalid");
    }
    secretKey_ = SecretBytes(std::move(secretBytes));

    keyHash_ = keyHashFor(publicKeyHex_);

    // A key pair that cannot prove against its own public key is unusable; fail early.
    VrfProof probe = prove(std::string(kVrfDomainTag) + "|self-test");
    if (!verifyVrf(probe.proofHex, probe.outputHex, publicKeyHex_, probe.alpha)) {
        throw std::runtime_error("VRF secret key does not match public key");
    }
}

VrfProver::VrfProver(const VrfKeyPair& keys)
    : VrfProver(keys.secretKeyHex, keys.publicKeyHex) {}

VrfProof VrfProver::prove(const std::string& alpha) const {
    std::vector<unsigned char> proof(crypto_vrf_PROOFBYTES);
    if (crypto_vrf_prove(proof.data(),
                         secretKey_.data(),
                         reinterpret_cast<const unsigned char*>(alpha.data()),
                         alpha.size()) != 0) {
        throw std::runtime_error("VRF prove failed");
    }

    std::vector<unsigned char> output(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_proof_to_hash(output.data(), proof.data()) != 0) {
        throw std::runtime_error("VRF hash extraction failed");
    }

    return VrfProof{
        alpha,
        bytesToHex(proof.data(), proof.size()),
        bytesToHex(output.data(), output.size()),
    };
}

bool verifyVrf(const std::string& vrfProofHex,
               const std::string& vrfOutputHex,
               const std::string& publicKeyHex,
               const std::string& alpha) {
    if (!ensureSodiumReady()) {
        return false;
    }

    std::vector<unsigned char> proof;
    std::vector<unsigned char> publicKey;
    std::vector<unsigned char> output;
    try {
        proof = hexToBytes(vrfProofHex);
        publicKey = hexToBytes(publicKeyHex);
        output = hexToBytes(vrfOutputHex);
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (proof.size() != crypto_vrf_PROOFBYTES || output.size() != crypto_vrf_OUTPUTBYTES ||
        publicKey.size() != crypto_vrf_PUBLICKEYBYTES) {
        return false;
    }

    std::vector<unsigned char> recomputed(crypto_vrf_OUTPUTBYTES);
    if (crypto_vrf_verify(recomputed.data(),
                          publicKey.data(),
                          proof.data(),
                          reinterpret_cast<const unsigned char*>(alpha.data()),
                          alpha.size()) != 0) {
        return false;
    }

    return std::equal(recomputed.begin(), recomputed.end(), output.begin());
}

VrfKeyPair generateVrfKeypair() {
    requireSodium();

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    crypto_vrf_keypair(publicKey.data(), secretKey.data());
    return exportKeypair(publicKey, secretKey);
}

VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex) {
    requireSodium();

    auto seed = hexToBytes(seedHex);
    if (seed.size() != crypto_vrf_SEEDBYTES) {
        throw std::invalid_argument("Seed must decode to crypto_vrf_SEEDBYTES bytes");
    }

    std::vector<unsigned char> publicKey(crypto_vrf_PUBLICKEYBYTES);
    std::vector<unsigned char> secretKey(crypto_vrf_SECRETKEYBYTES);
    int rc = crypto_vrf_keypair_from_seed(publicKey.data(), secretKey.data(), seed.data());
    secureZero(seed.data(), seed.size());
    if (rc != 0) {
        throw std::runtime_error("Failed to derive VRF keypair from seed");
    }
    return exportKeypair(publicKey, secretKey);
}

} // namespace rv
