#pragma once

#include "secure_memory.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rv {

struct VrfKeyPair {
    std::string publicKeyHex;
    std::string secretKeyHex;
};

struct VrfProof {
    std::string alpha;
    std::string proofHex;
    std::string outputHex;
};

// ECVRF (libsodium crypto_vrf) prover for one proving key.
class VrfProver {
public:
    VrfProver(std::string secretKeyHex, std::string publicKeyHex);
    explicit VrfProver(const VrfKeyPair& keys);

    VrfProver(VrfProver&&) noexcept = default;
    VrfProver& operator=(VrfProver&&) noexcept = default;

    VrfProof prove(const std::string& alpha) const;

    const std::string& getPublicKey() const { return publicKeyHex_; }
    const std::string& getKeyHash() const { return keyHash_; }

private:
    std::string publicKeyHex_;
    std::string keyHash_;
    SecretBytes secretKey_;
};

bool verifyVrf(const std::string& vrfProofHex,
               const std::string& vrfOutputHex,
               const std::string& publicKeyHex,
               const std::string& alpha);

// "0x" + SHA-256 of the raw public key bytes; identifies a proving key in requests.
std::string keyHashFor(const std::string& publicKeyHex);

std::string buildAlpha(const std::string& keyHash,
                       RequestId requestId,
                       SubscriptionId subId,
                       const Address& consumer,
                       std::uint64_t nonce);

// Word i = SHA-256(output | i), read as a big-endian 256-bit integer.
std::vector<Uint256> expandRandomWords(const std::string& vrfOutputHex, std::uint32_t numWords);

std::string sha256Hex(const std::string& data);
// Seed length accepted by deriveVrfKeypairFromSeed.
constexpr std::size_t kVrfSeedBytes = 32;

std::string secureRandomHex(std::size_t numBytes);

VrfKeyPair generateVrfKeypair();
VrfKeyPair deriveVrfKeypairFromSeed(const std::string& seedHex);

bool isHexString(const std::string& value);
std::vector<unsigned char> hexToBytes(const std::string& hex);
std::string bytesToHex(const unsigned char* data, std::size_t len);

} // namespace rv
