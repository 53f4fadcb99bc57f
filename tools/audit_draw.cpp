#include "rng.hpp"
#include "units.hpp"

#include <cstdint>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 6) {
        std::cerr << "Usage: audit_draw <publicKeyHex> <alpha> <vrfProofHex> <vrfOutputHex> <playerCount>\n";
        return 1;
    }

    std::string publicKey = argv[1];
    std::string alpha = argv[2];
    std::string proof = argv[3];
    std::string output = argv[4];
    std::uint64_t playerCount = 0;
    try {
        playerCount = std::stoull(argv[5]);
    } catch (const std::exception& ex) {
        std::cerr << "playerCount must be an unsigned integer: " << ex.what() << '\n';
        return 1;
    }
    if (playerCount == 0) {
        std::cerr << "playerCount must be positive\n";
        return 1;
    }

    bool ok = rv::verifyVrf(proof, output, publicKey, alpha);
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << '\n';
    if (!ok) {
        return 1;
    }

    try {
        std::cout << "Key hash: " << rv::keyHashFor(publicKey) << '\n';
        auto words = rv::expandRandomWords(output, 1);
        rv::Uint256 index = words.front() % playerCount;
        std::cout << "Random word: " << rv::toHex(words.front()) << '\n';
        std::cout << "Winning player index: " << index << " of " << playerCount << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "Unable to recompute the draw: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
