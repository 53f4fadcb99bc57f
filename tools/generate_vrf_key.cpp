#include "rng.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace {

void printKey(const rv::VrfKeyPair& keys) {
    std::cout << "public:   " << keys.publicKeyHex << '\n';
    std::cout << "secret:   " << keys.secretKeyHex << '\n';
    std::cout << "key hash: " << rv::keyHashFor(keys.publicKeyHex) << '\n';
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc > 2 && std::strcmp(argv[1], "--seed") == 0) {
            printKey(rv::deriveVrfKeypairFromSeed(argv[2]));
            return 0;
        }

        int count = 1;
        if (argc > 1) {
            char* end = nullptr;
            long parsed = std::strtol(argv[1], &end, 10);
            if (end && *end == '\0' && parsed > 0) {
                count = static_cast<int>(parsed);
            } else {
                std::cerr << "Invalid count provided. Using default of 1.\n";
            }
        }

        for (int i = 0; i < count; ++i) {
            if (i > 0) {
                std::cout << '\n';
            }
            printKey(rv::generateVrfKeypair());
        }
    } catch (const std::exception& ex) {
        std::cerr << "Key generation failed: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
