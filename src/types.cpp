#include "types.hpp"

#include "picosha2.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace rv {

namespace {

constexpr std::size_t kAddressHexDigits = 40;

} // namespace

const char* toString(RaffleState state) {
    switch (state) {
    case RaffleState::Open:
        return "OPEN";
    case RaffleState::Calculating:
        return "CALCULATING";
    }
    return "UNKNOWN";
}

bool isAddress(const std::string& value) {
    if (value.size() != kAddressHexDigits + 2 || value[0] != '0' ||
        (value[1] != 'x' && value[1] != 'X')) {
        return false;
    }
    return std::all_of(value.begin() + 2, value.end(), [](unsigned char ch) {
        return std::isxdigit(ch) != 0;
    });
}

Address normalizeAddress(const std::string& value) {
    if (!isAddress(value)) {
        throw std::invalid_argument("not a 20-byte hex address: " + value);
    }
    Address out = "0x";
    out.reserve(kAddressHexDigits + 2);
    std::transform(value.begin() + 2, value.end(), std::back_inserter(out), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

Address makeAddress(const std::string& label) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(label.begin(), label.end(), hash.begin(), hash.end());
    std::string hex = picosha2::bytes_to_hex_string(hash.begin(), hash.end());
    return "0x" + hex.substr(hex.size() - kAddressHexDigits);
}

} // namespace rv
