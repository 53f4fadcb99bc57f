#include "units.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace rv {

namespace {

bool allDigits(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

Uint256 pow10(unsigned exponent) {
    Uint256 out = 1;
    for (unsigned i = 0; i < exponent; ++i) {
        out *= 10;
    }
    return out;
}

// Rejects values that would silently wrap in 256 bits.
Uint256 parseDecimalDigits(const std::string& digits) {
    static const Uint256 kMax = std::numeric_limits<Uint256>::max();
    Uint256 out = 0;
    for (char ch : digits) {
        unsigned digit = static_cast<unsigned>(ch - '0');
        if (out > (kMax - digit) / 10) {
            throw std::invalid_argument("amount exceeds 256 bits");
        }
        out = out * 10 + digit;
    }
    return out;
}

} // namespace

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

Wei parseEther(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        throw std::invalid_argument("ether amount must not be empty");
    }

    auto dot = value.find('.');
    std::string whole = value.substr(0, dot);
    std::string fraction = (dot == std::string::npos) ? std::string{} : value.substr(dot + 1);
    if (whole.empty() && fraction.empty()) {
        throw std::invalid_argument("ether amount has no digits: " + text);
    }
    if (!allDigits(whole) || !allDigits(fraction)) {
        throw std::invalid_argument("ether amount must be a plain decimal: " + text);
    }
    if (fraction.size() > kEtherDecimals) {
        throw std::invalid_argument("ether amount has more than 18 decimals: " + text);
    }

    fraction.append(kEtherDecimals - fraction.size(), '0');
    return parseDecimalDigits((whole.empty() ? "0" : whole) + fraction);
}

std::string formatEther(const Wei& amount) {
    static const Uint256 kUnit = pow10(kEtherDecimals);
    Uint256 whole = amount / kUnit;
    Uint256 fraction = amount % kUnit;

    std::string out = whole.str();
    if (fraction == 0) {
        return out;
    }
    std::string digits = fraction.str();
    digits.insert(0, kEtherDecimals - digits.size(), '0');
    digits.erase(digits.find_last_not_of('0') + 1);
    return out + "." + digits;
}

Uint256 parseUint256(const std::string& text) {
    std::string value = trim(text);
    if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
        std::string digits = value.substr(2);
        if (digits.size() > 64 || !std::all_of(digits.begin(), digits.end(), [](unsigned char ch) {
                return std::isxdigit(ch) != 0;
            })) {
            throw std::invalid_argument("malformed 256-bit hex value: " + text);
        }
        Uint256 out = 0;
        for (unsigned char ch : digits) {
            unsigned nibble = std::isdigit(ch) ? static_cast<unsigned>(ch - '0')
                                               : static_cast<unsigned>(std::tolower(ch) - 'a' + 10);
            out = (out << 4) | nibble;
        }
        return out;
    }
    if (value.empty() || !allDigits(value)) {
        throw std::invalid_argument("malformed unsigned integer: " + text);
    }
    return parseDecimalDigits(value);
}

std::string toHex(const Uint256& value) {
    static const char* kDigits = "0123456789abcdef";
    if (value == 0) {
        return "0x0";
    }
    std::string out;
    Uint256 rest = value;
    while (rest != 0) {
        out.push_back(kDigits[static_cast<unsigned>(Uint256(rest & 0xF))]);
        rest >>= 4;
    }
    std::reverse(out.begin(), out.end());
    return "0x" + out;
}

} // namespace rv
