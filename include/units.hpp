#pragma once

#include "types.hpp"

#include <string>

namespace rv {

constexpr unsigned kEtherDecimals = 18;

// Parses a decimal ether amount ("0.01", "3", "1.5e0" is rejected) into wei.
Wei parseEther(const std::string& text);
std::string formatEther(const Wei& amount);

// Decimal or 0x-prefixed hex.
Uint256 parseUint256(const std::string& text);
std::string toHex(const Uint256& value);

std::string trim(const std::string& value);

} // namespace rv
