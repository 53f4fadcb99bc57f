#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace rv {

using Uint256 = boost::multiprecision::uint256_t;
using Wei = Uint256;

// Canonical form: "0x" followed by 40 lowercase hex digits.
using Address = std::string;

using RequestId = std::uint64_t;
using SubscriptionId = std::uint64_t;

enum class RaffleState : std::uint8_t { Open, Calculating };

const char* toString(RaffleState state);

bool isAddress(const std::string& value);
Address normalizeAddress(const std::string& value);

// Deterministic address for a human label (last 20 bytes of SHA-256(label)).
Address makeAddress(const std::string& label);

} // namespace rv
