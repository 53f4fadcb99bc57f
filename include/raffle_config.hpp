#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace rv {

// Everything a Raffle is constructed with; immutable once the raffle exists.
struct RaffleConfig {
    Wei entranceFee;
    std::uint64_t interval = 0;          // seconds between draws
    Address vrfCoordinator;
    std::string keyHash;                 // gas lane / proving key, 0x + 64 hex
    SubscriptionId subscriptionId = 0;
    std::uint32_t callbackGasLimit = 0;

    void validate() const;
};

constexpr std::uint64_t kSepoliaChainId = 11'155'111;
constexpr std::uint64_t kLocalChainId = 31'337;

struct NetworkConfig {
    std::uint64_t chainId = 0;
    std::string name;
    RaffleConfig raffle;
    // Local networks get their coordinator, key and subscription from the deployment.
    bool local = false;
};

NetworkConfig sepoliaConfig();
NetworkConfig localConfig();
NetworkConfig networkConfigForChain(std::uint64_t chainId);

// RV_ENTRANCE_FEE (ether), RV_INTERVAL, RV_VRF_COORDINATOR, RV_KEY_HASH,
// RV_SUBSCRIPTION_ID, RV_CALLBACK_GAS_LIMIT.
void applyEnvironmentOverrides(RaffleConfig& cfg);

// RV_CHAIN_ID when set, otherwise the fallback.
std::uint64_t resolveChainId(std::uint64_t fallback = kLocalChainId);

std::optional<std::string> readEnv(const char* name);

} // namespace rv
