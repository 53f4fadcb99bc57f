#include "raffle_config.hpp"

#include "rng.hpp"
#include "units.hpp"
#include "vrf_coordinator.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace rv {

namespace {

constexpr const char* kSepoliaCoordinator = "0x9DdfaCa8183c41ad55329BdeeD9F6A8d53168B1B";
constexpr const char* kSepoliaGasLane =
    "0x787d74caea10b2b357790d5b5247c2f63d1d91572a9846f780606e4d953677ae";
constexpr std::uint32_t kDefaultCallbackGasLimit = 500'000;
constexpr std::uint64_t kDefaultInterval = 30;

std::uint64_t parseUnsigned(const std::string& name, const std::string& value) {
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        if (value.empty() || value[0] == '-') {
            throw std::invalid_argument("negative");
        }
        parsed = std::stoull(value, &consumed, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " must be an unsigned integer, got \"" + value + "\"");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(name + " must be an unsigned integer, got \"" + value + "\"");
    }
    return parsed;
}

bool isKeyHash(const std::string& value) {
    return value.size() == 66 && value[0] == '0' && value[1] == 'x' && isHexString(value.substr(2));
}

} // namespace

void RaffleConfig::validate() const {
    if (!isAddress(vrfCoordinator)) {
        throw std::invalid_argument("vrfCoordinator must be a 20-byte hex address, got \"" +
                                    vrfCoordinator + "\"");
    }
    if (!isKeyHash(keyHash)) {
        throw std::invalid_argument("keyHash must be 0x followed by 64 hex digits, got \"" + keyHash + "\"");
    }
    if (callbackGasLimit == 0 || callbackGasLimit > kMaxCallbackGasLimit) {
        throw std::invalid_argument("callbackGasLimit must be in (0, " +
                                    std::to_string(kMaxCallbackGasLimit) + "]");
    }
}

NetworkConfig sepoliaConfig() {
    NetworkConfig cfg;
    cfg.chainId = kSepoliaChainId;
    cfg.name = "sepolia";
    cfg.raffle.entranceFee = parseEther("0.01");
    cfg.raffle.interval = kDefaultInterval;
    cfg.raffle.vrfCoordinator = normalizeAddress(kSepoliaCoordinator);
    cfg.raffle.keyHash = kSepoliaGasLane;
    cfg.raffle.subscriptionId = 0;
    cfg.raffle.callbackGasLimit = kDefaultCallbackGasLimit;
    return cfg;
}

NetworkConfig localConfig() {
    NetworkConfig cfg;
    cfg.chainId = kLocalChainId;
    cfg.name = "local";
    cfg.local = true;
    cfg.raffle.entranceFee = parseEther("0.01");
    cfg.raffle.interval = kDefaultInterval;
    cfg.raffle.callbackGasLimit = kDefaultCallbackGasLimit;
    return cfg;
}

NetworkConfig networkConfigForChain(std::uint64_t chainId) {
    switch (chainId) {
    case kSepoliaChainId:
        return sepoliaConfig();
    case kLocalChainId:
        return localConfig();
    default:
        throw std::invalid_argument("HelperConfig__InvalidChainId: " + std::to_string(chainId));
    }
}

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(env);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

void applyEnvironmentOverrides(RaffleConfig& cfg) {
    if (auto fee = readEnv("RV_ENTRANCE_FEE")) {
        cfg.entranceFee = parseEther(*fee);
    }
    if (auto interval = readEnv("RV_INTERVAL")) {
        cfg.interval = parseUnsigned("RV_INTERVAL", *interval);
    }
    if (auto coordinator = readEnv("RV_VRF_COORDINATOR")) {
        cfg.vrfCoordinator = normalizeAddress(*coordinator);
    }
    if (auto keyHash = readEnv("RV_KEY_HASH")) {
        if (!isKeyHash(*keyHash)) {
            throw std::invalid_argument("RV_KEY_HASH must be 0x followed by 64 hex digits");
        }
        cfg.keyHash = *keyHash;
    }
    if (auto subId = readEnv("RV_SUBSCRIPTION_ID")) {
        cfg.subscriptionId = parseUnsigned("RV_SUBSCRIPTION_ID", *subId);
    }
    if (auto gas = readEnv("RV_CALLBACK_GAS_LIMIT")) {
        std::uint64_t parsed = parseUnsigned("RV_CALLBACK_GAS_LIMIT", *gas);
        if (parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::invalid_argument("RV_CALLBACK_GAS_LIMIT exceeds 32 bits");
        }
        cfg.callbackGasLimit = static_cast<std::uint32_t>(parsed);
    }
}

std::uint64_t resolveChainId(std::uint64_t fallback) {
    if (auto chainId = readEnv("RV_CHAIN_ID")) {
        return parseUnsigned("RV_CHAIN_ID", *chainId);
    }
    return fallback;
}

} // namespace rv
