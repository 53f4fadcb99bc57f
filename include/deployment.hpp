#pragma once

#include "clock.hpp"
#include "ledger.hpp"
#include "local_vrf_coordinator.hpp"
#include "raffle.hpp"
#include "raffle_config.hpp"

#include <memory>
#include <string>

namespace rv {

struct DeploymentOptions {
    // Hex seed for the coordinator's proving key; a random seed is drawn when empty.
    std::string vrfSeedHex;
    Uint256 subscriptionFundJuels;
    std::uint64_t genesisTimestamp = 1;
};

DeploymentOptions defaultDeploymentOptions();

// A complete in-process network: ledger, clock, VRF coordinator with a funded subscription,
// and a raffle registered as its consumer.
class LocalDeployment {
public:
    explicit LocalDeployment(NetworkConfig network,
                             DeploymentOptions options = defaultDeploymentOptions());

    LocalDeployment(const LocalDeployment&) = delete;
    LocalDeployment& operator=(const LocalDeployment&) = delete;

    Ledger& ledger() { return ledger_; }
    ManualClock& clock() { return clock_; }
    LocalVrfCoordinator& coordinator() { return *coordinator_; }
    Raffle& raffle() { return *raffle_; }

    const NetworkConfig& network() const { return network_; }
    const Address& deployer() const { return deployer_; }
    const std::string& provingPublicKey() const { return provingPublicKey_; }

private:
    NetworkConfig network_;
    Ledger ledger_;
    ManualClock clock_;
    Address deployer_;
    std::string provingPublicKey_;
    std::unique_ptr<LocalVrfCoordinator> coordinator_;
    std::unique_ptr<Raffle> raffle_;
};

} // namespace rv
