#include "deployment.hpp"

#include "units.hpp"

#include <stdexcept>

namespace rv {

DeploymentOptions defaultDeploymentOptions() {
    DeploymentOptions options;
    options.subscriptionFundJuels = parseEther("3");
    return options;
}

LocalDeployment::LocalDeployment(NetworkConfig network, DeploymentOptions options)
    : network_(std::move(network))
    , clock_(options.genesisTimestamp)
    , deployer_(makeAddress("deployer")) {
    if (!network_.local) {
        throw std::invalid_argument("network " + network_.name +
                                    " has a live coordinator and cannot be deployed in-process");
    }

    coordinator_ = std::make_unique<LocalVrfCoordinator>(makeAddress("vrf-coordinator"), ledger_);

    std::string seedHex = options.vrfSeedHex.empty() ? secureRandomHex(kVrfSeedBytes) : options.vrfSeedHex;
    VrfKeyPair keys = deriveVrfKeypairFromSeed(seedHex);
    secureZero(seedHex);
    provingPublicKey_ = keys.publicKeyHex;
    RaffleConfig& cfg = network_.raffle;
    cfg.keyHash = coordinator_->registerProvingKey(keys);
    secureZero(keys.secretKeyHex);
    cfg.vrfCoordinator = coordinator_->coordinatorAddress();

    if (cfg.subscriptionId == 0) {
        cfg.subscriptionId = coordinator_->createSubscription(deployer_);
        coordinator_->fundSubscription(cfg.subscriptionId, options.subscriptionFundJuels);
    }

    raffle_ = std::make_unique<Raffle>(makeAddress("raffle"), cfg, *coordinator_, ledger_, clock_);
    coordinator_->addConsumer(cfg.subscriptionId, deployer_, raffle_->getAddress());
}

} // namespace rv
