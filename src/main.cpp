#include "deployment.hpp"
#include "errors.hpp"
#include "raffle.hpp"
#include "raffle_config.hpp"
#include "transcript_log.hpp"
#include "units.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace rv;

namespace {

std::uint64_t parseCount(const char* arg, std::uint64_t fallback, const char* what) {
    char* end = nullptr;
    long long parsed = std::strtoll(arg, &end, 10);
    if (end && *end == '\0' && parsed > 0) {
        return static_cast<std::uint64_t>(parsed);
    }
    std::cerr << "Invalid " << what << " provided. Using default of " << fallback << ".\n";
    return fallback;
}

void printUpkeep(const UpkeepStatus& status) {
    std::cout << "  upkeepNeeded=" << status.upkeepNeeded << " (time=" << status.timeHasPassed
              << " open=" << status.isOpen << " balance=" << status.hasBalance
              << " players=" << status.hasPlayers << ")\n";
}

int runRound(LocalDeployment& net, const std::vector<Address>& players, std::uint64_t round) {
    Raffle& raffle = net.raffle();
    std::cout << "\n=== ROUND " << round << " ===\n";

    for (const auto& player : players) {
        raffle.enter(player, raffle.getEntranceFee());
    }
    std::cout << "Players: " << raffle.getNumberOfPlayers()
              << "  Pot: " << formatEther(raffle.getBalance()) << " ETH\n";

    std::cout << "Before interval:";
    printUpkeep(raffle.checkUpkeep());
    net.clock().advance(raffle.getInterval() + 1);
    std::cout << "After interval: ";
    printUpkeep(raffle.checkUpkeep());

    RequestId requestId = raffle.performUpkeep();
    std::cout << "Requested randomness, request id " << requestId << ", state "
              << toString(raffle.getRaffleState()) << "\n";

    FulfillmentRecord record = net.coordinator().fulfillRandomWords(requestId);
    if (!record.success) {
        std::cerr << "Fulfillment of request " << requestId << " failed: " << record.error << "\n";
        return 1;
    }

    const Address winner = raffle.getRecentWinner().value_or("<none>");
    std::cout << "Random word: " << toHex(record.randomWords.front()) << "\n";
    std::cout << "Winner: " << winner << "  balance " << formatEther(net.ledger().balanceOf(winner))
              << " ETH\n";

    std::cout << "\n=== VRF REVEAL ===\n";
    std::cout << "Key hash: " << record.keyHash << "\n";
    std::cout << "Public key: " << record.publicKeyHex << "\n";
    std::cout << "Alpha: " << record.proof.alpha << "\n";
    std::cout << "Proof: " << record.proof.proofHex << "\n";
    std::cout << "Output: " << record.proof.outputHex << "\n";
    std::cout << "Subscription charged: " << record.payment << " juels\n";
    bool ok = LocalVrfCoordinator::verifyFulfillment(record);
    std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << "\n";
    return ok ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::uint64_t playerCount = (argc > 1) ? parseCount(argv[1], 4, "player count") : 4;
    std::uint64_t rounds = (argc > 2) ? parseCount(argv[2], 1, "round count") : 1;

    try {
        NetworkConfig network = networkConfigForChain(resolveChainId());
        applyEnvironmentOverrides(network.raffle);

        DeploymentOptions options = defaultDeploymentOptions();
        if (auto seed = readEnv("RV_VRF_SEED")) {
            options.vrfSeedHex = *seed;
        }

        LocalDeployment net(network, options);
        Raffle& raffle = net.raffle();

        TranscriptLog transcript;
        raffle.subscribe([&transcript](const RaffleEvent& event) {
            transcript.append(describe(event));
            std::cout << "  event " << describe(event) << "\n";
        });

        std::cout << "Raffle deployed on " << net.network().name << " at " << raffle.getAddress() << "\n";
        std::cout << "Entrance fee: " << formatEther(raffle.getEntranceFee())
                  << " ETH  Interval: " << raffle.getInterval() << "s\n";
        std::cout << "Coordinator: " << net.coordinator().coordinatorAddress()
                  << "  Subscription: " << raffle.getConfig().subscriptionId << "\n";

        std::vector<Address> players;
        for (std::uint64_t i = 0; i < playerCount; ++i) {
            Address player = makeAddress("player-" + std::to_string(i));
            net.ledger().deal(player, parseEther("10"));
            players.push_back(player);
        }

        for (std::uint64_t round = 1; round <= rounds; ++round) {
            if (runRound(net, players, round) != 0) {
                return 1;
            }
        }

        std::cout << "\nTranscript Merkle root (" << transcript.size() << " events): "
                  << transcript.merkleRoot() << "\n";
    } catch (const RaffleError& ex) {
        std::cerr << "Raffle error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
