#pragma once

#include "clock.hpp"
#include "ledger.hpp"
#include "raffle_config.hpp"
#include "types.hpp"
#include "vrf_coordinator.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rv {

struct UpkeepStatus {
    bool upkeepNeeded = false;
    bool timeHasPassed = false;
    bool isOpen = false;
    bool hasBalance = false;
    bool hasPlayers = false;
};

enum class RaffleEventKind { Entered, RequestedWinner, WinnerPicked };

struct RaffleEvent {
    RaffleEventKind kind;
    Address account;           // entrant or winner
    RequestId requestId = 0;   // RequestedWinner only
};

// Canonical one-line encoding, e.g. "RaffleEntered(0xab..)".
std::string describe(const RaffleEvent& event);

// Listeners run after the operation has committed. A listener that throws terminates the process.
using RaffleEventCallback = std::function<void(const RaffleEvent&)>;

// Lottery round state machine: OPEN accepts entries, CALCULATING waits for the one outstanding
// randomness request, and the fulfillment pays the whole balance to a single winner.
class Raffle : public VrfConsumer {
public:
    static constexpr std::uint16_t kRequestConfirmations = 3;
    static constexpr std::uint32_t kNumWords = 1;

    Raffle(Address self,
           RaffleConfig config,
           VrfCoordinator& coordinator,
           Ledger& ledger,
           const Clock& clock);

    Raffle(const Raffle&) = delete;
    Raffle& operator=(const Raffle&) = delete;

    // Moves payment from the player to the raffle and records one ticket.
    void enter(const Address& player, const Wei& payment);

    UpkeepStatus checkUpkeep() const;

    // Requests the winning random word. Returns the coordinator's request id.
    RequestId performUpkeep();

    const Address& consumerAddress() const override { return self_; }
    void rawFulfillRandomWords(const Address& caller,
                               RequestId requestId,
                               const std::vector<Uint256>& randomWords) override;

    void subscribe(RaffleEventCallback callback);

    const Address& getAddress() const { return self_; }
    const Wei& getEntranceFee() const { return config_.entranceFee; }
    std::uint64_t getInterval() const { return config_.interval; }
    RaffleState getRaffleState() const { return state_; }
    const Address& getPlayer(std::size_t index) const;
    std::size_t getNumberOfPlayers() const { return players_.size(); }
    std::uint64_t getLastTimeStamp() const { return lastTimeStamp_; }
    std::optional<Address> getRecentWinner() const { return recentWinner_; }
    std::optional<RequestId> getPendingRequestId() const { return pendingRequest_; }
    Wei getBalance() const;
    const RaffleConfig& getConfig() const { return config_; }

private:
    void fulfillRandomWords(RequestId requestId, const std::vector<Uint256>& randomWords);
    void emit(const RaffleEvent& event) const noexcept;

    Address self_;
    RaffleConfig config_;
    VrfCoordinator& coordinator_;
    Ledger& ledger_;
    const Clock& clock_;

    std::vector<Address> players_;
    RaffleState state_ = RaffleState::Open;
    std::uint64_t lastTimeStamp_ = 0;
    std::optional<Address> recentWinner_;
    std::optional<RequestId> pendingRequest_;
    std::vector<RaffleEventCallback> listeners_;
};

} // namespace rv
