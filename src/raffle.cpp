#include "raffle.hpp"

#include "errors.hpp"

#include <sstream>
#include <stdexcept>

namespace rv {

std::string describe(const RaffleEvent& event) {
    std::ostringstream oss;
    switch (event.kind) {
    case RaffleEventKind::Entered:
        oss << "RaffleEntered(" << event.account << ")";
        break;
    case RaffleEventKind::RequestedWinner:
        oss << "RequestedRaffleWinner(" << event.requestId << ")";
        break;
    case RaffleEventKind::WinnerPicked:
        oss << "WinnerPicked(" << event.account << ")";
        break;
    }
    return oss.str();
}

Raffle::Raffle(Address self,
               RaffleConfig config,
               VrfCoordinator& coordinator,
               Ledger& ledger,
               const Clock& clock)
    : self_(normalizeAddress(self))
    , config_(std::move(config))
    , coordinator_(coordinator)
    , ledger_(ledger)
    , clock_(clock)
    , lastTimeStamp_(clock.now()) {
    config_.validate();
    config_.vrfCoordinator = normalizeAddress(config_.vrfCoordinator);
    if (coordinator_.coordinatorAddress() != config_.vrfCoordinator) {
        throw std::invalid_argument("coordinator at " + coordinator_.coordinatorAddress() +
                                    " does not match configured " + config_.vrfCoordinator);
    }
}

void Raffle::enter(const Address& player, const Wei& payment) {
    if (payment < config_.entranceFee) {
        throw EntranceFeeNotMet(payment, config_.entranceFee);
    }
    if (state_ != RaffleState::Open) {
        throw NotOpen(state_);
    }

    Address entrant = normalizeAddress(player);
    ledger_.transfer(entrant, self_, payment);
    players_.push_back(entrant);

    emit(RaffleEvent{ RaffleEventKind::Entered, entrant, 0 });
}

UpkeepStatus Raffle::checkUpkeep() const {
    UpkeepStatus status;
    std::uint64_t now = clock_.now();
    status.timeHasPassed = now >= lastTimeStamp_ && (now - lastTimeStamp_) >= config_.interval;
    status.isOpen = state_ == RaffleState::Open;
    status.hasBalance = getBalance() > 0;
    status.hasPlayers = !players_.empty();
    status.upkeepNeeded = status.timeHasPassed && status.isOpen && status.hasBalance && status.hasPlayers;
    return status;
}

RequestId Raffle::performUpkeep() {
    if (!checkUpkeep().upkeepNeeded) {
        throw UpkeepNotNeeded(getBalance(), players_.size(), state_);
    }

    RandomWordsRequest request;
    request.keyHash = config_.keyHash;
    request.subId = config_.subscriptionId;
    request.requestConfirmations = kRequestConfirmations;
    request.callbackGasLimit = config_.callbackGasLimit;
    request.numWords = kNumWords;
    request.nativePayment = false;

    // Nothing is committed until the coordinator accepts the request.
    RequestId requestId = coordinator_.requestRandomWords(*this, request);
    state_ = RaffleState::Calculating;
    pendingRequest_ = requestId;

    emit(RaffleEvent{ RaffleEventKind::RequestedWinner, {}, requestId });
    return requestId;
}

void Raffle::rawFulfillRandomWords(const Address& caller,
                                   RequestId requestId,
                                   const std::vector<Uint256>& randomWords) {
    if (!isAddress(caller) || normalizeAddress(caller) != config_.vrfCoordinator) {
        throw OnlyCoordinatorCanFulfill(caller, config_.vrfCoordinator);
    }
    fulfillRandomWords(requestId, randomWords);
}

void Raffle::fulfillRandomWords(RequestId requestId, const std::vector<Uint256>& randomWords) {
    if (!pendingRequest_ || *pendingRequest_ != requestId) {
        throw UnknownRequest(requestId, pendingRequest_);
    }
    if (randomWords.empty()) {
        throw std::invalid_argument("fulfillment delivered no random words");
    }
    if (state_ != RaffleState::Calculating || players_.empty()) {
        throw std::logic_error("pending request without a calculating round");
    }

    Uint256 winnerIndex = randomWords.front() % players_.size();
    Address winner = players_[winnerIndex.convert_to<std::size_t>()];
    Wei prize = getBalance();

    // Pay first; the round is only reset once the transfer has gone through.
    try {
        ledger_.transfer(self_, winner, prize);
    } catch (const TransferError& ex) {
        throw WinnerPayoutFailed(winner, prize, ex);
    }

    recentWinner_ = winner;
    players_.clear();
    state_ = RaffleState::Open;
    lastTimeStamp_ = clock_.now();
    pendingRequest_.reset();

    emit(RaffleEvent{ RaffleEventKind::WinnerPicked, winner, 0 });
}

void Raffle::subscribe(RaffleEventCallback callback) {
    if (callback) {
        listeners_.push_back(std::move(callback));
    }
}

const Address& Raffle::getPlayer(std::size_t index) const {
    if (index >= players_.size()) {
        throw std::out_of_range("player index " + std::to_string(index) + " out of range (" +
                                std::to_string(players_.size()) + " players)");
    }
    return players_[index];
}

Wei Raffle::getBalance() const {
    return ledger_.balanceOf(self_);
}

void Raffle::emit(const RaffleEvent& event) const noexcept {
    for (const auto& listener : listeners_) {
        listener(event);
    }
}

} // namespace rv
