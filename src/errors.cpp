#include "errors.hpp"

#include "units.hpp"

#include <sstream>

namespace rv {

namespace {

std::string describeFee(const Wei& paid, const Wei& required) {
    std::ostringstream oss;
    oss << "Raffle__EntranceFeeNotMet: paid " << formatEther(paid) << " ETH, required "
        << formatEther(required) << " ETH";
    return oss.str();
}

std::string describeUpkeep(const Wei& balance, std::size_t numPlayers, RaffleState state) {
    std::ostringstream oss;
    oss << "Raffle__UpkeepNotNeeded: balance=" << balance << " players=" << numPlayers
        << " state=" << toString(state);
    return oss.str();
}

std::string describeUnknownRequest(RequestId got, std::optional<RequestId> pending) {
    std::ostringstream oss;
    oss << "Raffle__UnknownRequest: got " << got << ", pending ";
    if (pending) {
        oss << *pending;
    } else {
        oss << "none";
    }
    return oss.str();
}

} // namespace

EntranceFeeNotMet::EntranceFeeNotMet(Wei paid, Wei required)
    : RaffleError(describeFee(paid, required))
    , paid_(std::move(paid))
    , required_(std::move(required)) {}

NotOpen::NotOpen(RaffleState state)
    : RaffleError(std::string("Raffle__NotOpen: state is ") + toString(state))
    , state_(state) {}

UpkeepNotNeeded::UpkeepNotNeeded(Wei balance, std::size_t numPlayers, RaffleState state)
    : RaffleError(describeUpkeep(balance, numPlayers, state))
    , balance_(std::move(balance))
    , numPlayers_(numPlayers)
    , state_(state) {}

WinnerPayoutFailed::WinnerPayoutFailed(Address winner, Wei amount, const TransferError& cause)
    : RaffleError("Raffle__TransferFailed: paying " + formatEther(amount) + " ETH to " + winner +
                  ": " + cause.what())
    , winner_(std::move(winner))
    , amount_(std::move(amount))
    , reason_(cause.reason()) {}

UnknownRequest::UnknownRequest(RequestId got, std::optional<RequestId> pending)
    : RaffleError(describeUnknownRequest(got, pending))
    , got_(got)
    , pending_(pending) {}

OnlyCoordinatorCanFulfill::OnlyCoordinatorCanFulfill(Address have, Address want)
    : RaffleError("OnlyCoordinatorCanFulfill: have " + have + ", want " + want)
    , have_(std::move(have))
    , want_(std::move(want)) {}

TransferError::TransferError(Reason reason, const std::string& message)
    : std::runtime_error(message)
    , reason_(reason) {}

CoordinatorError::CoordinatorError(Reason reason, const std::string& message)
    : std::runtime_error(std::string(toString(reason)) + ": " + message)
    , reason_(reason) {}

const char* toString(CoordinatorError::Reason reason) {
    using Reason = CoordinatorError::Reason;
    switch (reason) {
    case Reason::InvalidSubscription:
        return "InvalidSubscription";
    case Reason::MustBeSubOwner:
        return "MustBeSubOwner";
    case Reason::InvalidConsumer:
        return "InvalidConsumer";
    case Reason::TooManyConsumers:
        return "TooManyConsumers";
    case Reason::InvalidKeyHash:
        return "InvalidKeyHash";
    case Reason::InvalidRequestConfirmations:
        return "InvalidRequestConfirmations";
    case Reason::GasLimitTooBig:
        return "GasLimitTooBig";
    case Reason::NumWordsTooBig:
        return "NumWordsTooBig";
    case Reason::InsufficientBalance:
        return "InsufficientBalance";
    case Reason::InvalidRequest:
        return "InvalidRequest";
    case Reason::InvalidRandomWords:
        return "InvalidRandomWords";
    }
    return "Unknown";
}

} // namespace rv
