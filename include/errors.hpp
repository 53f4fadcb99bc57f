#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace rv {

class RaffleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class EntranceFeeNotMet : public RaffleError {
public:
    EntranceFeeNotMet(Wei paid, Wei required);

    const Wei& paid() const { return paid_; }
    const Wei& required() const { return required_; }

private:
    Wei paid_;
    Wei required_;
};

class NotOpen : public RaffleError {
public:
    explicit NotOpen(RaffleState state);

    RaffleState state() const { return state_; }

private:
    RaffleState state_;
};

// Carries every input of the upkeep predicate so callers can tell which one failed.
class UpkeepNotNeeded : public RaffleError {
public:
    UpkeepNotNeeded(Wei balance, std::size_t numPlayers, RaffleState state);

    const Wei& balance() const { return balance_; }
    std::size_t numPlayers() const { return numPlayers_; }
    RaffleState state() const { return state_; }

private:
    Wei balance_;
    std::size_t numPlayers_;
    RaffleState state_;
};

class TransferError : public std::runtime_error {
public:
    enum class Reason { InsufficientFunds, Rejected };

    TransferError(Reason reason, const std::string& message);

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

class WinnerPayoutFailed : public RaffleError {
public:
    WinnerPayoutFailed(Address winner, Wei amount, const TransferError& cause);

    const Address& winner() const { return winner_; }
    const Wei& amount() const { return amount_; }
    TransferError::Reason reason() const { return reason_; }

private:
    Address winner_;
    Wei amount_;
    TransferError::Reason reason_;
};

class UnknownRequest : public RaffleError {
public:
    UnknownRequest(RequestId got, std::optional<RequestId> pending);

    RequestId got() const { return got_; }
    std::optional<RequestId> pending() const { return pending_; }

private:
    RequestId got_;
    std::optional<RequestId> pending_;
};

class OnlyCoordinatorCanFulfill : public RaffleError {
public:
    OnlyCoordinatorCanFulfill(Address have, Address want);

    const Address& have() const { return have_; }
    const Address& want() const { return want_; }

private:
    Address have_;
    Address want_;
};

class CoordinatorError : public std::runtime_error {
public:
    enum class Reason {
        InvalidSubscription,
        MustBeSubOwner,
        InvalidConsumer,
        TooManyConsumers,
        InvalidKeyHash,
        InvalidRequestConfirmations,
        GasLimitTooBig,
        NumWordsTooBig,
        InsufficientBalance,
        InvalidRequest,
        InvalidRandomWords
    };

    CoordinatorError(Reason reason, const std::string& message);

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

const char* toString(CoordinatorError::Reason reason);

} // namespace rv
