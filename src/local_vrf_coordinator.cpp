#include "local_vrf_coordinator.hpp"

#include "errors.hpp"
#include "units.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace rv {

namespace {

using Reason = CoordinatorError::Reason;

const Uint256 kJuelsPerLink = parseEther("1");

std::string subLabel(SubscriptionId subId) {
    return "subscription " + std::to_string(subId);
}

} // namespace

CoordinatorFees defaultCoordinatorFees() {
    return CoordinatorFees{
        parseEther("0.25"),
        Uint256(1'000'000'000),
        Uint256(4'000'000'000'000'000ULL),
    };
}

LocalVrfCoordinator::LocalVrfCoordinator(Address self, Ledger& ledger, CoordinatorFees fees)
    : self_(normalizeAddress(self))
    , ledger_(ledger)
    , fees_(std::move(fees)) {}

std::string LocalVrfCoordinator::registerProvingKey(const VrfKeyPair& keys) {
    VrfProver prover(keys);
    std::string keyHash = prover.getKeyHash();
    provers_.erase(keyHash);
    provers_.emplace(keyHash, std::move(prover));
    return keyHash;
}

bool LocalVrfCoordinator::hasProvingKey(const std::string& keyHash) const {
    return provers_.count(keyHash) != 0;
}

SubscriptionId LocalVrfCoordinator::createSubscription(const Address& owner) {
    SubscriptionId subId = nextSubId_++;
    SubscriptionInfo info;
    info.owner = normalizeAddress(owner);
    subscriptions_.emplace(subId, std::move(info));
    return subId;
}

void LocalVrfCoordinator::fundSubscription(SubscriptionId subId, const Uint256& juels) {
    requireSubscription(subId).balance += juels;
}

void LocalVrfCoordinator::fundSubscriptionWithNative(SubscriptionId subId,
                                                     const Address& payer,
                                                     const Wei& amount) {
    auto& sub = requireSubscription(subId);
    ledger_.transfer(payer, self_, amount);
    sub.nativeBalance += amount;
}

void LocalVrfCoordinator::addConsumer(SubscriptionId subId,
                                      const Address& caller,
                                      const Address& consumer) {
    auto& sub = requireSubscription(subId);
    requireOwner(sub, caller);
    Address normalized = normalizeAddress(consumer);
    if (std::find(sub.consumers.begin(), sub.consumers.end(), normalized) != sub.consumers.end()) {
        return;
    }
    if (sub.consumers.size() >= kMaxConsumers) {
        throw CoordinatorError(Reason::TooManyConsumers, subLabel(subId));
    }
    sub.consumers.push_back(normalized);
}

void LocalVrfCoordinator::removeConsumer(SubscriptionId subId,
                                         const Address& caller,
                                         const Address& consumer) {
    auto& sub = requireSubscription(subId);
    requireOwner(sub, caller);
    auto it = std::find(sub.consumers.begin(), sub.consumers.end(), normalizeAddress(consumer));
    if (it == sub.consumers.end()) {
        throw CoordinatorError(Reason::InvalidConsumer, consumer + " is not a consumer of " + subLabel(subId));
    }
    sub.consumers.erase(it);
}

SubscriptionInfo LocalVrfCoordinator::getSubscription(SubscriptionId subId) const {
    return requireSubscription(subId);
}

bool LocalVrfCoordinator::isConsumer(SubscriptionId subId, const Address& consumer) const {
    auto it = subscriptions_.find(subId);
    if (it == subscriptions_.end()) {
        return false;
    }
    if (!isAddress(consumer)) {
        return false;
    }
    const auto& consumers = it->second.consumers;
    return std::find(consumers.begin(), consumers.end(), normalizeAddress(consumer)) != consumers.end();
}

RequestId LocalVrfCoordinator::requestRandomWords(VrfConsumer& consumer,
                                                  const RandomWordsRequest& request) {
    const Address& consumerAddress = consumer.consumerAddress();
    requireSubscription(request.subId);
    if (!isConsumer(request.subId, consumerAddress)) {
        throw CoordinatorError(Reason::InvalidConsumer,
                               consumerAddress + " is not a consumer of " + subLabel(request.subId));
    }
    if (request.requestConfirmations < kMinRequestConfirmations ||
        request.requestConfirmations > kMaxRequestConfirmations) {
        std::ostringstream oss;
        oss << "have " << request.requestConfirmations << ", allowed [" << kMinRequestConfirmations
            << ", " << kMaxRequestConfirmations << "]";
        throw CoordinatorError(Reason::InvalidRequestConfirmations, oss.str());
    }
    if (request.callbackGasLimit > kMaxCallbackGasLimit) {
        throw CoordinatorError(Reason::GasLimitTooBig,
                               "have " + std::to_string(request.callbackGasLimit) + ", max " +
                                   std::to_string(kMaxCallbackGasLimit));
    }
    if (request.numWords > kMaxNumWords) {
        throw CoordinatorError(Reason::NumWordsTooBig,
                               "have " + std::to_string(request.numWords) + ", max " +
                                   std::to_string(kMaxNumWords));
    }
    if (!hasProvingKey(request.keyHash)) {
        throw CoordinatorError(Reason::InvalidKeyHash, request.keyHash);
    }

    RequestId requestId = nextRequestId_++;
    PendingRequest pending;
    pending.consumer = &consumer;
    pending.consumerAddress = consumerAddress;
    pending.request = request;
    pending.nonce = ++consumerNonces_[consumerAddress];
    pending_.emplace(requestId, std::move(pending));
    return requestId;
}

FulfillmentRecord LocalVrfCoordinator::fulfillRandomWords(RequestId requestId) {
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw CoordinatorError(Reason::InvalidRequest, "no pending request " + std::to_string(requestId));
    }
    const PendingRequest& pending = it->second;
    const VrfProver& prover = provers_.at(pending.request.keyHash);

    std::string alpha = buildAlpha(pending.request.keyHash,
                                   requestId,
                                   pending.request.subId,
                                   pending.consumerAddress,
                                   pending.nonce);
    VrfProof proof = prover.prove(alpha);
    auto words = expandRandomWords(proof.outputHex, pending.request.numWords);
    return deliver(requestId, std::move(words), std::move(proof));
}

FulfillmentRecord LocalVrfCoordinator::fulfillRandomWordsWithOverride(RequestId requestId,
                                                                      std::vector<Uint256> randomWords) {
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw CoordinatorError(Reason::InvalidRequest, "no pending request " + std::to_string(requestId));
    }
    if (randomWords.size() != it->second.request.numWords) {
        throw CoordinatorError(Reason::InvalidRandomWords,
                               "expected " + std::to_string(it->second.request.numWords) +
                                   " words, got " + std::to_string(randomWords.size()));
    }
    return deliver(requestId, std::move(randomWords), VrfProof{});
}

std::optional<FulfillmentRecord> LocalVrfCoordinator::getFulfillment(RequestId requestId) const {
    auto it = fulfilled_.find(requestId);
    if (it == fulfilled_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LocalVrfCoordinator::verifyFulfillment(const FulfillmentRecord& record) {
    if (record.proof.proofHex.empty() || record.publicKeyHex.empty()) {
        return false;
    }
    try {
        if (keyHashFor(record.publicKeyHex) != record.keyHash) {
            return false;
        }
    } catch (const std::invalid_argument&) {
        return false;
    }
    if (!verifyVrf(record.proof.proofHex, record.proof.outputHex, record.publicKeyHex, record.proof.alpha)) {
        return false;
    }
    auto words = expandRandomWords(record.proof.outputHex,
                                   static_cast<std::uint32_t>(record.randomWords.size()));
    return words == record.randomWords;
}

SubscriptionInfo& LocalVrfCoordinator::requireSubscription(SubscriptionId subId) {
    auto it = subscriptions_.find(subId);
    if (it == subscriptions_.end()) {
        throw CoordinatorError(Reason::InvalidSubscription, subLabel(subId));
    }
    return it->second;
}

const SubscriptionInfo& LocalVrfCoordinator::requireSubscription(SubscriptionId subId) const {
    auto it = subscriptions_.find(subId);
    if (it == subscriptions_.end()) {
        throw CoordinatorError(Reason::InvalidSubscription, subLabel(subId));
    }
    return it->second;
}

void LocalVrfCoordinator::requireOwner(const SubscriptionInfo& sub, const Address& caller) const {
    if (normalizeAddress(caller) != sub.owner) {
        throw CoordinatorError(Reason::MustBeSubOwner, "owner is " + sub.owner + ", caller " + caller);
    }
}

Uint256 LocalVrfCoordinator::computePayment(const RandomWordsRequest& request) const {
    Uint256 juels = fees_.baseFeeJuels + fees_.gasPriceJuels * request.callbackGasLimit;
    if (!request.nativePayment) {
        return juels;
    }
    return juels * fees_.weiPerUnitLink / kJuelsPerLink;
}

FulfillmentRecord LocalVrfCoordinator::deliver(RequestId requestId,
                                               std::vector<Uint256> randomWords,
                                               VrfProof proof) {
    auto it = pending_.find(requestId);
    if (it == pending_.end()) {
        throw CoordinatorError(Reason::InvalidRequest, "no pending request " + std::to_string(requestId));
    }
    PendingRequest pending = it->second;
    auto& sub = requireSubscription(pending.request.subId);

    Uint256 payment = computePayment(pending.request);
    Uint256& funds = pending.request.nativePayment ? sub.nativeBalance : sub.balance;
    if (funds < payment) {
        std::ostringstream oss;
        oss << subLabel(pending.request.subId) << " holds " << funds << ", fulfillment costs " << payment;
        throw CoordinatorError(Reason::InsufficientBalance, oss.str());
    }

    FulfillmentRecord record;
    record.requestId = requestId;
    record.subId = pending.request.subId;
    record.consumer = pending.consumerAddress;
    record.keyHash = pending.request.keyHash;
    if (!proof.proofHex.empty()) {
        record.publicKeyHex = provers_.at(pending.request.keyHash).getPublicKey();
    }
    record.proof = std::move(proof);
    record.randomWords = std::move(randomWords);
    record.payment = payment;
    record.nativePayment = pending.request.nativePayment;

    // The request is consumed before the callback runs; a failing consumer cannot replay it.
    funds -= payment;
    ++sub.requestCount;
    pending_.erase(it);

    try {
        pending.consumer->rawFulfillRandomWords(self_, requestId, record.randomWords);
        record.success = true;
    } catch (const std::exception& ex) {
        record.success = false;
        record.error = ex.what();
    }

    fulfilled_[requestId] = record;
    return record;
}

} // namespace rv
