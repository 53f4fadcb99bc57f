#pragma once

#include "ledger.hpp"
#include "rng.hpp"
#include "vrf_coordinator.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rv {

struct CoordinatorFees {
    Uint256 baseFeeJuels;     // flat premium per fulfillment
    Uint256 gasPriceJuels;    // per unit of callback gas limit
    Uint256 weiPerUnitLink;   // native conversion rate
};

// Values of the upstream mock coordinator used by local deployments.
CoordinatorFees defaultCoordinatorFees();

struct SubscriptionInfo {
    Address owner;
    Uint256 balance;        // juels
    Wei nativeBalance;
    std::uint64_t requestCount = 0;
    std::vector<Address> consumers;
};

struct FulfillmentRecord {
    RequestId requestId = 0;
    SubscriptionId subId = 0;
    Address consumer;
    std::string keyHash;
    std::string publicKeyHex;
    VrfProof proof;         // empty when the words were overridden
    std::vector<Uint256> randomWords;
    Uint256 payment;
    bool nativePayment = false;
    bool success = false;
    std::string error;
};

// In-process coordinator: owns subscriptions and proving keys and answers requests with ECVRF
// proofs. Fulfillment is explicit so callers decide when the asynchronous callback happens.
class LocalVrfCoordinator : public VrfCoordinator {
public:
    static constexpr std::size_t kMaxConsumers = 100;

    LocalVrfCoordinator(Address self, Ledger& ledger, CoordinatorFees fees = defaultCoordinatorFees());

    const Address& coordinatorAddress() const override { return self_; }

    std::string registerProvingKey(const VrfKeyPair& keys);
    bool hasProvingKey(const std::string& keyHash) const;

    SubscriptionId createSubscription(const Address& owner);
    void fundSubscription(SubscriptionId subId, const Uint256& juels);
    void fundSubscriptionWithNative(SubscriptionId subId, const Address& payer, const Wei& amount);
    void addConsumer(SubscriptionId subId, const Address& caller, const Address& consumer);
    void removeConsumer(SubscriptionId subId, const Address& caller, const Address& consumer);
    SubscriptionInfo getSubscription(SubscriptionId subId) const;
    bool isConsumer(SubscriptionId subId, const Address& consumer) const;

    RequestId requestRandomWords(VrfConsumer& consumer, const RandomWordsRequest& request) override;

    FulfillmentRecord fulfillRandomWords(RequestId requestId);
    FulfillmentRecord fulfillRandomWordsWithOverride(RequestId requestId,
                                                     std::vector<Uint256> randomWords);

    bool isPending(RequestId requestId) const { return pending_.count(requestId) != 0; }
    std::size_t pendingRequestCount() const { return pending_.size(); }
    std::optional<FulfillmentRecord> getFulfillment(RequestId requestId) const;

    static bool verifyFulfillment(const FulfillmentRecord& record);

private:
    struct PendingRequest {
        VrfConsumer* consumer = nullptr;
        Address consumerAddress;
        RandomWordsRequest request;
        std::uint64_t nonce = 0;
    };

    SubscriptionInfo& requireSubscription(SubscriptionId subId);
    const SubscriptionInfo& requireSubscription(SubscriptionId subId) const;
    void requireOwner(const SubscriptionInfo& sub, const Address& caller) const;
    Uint256 computePayment(const RandomWordsRequest& request) const;
    FulfillmentRecord deliver(RequestId requestId,
                              std::vector<Uint256> randomWords,
                              VrfProof proof);

    Address self_;
    Ledger& ledger_;
    CoordinatorFees fees_;
    std::map<std::string, VrfProver> provers_;
    std::map<SubscriptionId, SubscriptionInfo> subscriptions_;
    std::map<Address, std::uint64_t> consumerNonces_;
    std::map<RequestId, PendingRequest> pending_;
    std::map<RequestId, FulfillmentRecord> fulfilled_;
    SubscriptionId nextSubId_ = 1;
    RequestId nextRequestId_ = 1;
};

} // namespace rv
