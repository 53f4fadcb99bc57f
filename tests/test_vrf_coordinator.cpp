#include "errors.hpp"
#include "ledger.hpp"
#include "local_vrf_coordinator.hpp"
#include "rng.hpp"
#include "units.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rv;

namespace {

const std::string kSeedHex = "c0ffee00c0ffee00c0ffee00c0ffee00c0ffee00c0ffee00c0ffee00c0ffee00";

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "coordinator_test failure: " << msg << std::endl;
    std::exit(1);
}

void expect(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

CoordinatorError expectCoordinatorError(CoordinatorError::Reason reason,
                                        const std::function<void()>& fn,
                                        const std::string& msg) {
    try {
        fn();
    } catch (const CoordinatorError& ex) {
        if (ex.reason() != reason) {
            fail(msg + ": wrong reason " + toString(ex.reason()));
        }
        return ex;
    } catch (const std::exception& ex) {
        fail(msg + ": unexpected exception: " + ex.what());
    }
    fail(msg + ": no exception thrown");
}

// Records every callback; optionally throws to emulate a reverting consumer.
class RecordingConsumer : public VrfConsumer {
public:
    struct Call {
        Address caller;
        RequestId requestId = 0;
        std::vector<Uint256> words;
    };

    explicit RecordingConsumer(std::string label) : address_(makeAddress(label)) {}

    const Address& consumerAddress() const override { return address_; }

    void rawFulfillRandomWords(const Address& caller,
                               RequestId requestId,
                               const std::vector<Uint256>& randomWords) override {
        calls.push_back(Call{ caller, requestId, randomWords });
        if (shouldThrow) {
            throw std::runtime_error("consumer reverted");
        }
    }

    std::vector<Call> calls;
    bool shouldThrow = false;

private:
    Address address_;
};

struct Fixture {
    Ledger ledger;
    LocalVrfCoordinator coordinator{ makeAddress("vrf-coordinator"), ledger };
    Address owner = makeAddress("owner");
    RecordingConsumer consumer{ "consumer" };
    std::string keyHash;
    SubscriptionId subId = 0;

    Fixture() {
        keyHash = coordinator.registerProvingKey(deriveVrfKeypairFromSeed(kSeedHex));
        subId = coordinator.createSubscription(owner);
        coordinator.fundSubscription(subId, parseEther("3"));
        coordinator.addConsumer(subId, owner, consumer.consumerAddress());
    }

    RandomWordsRequest request(std::uint32_t numWords = 1) const {
        RandomWordsRequest req;
        req.keyHash = keyHash;
        req.subId = subId;
        req.requestConfirmations = 3;
        req.callbackGasLimit = 500'000;
        req.numWords = numWords;
        return req;
    }
};

void testSubscriptions() {
    Fixture fx;
    expect(fx.subId == 1, "first subscription id is 1");
    expect(fx.coordinator.createSubscription(fx.owner) == 2, "subscription ids increment");

    SubscriptionInfo info = fx.coordinator.getSubscription(fx.subId);
    expect(info.owner == fx.owner, "owner recorded");
    expect(info.balance == parseEther("3"), "funding credited");
    expect(info.consumers.size() == 1, "one consumer registered");
    expect(fx.coordinator.isConsumer(fx.subId, fx.consumer.consumerAddress()), "isConsumer sees it");
    expect(!fx.coordinator.isConsumer(99, fx.consumer.consumerAddress()), "unknown subscription has none");
    expect(!fx.coordinator.isConsumer(fx.subId, "garbage"), "malformed address is not a consumer");

    fx.coordinator.addConsumer(fx.subId, fx.owner, fx.consumer.consumerAddress());
    expect(fx.coordinator.getSubscription(fx.subId).consumers.size() == 1, "re-adding is a no-op");

    Address stranger = makeAddress("stranger");
    expectCoordinatorError(CoordinatorError::Reason::MustBeSubOwner,
                           [&] { fx.coordinator.addConsumer(fx.subId, stranger, stranger); },
                           "only the owner adds consumers");
    expectCoordinatorError(CoordinatorError::Reason::MustBeSubOwner,
                           [&] { fx.coordinator.removeConsumer(fx.subId, stranger, fx.consumer.consumerAddress()); },
                           "only the owner removes consumers");
    expectCoordinatorError(CoordinatorError::Reason::InvalidConsumer,
                           [&] { fx.coordinator.removeConsumer(fx.subId, fx.owner, stranger); },
                           "removing a non-consumer fails");
    expectCoordinatorError(CoordinatorError::Reason::InvalidSubscription,
                           [&] { fx.coordinator.fundSubscription(42, 1); },
                           "funding an unknown subscription fails");
    expectCoordinatorError(CoordinatorError::Reason::InvalidSubscription,
                           [&] { fx.coordinator.getSubscription(42); },
                           "querying an unknown subscription fails");

    SubscriptionId crowded = fx.coordinator.createSubscription(fx.owner);
    for (std::size_t i = 0; i < LocalVrfCoordinator::kMaxConsumers; ++i) {
        fx.coordinator.addConsumer(crowded, fx.owner, makeAddress("c" + std::to_string(i)));
    }
    expectCoordinatorError(CoordinatorError::Reason::TooManyConsumers,
                           [&] { fx.coordinator.addConsumer(crowded, fx.owner, makeAddress("one-too-many")); },
                           "consumer limit enforced");

    fx.coordinator.removeConsumer(fx.subId, fx.owner, fx.consumer.consumerAddress());
    expect(!fx.coordinator.isConsumer(fx.subId, fx.consumer.consumerAddress()), "consumer removed");
}

void testRequestValidation() {
    Fixture fx;
    RecordingConsumer outsider("outsider");

    auto check = [&](CoordinatorError::Reason reason, RandomWordsRequest req, VrfConsumer& who,
                     const std::string& msg) {
        expectCoordinatorError(reason, [&] { fx.coordinator.requestRandomWords(who, req); }, msg);
        expect(fx.coordinator.pendingRequestCount() == 0, msg + ": nothing recorded");
    };

    RandomWordsRequest req = fx.request();
    req.subId = 7;
    check(CoordinatorError::Reason::InvalidSubscription, req, fx.consumer, "unknown subscription");

    check(CoordinatorError::Reason::InvalidConsumer, fx.request(), outsider, "unregistered consumer");

    req = fx.request();
    req.requestConfirmations = kMinRequestConfirmations - 1;
    check(CoordinatorError::Reason::InvalidRequestConfirmations, req, fx.consumer, "too few confirmations");
    req.requestConfirmations = kMaxRequestConfirmations + 1;
    check(CoordinatorError::Reason::InvalidRequestConfirmations, req, fx.consumer, "too many confirmations");

    req = fx.request();
    req.callbackGasLimit = kMaxCallbackGasLimit + 1;
    check(CoordinatorError::Reason::GasLimitTooBig, req, fx.consumer, "gas limit above maximum");

    check(CoordinatorError::Reason::NumWordsTooBig, fx.request(kMaxNumWords + 1), fx.consumer,
          "too many words");

    req = fx.request();
    req.keyHash = "0x" + std::string(64, '0');
    check(CoordinatorError::Reason::InvalidKeyHash, req, fx.consumer, "unregistered key hash");

    req = fx.request();
    req.requestConfirmations = kMaxRequestConfirmations;
    req.callbackGasLimit = kMaxCallbackGasLimit;
    expect(fx.coordinator.requestRandomWords(fx.consumer, req) == 1, "limits are inclusive");
    expect(fx.coordinator.requestRandomWords(fx.consumer, fx.request()) == 2, "request ids increment");
    expect(fx.coordinator.isPending(1) && fx.coordinator.isPending(2), "both requests pending");
    expect(fx.consumer.calls.empty(), "requesting does not call back");
}

void testVrfFulfillment() {
    Fixture fx;
    RequestId requestId = fx.coordinator.requestRandomWords(fx.consumer, fx.request(3));
    Uint256 balanceBefore = fx.coordinator.getSubscription(fx.subId).balance;

    FulfillmentRecord record = fx.coordinator.fulfillRandomWords(requestId);
    expect(record.success, "fulfillment succeeds");
    expect(record.requestId == requestId && record.subId == fx.subId, "record identifies the request");
    expect(record.consumer == fx.consumer.consumerAddress(), "record identifies the consumer");
    expect(record.randomWords.size() == 3, "requested number of words delivered");
    expect(record.keyHash == fx.keyHash, "record names the proving key");
    expect(LocalVrfCoordinator::verifyFulfillment(record), "proof verifies");
    expect(record.randomWords == expandRandomWords(record.proof.outputHex, 3), "words derive from the output");

    expect(fx.consumer.calls.size() == 1, "consumer called exactly once");
    expect(fx.consumer.calls[0].caller == fx.coordinator.coordinatorAddress(), "caller is the coordinator");
    expect(fx.consumer.calls[0].requestId == requestId, "callback carries the request id");
    expect(fx.consumer.calls[0].words == record.randomWords, "callback carries the words");

    Uint256 expectedPayment = parseEther("0.25") + Uint256(1'000'000'000) * 500'000;
    expect(record.payment == expectedPayment, "payment is base fee plus gas");
    SubscriptionInfo info = fx.coordinator.getSubscription(fx.subId);
    expect(info.balance == balanceBefore - expectedPayment, "subscription charged");
    expect(info.requestCount == 1, "request counted");

    expect(!fx.coordinator.isPending(requestId), "request consumed");
    expect(fx.coordinator.getFulfillment(requestId).has_value(), "fulfillment retained for audit");
    expectCoordinatorError(CoordinatorError::Reason::InvalidRequest,
                           [&] { fx.coordinator.fulfillRandomWords(requestId); },
                           "a request is fulfilled at most once");
    expect(fx.consumer.calls.size() == 1, "no second callback");

    FulfillmentRecord tampered = record;
    tampered.randomWords[0] += 1;
    expect(!LocalVrfCoordinator::verifyFulfillment(tampered), "altered word is detected");
    tampered = record;
    tampered.proof.alpha += "x";
    expect(!LocalVrfCoordinator::verifyFulfillment(tampered), "altered alpha is detected");
    tampered = record;
    tampered.keyHash = "0x" + std::string(64, 'a');
    expect(!LocalVrfCoordinator::verifyFulfillment(tampered), "mismatched key hash is detected");
}

void testDistinctRequestsGetDistinctWords() {
    Fixture fx;
    RequestId first = fx.coordinator.requestRandomWords(fx.consumer, fx.request());
    RequestId second = fx.coordinator.requestRandomWords(fx.consumer, fx.request());
    FulfillmentRecord a = fx.coordinator.fulfillRandomWords(second);
    FulfillmentRecord b = fx.coordinator.fulfillRandomWords(first);
    expect(a.proof.alpha != b.proof.alpha, "every request has its own VRF input");
    expect(a.randomWords != b.randomWords, "every request gets its own words");
    expect(fx.consumer.calls[0].requestId == second, "fulfillment order is the caller's choice");
}

void testOverride() {
    Fixture fx;
    RequestId requestId = fx.coordinator.requestRandomWords(fx.consumer, fx.request(2));
    expectCoordinatorError(CoordinatorError::Reason::InvalidRandomWords,
                           [&] { fx.coordinator.fulfillRandomWordsWithOverride(requestId, { Uint256(1) }); },
                           "word count must match the request");
    expect(fx.coordinator.isPending(requestId), "rejected override leaves the request pending");

    FulfillmentRecord record = fx.coordinator.fulfillRandomWordsWithOverride(requestId, { Uint256(7), Uint256(9) });
    expect(record.success, "override fulfillment succeeds");
    expect(fx.consumer.calls.back().words == std::vector<Uint256>({ Uint256(7), Uint256(9) }),
           "override words delivered verbatim");
    expect(!LocalVrfCoordinator::verifyFulfillment(record), "override carries no proof");
    expectCoordinatorError(CoordinatorError::Reason::InvalidRequest,
                           [&] { fx.coordinator.fulfillRandomWordsWithOverride(99, { Uint256(1) }); },
                           "unknown request id");
}

void testInsufficientBalance() {
    Fixture fx;
    SubscriptionId empty = fx.coordinator.createSubscription(fx.owner);
    fx.coordinator.addConsumer(empty, fx.owner, fx.consumer.consumerAddress());
    RandomWordsRequest req = fx.request();
    req.subId = empty;
    RequestId requestId = fx.coordinator.requestRandomWords(fx.consumer, req);

    expectCoordinatorError(CoordinatorError::Reason::InsufficientBalance,
                           [&] { fx.coordinator.fulfillRandomWords(requestId); },
                           "unfunded subscription cannot pay");
    expect(fx.coordinator.isPending(requestId), "request stays pending until funded");
    expect(fx.consumer.calls.empty(), "consumer not called");

    fx.coordinator.fundSubscription(empty, parseEther("1"));
    expect(fx.coordinator.fulfillRandomWords(requestId).success, "funded subscription pays");
}

void testNativePayment() {
    Fixture fx;
    Address payer = makeAddress("payer");
    fx.ledger.deal(payer, parseEther("1"));
    fx.coordinator.fundSubscriptionWithNative(fx.subId, payer, parseEther("0.5"));
    expect(fx.ledger.balanceOf(payer) == parseEther("0.5"), "payer debited");
    expect(fx.ledger.balanceOf(fx.coordinator.coordinatorAddress()) == parseEther("0.5"), "coordinator credited");
    expect(fx.coordinator.getSubscription(fx.subId).nativeBalance == parseEther("0.5"), "native balance credited");

    expect(fx.ledger.balanceOf(makeAddress("nobody")) == 0, "sanity");
    try {
        fx.coordinator.fundSubscriptionWithNative(fx.subId, makeAddress("nobody"), 1);
        fail("native funding without funds must fail");
    } catch (const TransferError& ex) {
        expect(ex.reason() == TransferError::Reason::InsufficientFunds, "reason is InsufficientFunds");
    }
    expect(fx.coordinator.getSubscription(fx.subId).nativeBalance == parseEther("0.5"), "failed funding credits nothing");

    RandomWordsRequest req = fx.request();
    req.nativePayment = true;
    RequestId requestId = fx.coordinator.requestRandomWords(fx.consumer, req);
    FulfillmentRecord record = fx.coordinator.fulfillRandomWords(requestId);
    Uint256 juels = parseEther("0.25") + Uint256(1'000'000'000) * 500'000;
    Uint256 expected = juels * Uint256(4'000'000'000'000'000ULL) / parseEther("1");
    expect(record.nativePayment && record.payment == expected, "native payment converted at the feed rate");
    SubscriptionInfo info = fx.coordinator.getSubscription(fx.subId);
    expect(info.nativeBalance == parseEther("0.5") - expected, "native balance charged");
    expect(info.balance == parseEther("3"), "LINK balance untouched");
}

void testFailingConsumer() {
    Fixture fx;
    fx.consumer.shouldThrow = true;
    RequestId requestId = fx.coordinator.requestRandomWords(fx.consumer, fx.request());
    FulfillmentRecord record = fx.coordinator.fulfillRandomWords(requestId);
    expect(!record.success, "reverting consumer recorded as failure");
    expect(record.error == "consumer reverted", "consumer error preserved");
    expect(!fx.coordinator.isPending(requestId), "request consumed despite the failure");
    expect(fx.coordinator.getSubscription(fx.subId).requestCount == 1, "subscription still charged");
    auto stored = fx.coordinator.getFulfillment(requestId);
    expect(stored && !stored->success, "failure retained for audit");
    expect(LocalVrfCoordinator::verifyFulfillment(*stored), "proof of a failed delivery still verifies");
}

} // namespace

int main() {
    testSubscriptions();
    testRequestValidation();
    testVrfFulfillment();
    testDistinctRequestsGetDistinctWords();
    testOverride();
    testInsufficientBalance();
    testNativePayment();
    testFailingConsumer();

    std::cout << "VRF coordinator tests passed.\n";
    return 0;
}
