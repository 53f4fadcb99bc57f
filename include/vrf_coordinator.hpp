#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rv {

constexpr std::uint16_t kMinRequestConfirmations = 3;
constexpr std::uint16_t kMaxRequestConfirmations = 200;
constexpr std::uint32_t kMaxNumWords = 500;
constexpr std::uint32_t kMaxCallbackGasLimit = 2'500'000;

struct RandomWordsRequest {
    std::string keyHash;
    SubscriptionId subId = 0;
    std::uint16_t requestConfirmations = kMinRequestConfirmations;
    std::uint32_t callbackGasLimit = 0;
    std::uint32_t numWords = 1;
    bool nativePayment = false;
};

// Receiving side of a randomness request. The coordinator passes its own address as caller.
class VrfConsumer {
public:
    virtual ~VrfConsumer() = default;
    virtual const Address& consumerAddress() const = 0;
    virtual void rawFulfillRandomWords(const Address& caller,
                                       RequestId requestId,
                                       const std::vector<Uint256>& randomWords) = 0;
};

class VrfCoordinator {
public:
    virtual ~VrfCoordinator() = default;
    virtual const Address& coordinatorAddress() const = 0;

    // The consumer must outlive the request; it is called back at most once per id.
    virtual RequestId requestRandomWords(VrfConsumer& consumer, const RandomWordsRequest& request) = 0;
};

} // namespace rv
