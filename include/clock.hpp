#pragma once

#include <cstdint>

namespace rv {

// Seconds since the Unix epoch, the resolution of a block timestamp.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::uint64_t now() const = 0;
};

class SystemClock : public Clock {
public:
    std::uint64_t now() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(std::uint64_t start = 1) : now_(start) {}

    std::uint64_t now() const override { return now_; }
    void warp(std::uint64_t timestamp) { now_ = timestamp; }
    void advance(std::uint64_t seconds);

private:
    std::uint64_t now_;
};

} // namespace rv
