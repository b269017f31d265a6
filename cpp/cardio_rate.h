// Heart-rate estimation from accepted beats
#pragma once

#include <cstdint>
#include "cardio_core.h"
#include "cardio_ring.h"

namespace cardio {

class HeartRateEstimator {
public:
    // fs is the rate of the indices carried by the events (input tick rate)
    HeartRateEstimator(double fs, const Options& opt);

    // Adds the interval since the previous beat. rejected (optional) is set
    // when the interval fell outside [minRrMs, maxRrMs] and was dropped.
    RateEstimate onBeat(const HeartbeatEvent& ev, bool* rejected = nullptr);

    // Same acceptance logic for a bare interval in milliseconds
    RateEstimate onInterval(double rrMs, bool* rejected = nullptr);

    // Advances the clock; after rateTimeoutMs without a beat the estimate
    // becomes unavailable and the history is discarded.
    void update(std::uint64_t index);

    const RateEstimate& current() const { return est_; }

private:
    void recompute();

    double fs_;
    int capacity_;
    double minRrMs_;
    double maxRrMs_;
    std::uint64_t timeoutTicks_;

    RingBuffer<double, kMaxRrHistory> rr_;
    bool haveRef_ {false};
    std::uint64_t lastBeat_ {0};
    RateEstimate est_;
};

} // namespace cardio
