#include "cardio_rate.h"
#include <algorithm>
#include <array>
#include <cmath>

namespace cardio {

HeartRateEstimator::HeartRateEstimator(double fs, const Options& opt)
    : fs_(fs),
      capacity_(std::clamp(opt.rrHistory, 1, kMaxRrHistory)),
      minRrMs_(opt.minRrMs),
      maxRrMs_(opt.maxRrMs),
      timeoutTicks_(static_cast<std::uint64_t>(std::llround(opt.rateTimeoutMs * 0.001 * fs))) {}

RateEstimate HeartRateEstimator::onBeat(const HeartbeatEvent& ev, bool* rejected) {
    if (rejected) *rejected = false;
    if (!haveRef_) {
        haveRef_ = true;
        lastBeat_ = ev.index;
        return est_;
    }
    if (ev.index <= lastBeat_) {
        if (rejected) *rejected = true;
        return est_;
    }
    const double rrMs = static_cast<double>(ev.index - lastBeat_) * 1000.0 / fs_;
    if (rrMs < minRrMs_) {
        // too close to the previous beat: this one is the outlier, keep the reference
        if (rejected) *rejected = true;
        return est_;
    }
    lastBeat_ = ev.index;
    return onInterval(rrMs, rejected);
}

RateEstimate HeartRateEstimator::onInterval(double rrMs, bool* rejected) {
    if (rejected) *rejected = false;
    if (!std::isfinite(rrMs) || rrMs < minRrMs_ || rrMs > maxRrMs_) {
        if (rejected) *rejected = true;
        return est_;
    }
    rr_.push(rrMs);
    recompute();
    return est_;
}

void HeartRateEstimator::recompute() {
    const std::size_t n = std::min<std::size_t>(rr_.size(), static_cast<std::size_t>(capacity_));
    if (n == 0) {
        est_ = RateEstimate{};
        return;
    }
    std::array<double, kMaxRrHistory> tmp{};
    for (std::size_t k = 0; k < n; ++k) tmp[k] = rr_.back(k);
    std::sort(tmp.begin(), tmp.begin() + n);
    const double med = (n % 2 == 1) ? tmp[n / 2] : 0.5 * (tmp[n / 2 - 1] + tmp[n / 2]);
    est_.available = true;
    est_.rrMs = med;
    est_.bpm = 60000.0 / med;
    est_.intervals = static_cast<int>(n);
}

void HeartRateEstimator::update(std::uint64_t index) {
    if (!haveRef_ || index <= lastBeat_) return;
    if (index - lastBeat_ > timeoutTicks_) {
        rr_.clear();
        haveRef_ = false;
        est_ = RateEstimate{};
    }
}

} // namespace cardio
