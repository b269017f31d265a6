#include "cardio_qrs.h"
#include "cardio_log.h"
#include <algorithm>
#include <cmath>

namespace cardio {

static const char* kTag = "cardio.qrs";

// Levels below this are treated as "no signal" (units of squared slope)
static constexpr double kMinLevel = 1e-6;
// Squared derivative is clamped so the integrator cannot overflow
static constexpr float kMaxEnergy = 1e30f;

static int ceilSamples(double ms, double fs) {
    return std::max(1, static_cast<int>(std::ceil(ms * 0.001 * fs - 1e-9)));
}

QrsDetector::QrsDetector(double fs, const Options& opt)
    : fs_(fs),
      refractory_(ceilSamples(opt.refractoryMs, fs)),
      tWave_(msToSamples(opt.tWaveWindowMs, fs)),
      peakHold_(msToSamples(95.0, fs)),
      learnSamples_(msToSamples(opt.learningMs, fs)),
      lostSamples_(msToSamples(opt.signalLostMs, fs)),
      rrUsed_(std::clamp(opt.rrHistory, 1, kMaxRrHistory)),
      minRr_(msToSamples(opt.minRrMs, fs)),
      maxRr_(msToSamples(opt.maxRrMs, fs)),
      searchBackFactor_(opt.searchBackFactor),
      mwi_(msToSamples(opt.integrationMs, fs)) {
    startLearning(0);
}

void QrsDetector::startLearning(std::uint64_t n) {
    learning_ = true;
    learnEnd_ = n + static_cast<std::uint64_t>(learnSamples_);
    learnMax_ = 0.0f;
    learnSum_ = 0.0;
    learnCount_ = 0;
    spk_ = npk_ = t1_ = t2_ = 0.0;
    haveBeat_ = false;
    lastSlope_ = 0.0f;
    rr_.clear();
    candidates_.clear();
    searchBackArmed_ = false;
}

void QrsDetector::finishLearning(std::uint64_t n) {
    if (learnMax_ <= kMinLevel || learnCount_ == 0) {
        // nothing but a flat line: keep learning
        startLearning(n);
        return;
    }
    spk_ = learnMax_ / 3.0;
    npk_ = 0.5 * (learnSum_ / static_cast<double>(learnCount_));
    updateThresholds();
    learning_ = false;
    lastEvent_ = n;
    CARDIO_LOGD(kTag, "learned spk=%g npk=%g", spk_, npk_);
}

void QrsDetector::updateThresholds() {
    if (!std::isfinite(spk_) || !std::isfinite(npk_)) {
        CARDIO_LOGW(kTag, "non-finite levels, re-learning");
        startLearning(n_);
        return;
    }
    spk_ = std::max(spk_, kMinLevel);
    npk_ = std::max(npk_, 0.0);
    t1_ = std::max(npk_ + 0.25 * (spk_ - npk_), kMinLevel);
    t2_ = 0.5 * t1_;
}

double QrsDetector::meanRrSamples() const {
    const std::size_t n = std::min<std::size_t>(rr_.size(), static_cast<std::size_t>(rrUsed_));
    if (n == 0) return 0.0;
    double s = 0.0;
    for (std::size_t k = 0; k < n; ++k) s += rr_.back(k);
    return s / static_cast<double>(n);
}

// Reports an integrator peak once the output has fallen to half of the
// maximum, or peakHold_ samples after it. Only genuine rises start tracking,
// so the falling edge of a complex never produces a peak of its own.
bool QrsDetector::trackPeak(float m, float slope, std::uint64_t n, Peak& out) {
    bool reported = false;
    if (!tracking_) {
        if (m > prevM_) {
            tracking_ = true;
            trackMax_ = m;
            trackIdx_ = n;
            trackSlope_ = slope;
            sinceMax_ = 0;
        }
    } else {
        trackSlope_ = std::max(trackSlope_, slope);
        if (m > trackMax_) {
            trackMax_ = m;
            trackIdx_ = n;
            sinceMax_ = 0;
        } else if (m <= 0.5f * trackMax_ || ++sinceMax_ > peakHold_) {
            out.index = locateRPeak(trackIdx_);
            out.amplitude = trackMax_;
            out.slope = trackSlope_;
            tracking_ = false;
            reported = true;
        }
    }
    prevM_ = m;
    return reported;
}

// The integrator peaks after the complex; the R-peak is the largest
// excursion of the filtered signal inside the integration window before it.
std::uint64_t QrsDetector::locateRPeak(std::uint64_t mwiIndex) const {
    const std::uint64_t newest = n_ - 1;  // index of xf_.back(0)
    const std::uint64_t span = static_cast<std::uint64_t>(mwi_.length()) + 2;
    std::uint64_t best = mwiIndex;
    float bestAbs = -1.0f;
    for (std::uint64_t k = newest - mwiIndex; k < xf_.size(); ++k) {
        const std::uint64_t idx = newest - k;
        if (idx + span < mwiIndex) break;
        const float a = std::fabs(xf_.back(static_cast<std::size_t>(k)));
        if (a > bestAbs) { bestAbs = a; best = idx; }
    }
    return best;
}

bool QrsDetector::looksLikeTWave(const Peak& pk) const {
    return haveBeat_ && pk.index < lastBeat_ + static_cast<std::uint64_t>(tWave_)
        && pk.slope < 0.5f * lastSlope_;
}

bool QrsDetector::classify(const Peak& pk, HeartbeatEvent& beat) {
    // same complex as the last beat, or still inside the refractory window
    if (haveBeat_ && pk.index <= lastBeat_ + static_cast<std::uint64_t>(refractory_)) return false;

    if (pk.amplitude > t1_) {
        if (looksLikeTWave(pk)) {
            npk_ = 0.125 * pk.amplitude + 0.875 * npk_;
            updateThresholds();
            return false;
        }
        accept(pk, false, beat);
        return true;
    }

    // a second report from the same complex counts once
    if (!candidates_.empty() && candidates_.newest().index == pk.index) return false;
    npk_ = 0.125 * pk.amplitude + 0.875 * npk_;
    updateThresholds();
    candidates_.push(pk);
    searchBackArmed_ = true;
    return false;
}

bool QrsDetector::searchBack(std::uint64_t n, HeartbeatEvent& beat) {
    if (!searchBackArmed_ || !haveBeat_) return false;
    const double mean = meanRrSamples();
    if (mean <= 0.0 || static_cast<double>(n - lastBeat_) <= searchBackFactor_ * mean) return false;

    searchBackArmed_ = false;
    bool found = false;
    Peak best;
    for (std::size_t i = 0; i < candidates_.size(); ++i) {
        const Peak& c = candidates_[i];
        if (c.index <= lastBeat_ + static_cast<std::uint64_t>(refractory_)) continue;
        if (c.amplitude <= t2_ || looksLikeTWave(c)) continue;
        if (!found || c.amplitude > best.amplitude) { best = c; found = true; }
    }
    if (!found) return false;

    accept(best, true, beat);
    return true;
}

void QrsDetector::accept(const Peak& pk, bool retro, HeartbeatEvent& beat) {
    if (retro) spk_ = 0.25 * pk.amplitude + 0.75 * spk_;
    else       spk_ = 0.125 * pk.amplitude + 0.875 * spk_;

    if (haveBeat_) {
        const std::uint64_t rr = pk.index - lastBeat_;
        // only plausible intervals feed the search-back timing
        if (rr >= static_cast<std::uint64_t>(minRr_) && rr <= static_cast<std::uint64_t>(maxRr_))
            rr_.push(static_cast<std::uint32_t>(rr));
    }
    haveBeat_ = true;
    lastBeat_ = pk.index;
    lastSlope_ = pk.slope;
    lastEvent_ = n_ - 1;

    // keep only candidates that follow the accepted beat
    RingBuffer<Peak, kSearchBackCapacity> keep;
    for (std::size_t i = 0; i < candidates_.size(); ++i)
        if (candidates_[i].index > pk.index) keep.push(candidates_[i]);
    candidates_ = keep;
    searchBackArmed_ = !candidates_.empty();

    updateThresholds();

    beat.index = pk.index;
    beat.amplitude = pk.amplitude;
    beat.confidence = static_cast<float>(std::clamp(pk.amplitude / spk_, 0.0, 1.0));
    beat.searchBack = retro;
}

bool QrsDetector::update(float x, HeartbeatEvent& beat) {
    const std::uint64_t n = n_++;
    xd_.push(x);
    xf_.push(x);

    // 5-point derivative, zero until its taps are filled
    double d = 0.0;
    if (xd_.full())
        d = (2.0 * xd_.back(0) + xd_.back(1) - xd_.back(3) - 2.0 * xd_.back(4)) * (fs_ / 8.0);
    const float energy = static_cast<float>(std::min<double>(d * d, kMaxEnergy));
    const float m = mwi_.process(energy);
    const float slope = static_cast<float>(std::fabs(d));

    Peak pk;
    const bool gotPeak = trackPeak(m, slope, n, pk);

    if (learning_) {
        learnMax_ = std::max(learnMax_, m);
        learnSum_ += m;
        ++learnCount_;
        if (n + 1 >= learnEnd_) finishLearning(n);
        return false;
    }

    if (gotPeak && classify(pk, beat)) return true;
    if (searchBack(n, beat)) return true;

    // no beat for too long: thresholds are stale, start over
    const double mean = meanRrSamples();
    const std::uint64_t lost = static_cast<std::uint64_t>(std::max<double>(lostSamples_, 2.5 * mean));
    if (n - lastEvent_ > lost) {
        CARDIO_LOGD(kTag, "no beat for %llu samples, re-learning",
                    static_cast<unsigned long long>(n - lastEvent_));
        startLearning(n);
    }
    return false;
}

} // namespace cardio
