// Filter stages and their static composition.
// Every stage exposes:
//   float process(float in);    one sample in, one sample out, O(1), no allocation
//   unsigned resetCount() const; number of recoveries from non-finite state
#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <tuple>
#include <utility>
#include "cardio_ring.h"

namespace cardio {

constexpr double kButterworthQ = 0.7071067811865476;

// Transposed direct form II biquad; state in double, samples in float.
struct SBiquad {
    double b0{0}, b1{0}, b2{0}, a1{0}, a2{0};
    double z1{0}, z2{0};
    unsigned resets{0};

    inline float process(float in) {
        double out = in * b0 + z1;
        z1 = in * b1 + z2 - a1 * out;
        z2 = in * b2 - a2 * out;
        float o = static_cast<float>(out);
        if (!std::isfinite(o) || !std::isfinite(z1) || !std::isfinite(z2)) {
            // diverged: restart from rest instead of propagating NaN/Inf
            z1 = 0.0; z2 = 0.0; ++resets;
            return 0.0f;
        }
        return o;
    }
    // |H(e^jw)| at frequency f (Hz)
    double magnitudeAt(double f, double fs) const;
};

// RBJ cookbook designs, normalised by a0
SBiquad designLowPass(double fs, double f0, double Q = kButterworthQ);
SBiquad designHighPass(double fs, double f0, double Q = kButterworthQ);
SBiquad designNotch(double fs, double f0, double Q);

// Cascade of biquad sections (e.g. 4th order Butterworth = 2 sections)
template <std::size_t Sections>
class BiquadCascade {
public:
    BiquadCascade() = default;
    explicit BiquadCascade(const std::array<SBiquad, Sections>& s) : sec_(s) {}

    float process(float in) {
        for (auto& s : sec_) in = s.process(in);
        return in;
    }
    unsigned resetCount() const {
        unsigned n = 0; for (const auto& s : sec_) n += s.resets; return n;
    }
    const SBiquad& section(std::size_t i) const { return sec_[i]; }

private:
    std::array<SBiquad, Sections> sec_{};
};

// Butterworth low-pass of order 2*Sections
template <std::size_t Sections>
BiquadCascade<Sections> designButterworthLowPass(double fs, double f0) {
    std::array<SBiquad, Sections> s{};
    const double n = 2.0 * Sections;
    for (std::size_t k = 0; k < Sections; ++k) {
        // pole pair k of an order-n Butterworth prototype
        double theta = 3.141592653589793 * (2.0 * k + 1.0) / (2.0 * n);
        s[k] = designLowPass(fs, f0, 1.0 / (2.0 * std::sin(theta)));
    }
    return BiquadCascade<Sections>(s);
}

// Baseline wander removal. The first sample is subtracted before filtering so
// the DC offset of the front-end does not ring through the filter at start-up.
class BaselineHighPass {
public:
    BaselineHighPass(double fs, double cornerHz) : bq_(designHighPass(fs, cornerHz)) {}
    float process(float in) {
        if (!primed_) { first_ = in; primed_ = true; }
        return bq_.process(in - first_);
    }
    unsigned resetCount() const { return bq_.resets; }

private:
    SBiquad bq_;
    float first_ {0.0f};
    bool primed_ {false};
};

// Narrow-band power-line notch
class NotchFilter {
public:
    NotchFilter(double fs, double mainsHz, double Q) : bq_(designNotch(fs, mainsHz, Q)) {}
    float process(float in) { return bq_.process(in); }
    unsigned resetCount() const { return bq_.resets; }
    const SBiquad& biquad() const { return bq_; }

private:
    SBiquad bq_;
};

class LowPassFilter {
public:
    LowPassFilter(double fs, double cornerHz) : bq_(designLowPass(fs, cornerHz)) {}
    float process(float in) { return bq_.process(in); }
    unsigned resetCount() const { return bq_.resets; }

private:
    SBiquad bq_;
};

// FIR over N fixed taps. Until N samples were seen the missing history is zero.
template <std::size_t N>
class FirFilter {
public:
    explicit FirFilter(const float (&taps)[N]) : taps_(taps) {}
    float process(float in) {
        hist_.push(in);
        const std::size_t n = hist_.size();
        // taps_[0] multiplies the newest sample
        double acc = 0.0;
        for (std::size_t k = 0; k < n; ++k) acc += static_cast<double>(taps_[k]) * hist_.back(k);
        return static_cast<float>(acc);
    }
    unsigned resetCount() const { return 0; }

private:
    const float* taps_;
    RingBuffer<float, N> hist_;
};

// Moving average over a runtime length <= N. The running sum is rebuilt from
// the window once per wrap so rounding error cannot accumulate.
template <std::size_t N>
class MovingAverage {
public:
    explicit MovingAverage(int length = static_cast<int>(N))
        : len_(length < 1 ? 1 : (length > static_cast<int>(N) ? static_cast<int>(N) : length)) {}

    float process(float in) {
        if (count_ == len_) sum_ -= win_[pos_];
        else ++count_;
        win_[pos_] = in;
        sum_ += in;
        if (++pos_ == len_) {
            pos_ = 0;
            double s = 0.0;
            for (int i = 0; i < count_; ++i) s += win_[i];
            sum_ = s;
        }
        return static_cast<float>(sum_ / len_);
    }
    unsigned resetCount() const { return 0; }
    int length() const { return len_; }

private:
    std::array<float, N> win_{};
    int len_;
    int pos_ {0};
    int count_ {0};
    double sum_ {0.0};
};

// Running median of the last N samples (N odd). Partial windows use the
// median of what is available.
template <std::size_t N>
class MedianFilter {
    static_assert(N % 2 == 1, "MedianFilter needs an odd window");
public:
    float process(float in) {
        hist_.push(in);
        const std::size_t n = hist_.size();
        std::array<float, N> tmp{};
        for (std::size_t i = 0; i < n; ++i) tmp[i] = hist_[i];
        // insertion sort, N is small
        for (std::size_t i = 1; i < n; ++i) {
            float v = tmp[i]; std::size_t j = i;
            while (j > 0 && tmp[j - 1] > v) { tmp[j] = tmp[j - 1]; --j; }
            tmp[j] = v;
        }
        return tmp[n / 2];
    }
    unsigned resetCount() const { return 0; }

private:
    RingBuffer<float, N> hist_;
};

// y[n] = x[n] - x[n-N]; removes components periodic in N samples
template <std::size_t N>
class CombFilter {
public:
    float process(float in) {
        float old = 0.0f;
        bool had = hist_.push(in, &old);
        return had ? in - old : 0.0f;
    }
    unsigned resetCount() const { return 0; }

private:
    RingBuffer<float, N> hist_;
};

// Fixed-order composition of heterogeneous stages; itself a stage.
template <typename... Stages>
class StageChain {
public:
    explicit StageChain(Stages... s) : stages_(std::move(s)...) {}

    float process(float in) {
        return std::apply([in](auto&... st) {
            float x = in;
            ((x = st.process(x)), ...);
            return x;
        }, stages_);
    }
    unsigned resetCount() const {
        return std::apply([](const auto&... st) { return (0u + ... + st.resetCount()); }, stages_);
    }

    static constexpr std::size_t size() { return sizeof...(Stages); }

private:
    std::tuple<Stages...> stages_;
};

template <typename... Stages>
StageChain<Stages...> makeChain(Stages... s) {
    return StageChain<Stages...>(std::move(s)...);
}

} // namespace cardio
