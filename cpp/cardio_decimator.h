// Decimation: anti-alias stage on every input, one output per N inputs.
#pragma once

#include <cstddef>
#include <utility>
#include "cardio_core.h"
#include "cardio_filters.h"

namespace cardio {

// Standard topology: 4th order Butterworth low-pass at 80% of the output Nyquist
struct StandardAntiAlias {
    static constexpr Topology kTopology = Topology::STANDARD;
    using Stage = BiquadCascade<2>;
    static Stage make(double fsIn, int factor) {
        return designButterworthLowPass<2>(fsIn, 0.4 * fsIn / factor);
    }
};

// Lightweight topology: boxcar over the decimation window (sinc response)
struct LightweightAntiAlias {
    static constexpr Topology kTopology = Topology::LIGHTWEIGHT;
    using Stage = MovingAverage<kMaxDecimation>;
    static Stage make(double, int factor) { return Stage(factor); }
};

#ifdef CARDIO_LIGHTWEIGHT_DECIMATOR
using BuildAntiAlias = LightweightAntiAlias;
#else
using BuildAntiAlias = StandardAntiAlias;
#endif

template <typename AntiAlias>
class Decimator {
public:
    using Stage = typename AntiAlias::Stage;
    static constexpr Topology kTopology = AntiAlias::kTopology;

    Decimator(double fsIn, int factor)
        : factor_(factor < 1 ? 1 : factor), filter_(AntiAlias::make(fsIn, factor_)) {}

    // Returns true and writes out on every factor-th call.
    bool push(float in, float& out) {
        float y = filter_.process(in);
        if (++counter_ < factor_) return false;
        counter_ = 0;
        out = y;
        return true;
    }

    unsigned resetCount() const { return filter_.resetCount(); }
    int factor() const { return factor_; }

private:
    int factor_;
    int counter_ {0};
    Stage filter_;
};

// Half-band 43-tap FIR followed by drop-every-other-sample.
class HalfBandDownsampler {
public:
    HalfBandDownsampler();
    bool push(float in, float& out) {
        float y = fir_.process(in);
        bool emit = outputNext_;
        outputNext_ = !outputNext_;
        if (emit) out = y;
        return emit;
    }

private:
    FirFilter<43> fir_;
    bool outputNext_ {false};
};

// Display path: three half-band stages, /8 overall
class DisplayDownsampler {
public:
    bool push(float in, float& out) {
        float a, b;
        if (!s1_.push(in, a)) return false;
        if (!s2_.push(a, b)) return false;
        return s3_.push(b, out);
    }
    static constexpr int kFactor = 8;

private:
    HalfBandDownsampler s1_, s2_, s3_;
};

} // namespace cardio
