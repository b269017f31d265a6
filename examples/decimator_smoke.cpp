// Decimator: output cadence, DC gain, alias rejection, display downsampler
#include <iostream>
#include <cfloat>
#include <cmath>
#include "../cpp/cardio_decimator.h"

static int failures = 0;
static void check(bool ok, const char* what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++failures;
}

template <typename AA>
static bool cadenceHolds(const char* name) {
    bool ok = true;
    for (int factor = 1; factor <= 8; ++factor) {
        cardio::Decimator<AA> d(500.0, factor);
        int outputs = 0;
        for (int k = 1; k <= 1000; ++k) {
            float y;
            if (d.push(0.1f * k, y)) ++outputs;
            if (outputs != k / factor) { ok = false; break; }
        }
    }
    std::cout << "  " << name << " cadence checked for factors 1..8\n";
    return ok;
}

template <typename AA>
static float dcOut(int factor) {
    cardio::Decimator<AA> d(500.0, factor);
    float y = 0.0f;
    for (int k = 0; k < 5000; ++k) d.push(1.5f, y);
    return y;
}

int main() {
    check(cadenceHolds<cardio::StandardAntiAlias>("standard"), "standard: floor(k/N) outputs after k inputs");
    check(cadenceHolds<cardio::LightweightAntiAlias>("lightweight"), "lightweight: floor(k/N) outputs after k inputs");

    check(std::fabs(dcOut<cardio::StandardAntiAlias>(2) - 1.5f) < 1e-3f, "standard: unity DC gain");
    check(std::fabs(dcOut<cardio::LightweightAntiAlias>(4) - 1.5f) < 1e-4f, "lightweight: unity DC gain");

    // 200 Hz at 500 Hz in, /2: would alias to 50 Hz without the anti-alias stage
    {
        cardio::Decimator<cardio::StandardAntiAlias> d(500.0, 2);
        double acc = 0.0; int n = 0;
        for (int k = 0; k < 5000; ++k) {
            float y;
            if (d.push(static_cast<float>(std::sin(2 * M_PI * 200.0 * k / 500.0)), y) && k > 2500) {
                acc += double(y) * y; ++n;
            }
        }
        double r = std::sqrt(acc / n);
        std::cout << "  alias rms=" << r << "\n";
        check(r < 0.03, "standard: 200 Hz rejected before /2");
    }

    check(cardio::Decimator<cardio::BuildAntiAlias>::kTopology ==
#ifdef CARDIO_LIGHTWEIGHT_DECIMATOR
          cardio::Topology::LIGHTWEIGHT,
#else
          cardio::Topology::STANDARD,
#endif
          "build-time topology selection");

    // A full-scale step overflows the resonant anti-alias section: it resets
    // and the decimator reports it
    {
        cardio::Decimator<cardio::StandardAntiAlias> dec(500.0, 2);
        bool finite = true;
        for (int k = 0; k < 200; ++k) {
            float y = 0.0f;
            dec.push(FLT_MAX, y);
            if (!std::isfinite(y)) finite = false;
        }
        check(finite && dec.resetCount() > 0, "anti-alias overflow resets and is counted");
    }

    // Display path: /8 with unity DC gain
    {
        cardio::DisplayDownsampler disp;
        int outputs = 0; float last = 0.0f;
        for (int k = 0; k < 800; ++k) {
            float y;
            if (disp.push(2.0f, y)) { ++outputs; last = y; }
        }
        check(outputs == 800 / cardio::DisplayDownsampler::kFactor, "display: 800 in -> 100 out");
        check(std::fabs(last - 2.0f) < 0.01f, "display: unity DC gain");
    }

    return failures == 0 ? 0 : 1;
}
