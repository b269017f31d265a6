// Filter stages: finite output, notch rejection, DC behaviour, composition
#include <iostream>
#include <vector>
#include <cmath>
#include "../cpp/cardio_filters.h"

static int failures = 0;
static void check(bool ok, const char* what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++failures;
}

static double rms(const std::vector<float>& v, size_t from) {
    double acc = 0.0; for (size_t i = from; i < v.size(); ++i) acc += double(v[i]) * v[i];
    return std::sqrt(acc / double(v.size() - from));
}

int main() {
    const double fs = 500.0;

    // Chain output stays finite for large, step-like and noisy finite input
    {
        auto chain = cardio::makeChain(cardio::BaselineHighPass(fs, 0.5),
                                       cardio::NotchFilter(fs, 50.0, 30.0),
                                       cardio::LowPassFilter(fs, 40.0));
        unsigned s = 42u;
        auto rnd = [&](){ s = 1664525u * s + 1013904223u; return ((s>>8)&0xFFFFFF)/double(0xFFFFFF) - 0.5; };
        bool finite = true;
        for (int i = 0; i < 200000; ++i) {
            float in = static_cast<float>((i / 5000) % 2 ? 1e6 : -1e6) + static_cast<float>(1e5 * rnd());
            if (!std::isfinite(chain.process(in))) finite = false;
        }
        check(finite, "chain output finite for +-1e6 steps with noise");
        check(chain.resetCount() == 0, "stable chain never resets");
    }

    // Notch: deep at mains, transparent in the QRS band
    {
        cardio::NotchFilter notch(fs, 50.0, 30.0);
        check(notch.biquad().magnitudeAt(50.0, fs) < 0.01, "notch |H(50 Hz)| < 0.01");
        check(notch.biquad().magnitudeAt(10.0, fs) > 0.98, "notch |H(10 Hz)| > 0.98");

        std::vector<float> out;
        for (int i = 0; i < int(5 * fs); ++i)
            out.push_back(notch.process(static_cast<float>(std::sin(2 * M_PI * 50.0 * i / fs))));
        check(rms(out, size_t(4 * fs)) < 0.05 * std::sqrt(0.5), "50 Hz tone suppressed in steady state");
    }

    // High-pass removes DC (including the first-sample offset), low-pass keeps it
    {
        cardio::BaselineHighPass hp(fs, 0.5);
        cardio::LowPassFilter lp(fs, 40.0);
        float yh = 0.0f, yl = 0.0f;
        for (int i = 0; i < int(20 * fs); ++i) { yh = hp.process(2.5f); yl = lp.process(2.5f); }
        check(std::fabs(yh) < 1e-3f, "high-pass settles to 0 on DC");
        check(std::fabs(yl - 2.5f) < 1e-3f, "low-pass passes DC");
        cardio::BaselineHighPass hp2(fs, 0.5);
        check(hp2.process(100.0f) == 0.0f, "first sample offset does not ring");
    }

    // 4th order Butterworth: -3 dB at the corner, steep above
    {
        auto bw = cardio::designButterworthLowPass<2>(fs, 50.0);
        double m50 = bw.section(0).magnitudeAt(50.0, fs) * bw.section(1).magnitudeAt(50.0, fs);
        double m150 = bw.section(0).magnitudeAt(150.0, fs) * bw.section(1).magnitudeAt(150.0, fs);
        check(std::fabs(m50 - std::sqrt(0.5)) < 0.02, "butterworth -3 dB at corner");
        check(m150 < 0.02, "butterworth rejects 3x corner");
    }

    // A diverging section resets and keeps the output finite
    {
        cardio::SBiquad bad; bad.b0 = 1.0; bad.a1 = -2.5; bad.a2 = 1.5;
        bool finite = true;
        for (int i = 0; i < 2000; ++i) if (!std::isfinite(bad.process(1.0f))) finite = false;
        check(finite && bad.resets > 0, "unstable biquad resets instead of emitting Inf");
    }

    // Running median
    {
        cardio::MedianFilter<5> med;
        med.process(0.0f); med.process(1.0f); med.process(2.0f); med.process(3.0f);
        bool ok = med.process(4.0f) == 2.0f && med.process(1.0f) == 2.0f
               && med.process(2.0f) == 2.0f && med.process(5.0f) == 3.0f;
        check(ok, "median of last 5");
    }

    // Moving average and comb
    {
        cardio::MovingAverage<8> ma(4);
        float y = 0.0f;
        for (int i = 0; i < 4; ++i) y = ma.process(float(i + 1));
        check(std::fabs(y - 2.5f) < 1e-6f, "moving average of 1..4");
        cardio::CombFilter<3> comb;
        comb.process(1.0f); comb.process(2.0f); comb.process(3.0f);
        check(comb.process(5.0f) == 4.0f, "comb subtracts sample N back");
    }

    // Chains nest: (A,B),C behaves exactly like A,B,C
    {
        auto flat = cardio::makeChain(cardio::BaselineHighPass(fs, 0.5),
                                      cardio::NotchFilter(fs, 50.0, 30.0),
                                      cardio::LowPassFilter(fs, 40.0));
        auto nested = cardio::makeChain(cardio::makeChain(cardio::BaselineHighPass(fs, 0.5),
                                                          cardio::NotchFilter(fs, 50.0, 30.0)),
                                        cardio::LowPassFilter(fs, 40.0));
        bool same = true;
        for (int i = 0; i < 5000; ++i) {
            float in = static_cast<float>(std::sin(0.01 * i) + 0.3 * std::sin(0.7 * i));
            if (flat.process(in) != nested.process(in)) same = false;
        }
        check(same && decltype(nested)::size() == 2, "nested chain equals flat chain");
    }

    return failures == 0 ? 0 : 1;
}
