// Synthetic single-lead ECG for the smoke tests and demos
#pragma once

#include <cmath>
#include <vector>

struct EcgShape {
    double bpm = 60.0;
    double firstBeatSec = 0.5;
    double qrsAmp = 1.0;        // mV
    double qrsSigmaMs = 12.0;
    double tAmp = 0.25;
    double tDelayMs = 250.0;    // T-wave peak after the R-peak
    double tSigmaMs = 40.0;
    double baseline = 0.5;      // electrode offset
    double wanderAmp = 0.1;     // respiration baseline wander at 0.2 Hz
    double mainsAmp = 0.02;
    double mainsHz = 50.0;
    double noise = 0.0;         // uniform noise amplitude
    double echoAmp = 0.0;       // second complex after each beat (0 = none)
    double echoDelayMs = 120.0;
};

static inline double gauss(double t, double sigma) {
    return std::exp(-0.5 * (t * t) / (sigma * sigma));
}

// Generates fs*seconds samples. beatTimes receives the R-peak times (s).
// Beat number `attenuated` (0-based, -1 = none) is scaled by `attenuation`.
static std::vector<float> makeEcg(double fs, double seconds, const EcgShape& s,
                                  std::vector<double>* beatTimes = nullptr,
                                  int attenuated = -1, double attenuation = 1.0) {
    const size_t n = static_cast<size_t>(fs * seconds);
    const double period = 60.0 / s.bpm;
    std::vector<double> beats;
    for (double t = s.firstBeatSec; t < seconds; t += period) beats.push_back(t);
    if (beatTimes) *beatTimes = beats;

    unsigned seed = 1234567u;
    auto rnd = [&]() { seed = 1664525u * seed + 1013904223u; return ((seed >> 8) & 0xFFFFFF) / double(0xFFFFFF) - 0.5; };

    const double qs = s.qrsSigmaMs * 1e-3, ts = s.tSigmaMs * 1e-3, td = s.tDelayMs * 1e-3;
    std::vector<float> x; x.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const double t = i / fs;
        double v = s.baseline + s.wanderAmp * std::sin(2 * M_PI * 0.2 * t)
                 + s.mainsAmp * std::sin(2 * M_PI * s.mainsHz * t)
                 + 2.0 * s.noise * rnd();
        for (size_t k = 0; k < beats.size(); ++k) {
            const double dt = t - beats[k];
            if (dt < -0.2 || dt > 0.6) continue;
            const double a = (static_cast<int>(k) == attenuated) ? attenuation : 1.0;
            v += a * s.qrsAmp * gauss(dt, qs);
            v += s.tAmp * gauss(dt - td, ts);
            if (s.echoAmp != 0.0) v += s.echoAmp * s.qrsAmp * gauss(dt - s.echoDelayMs * 1e-3, qs);
        }
        x.push_back(static_cast<float>(v));
    }
    return x;
}
