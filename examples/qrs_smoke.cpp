// QRS detection on synthetic ECG: learning phase, beat timing, refractory
#include <iostream>
#include <vector>
#include <cmath>
#include <algorithm>
#include "../cpp/cardio_pipeline.h"
#include "synthetic_ecg.h"

static int failures = 0;
static void check(bool ok, const char* what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++failures;
}

struct Run {
    std::vector<cardio::HeartbeatEvent> beats;
    cardio::RateEstimate rate;
};

template <typename P>
static Run runPipeline(P& p, const std::vector<float>& x) {
    Run r;
    for (float v : x) {
        cardio::PipelineOutput o = p.tick(cardio::RawSample{v, cardio::InputStatus::VALID});
        if (o.beatDetected) r.beats.push_back(o.beat);
        r.rate = o.rate;
    }
    return r;
}

// Every true beat after the learning phase has a detection within 50 ms
static int unmatched(const Run& r, const std::vector<double>& truth, double fs, double after) {
    int missing = 0;
    for (double t : truth) {
        if (t < after || t > truth.back() - 0.01) continue;
        bool found = false;
        for (const auto& b : r.beats)
            if (std::fabs(b.index / fs - t) < 0.05) { found = true; break; }
        if (!found) ++missing;
    }
    return missing;
}

static double maxRrError(const Run& r, double fs, double expectedMs) {
    double worst = 0.0;
    for (size_t i = 1; i < r.beats.size(); ++i) {
        double rr = (r.beats[i].index - r.beats[i - 1].index) * 1000.0 / fs;
        worst = std::max(worst, std::fabs(rr - expectedMs) / expectedMs);
    }
    return worst;
}

// Gaussian spikes 60..400 ms apart with random amplitude, plus uniform noise
static std::vector<float> makeSpikeTrain(double fs, double seconds, unsigned seed, double noise) {
    auto rnd = [&]() { seed = 1664525u * seed + 1013904223u; return ((seed >> 8) & 0xFFFFFF) / double(0xFFFFFF); };
    std::vector<float> x(static_cast<size_t>(fs * seconds), 0.0f);
    const int half = static_cast<int>(0.05 * fs);
    for (double t = 0.3; t < seconds; t += 0.06 + 0.34 * rnd()) {
        const double a = 0.3 + 1.7 * rnd();
        const long c = static_cast<long>(t * fs);
        for (int k = -half; k < half; ++k) {
            const long i = c + k;
            if (i >= 0 && i < static_cast<long>(x.size())) x[i] += static_cast<float>(a * gauss(k / fs, 0.01));
        }
    }
    for (auto& v : x) v += static_cast<float>(noise * (rnd() - 0.5));
    return x;
}

static double minRrMs(const Run& r, double fs) {
    double m = 1e9;
    for (size_t i = 1; i < r.beats.size(); ++i)
        m = std::min(m, (r.beats[i].index - r.beats[i - 1].index) * 1000.0 / fs);
    return m;
}

int main() {
    const double fs = 500.0;

    // Regular rhythms at the default configuration
    for (double bpm : {60.0, 120.0}) {
        EcgShape shape; shape.bpm = bpm;
        std::vector<double> truth;
        auto x = makeEcg(fs, 30.0, shape, &truth);
        cardio::Pipeline p;
        Run r = runPipeline(p, x);
        std::cout << "  bpm=" << bpm << " beats=" << r.beats.size() << " rate=" << r.rate.bpm << "\n";
        check(!r.beats.empty() && r.beats.front().index >= static_cast<std::uint64_t>(2.0 * fs),
              "no beat reported during the learning phase");
        check(unmatched(r, truth, fs, 2.2) == 0, "every beat after learning is detected");
        check(maxRrError(r, fs, 60000.0 / bpm) < 0.02, "R-R intervals within 2%");
        check(r.rate.available && std::fabs(r.rate.bpm - bpm) < 1.0, "heart rate matches rhythm");
        bool confident = true;
        for (const auto& b : r.beats) if (b.searchBack || b.confidence <= 0.0f || b.confidence > 1.0f) confident = false;
        check(confident, "clean rhythm: no search-back, confidence in (0,1]");
    }

    // Uniform noise: no extra beats, none missed
    {
        EcgShape shape; shape.noise = 0.05;
        std::vector<double> truth;
        auto x = makeEcg(fs, 30.0, shape, &truth);
        cardio::Pipeline p;
        Run r = runPipeline(p, x);
        check(unmatched(r, truth, fs, 2.2) == 0, "noisy: every beat detected");
        check(minRrMs(r, fs) >= 900.0, "noisy: no spurious beats");
    }

    // A second complex 120 ms after each beat is part of the same beat
    {
        EcgShape shape; shape.echoAmp = 0.8; shape.echoDelayMs = 120.0;
        std::vector<double> truth;
        auto x = makeEcg(fs, 30.0, shape, &truth);
        cardio::Pipeline p;
        Run r = runPipeline(p, x);
        check(minRrMs(r, fs) >= 900.0, "double complex: no second beat");
        check(unmatched(r, truth, fs, 2.2) == 0, "double complex: every beat detected once");
    }

    // Spike trains denser than the refractory period, and plain noise:
    // no two events closer than refractoryMs at any decimation
    {
        bool held = true, sane = true;
        double worst = 1e9;
        for (unsigned seed = 1; seed <= 3; ++seed) {
            for (int dec : {1, 2, 4}) {
                cardio::Options opt; opt.decimation = dec;
                for (int kind = 0; kind < 2; ++kind) {
                    std::vector<float> x;
                    if (kind == 0) {
                        x = makeSpikeTrain(fs, 30.0, seed, 0.2);
                    } else {
                        unsigned s = seed + 10u;
                        for (int i = 0; i < int(30 * fs); ++i) {
                            s = 1664525u * s + 1013904223u;
                            x.push_back(static_cast<float>(2.0 * (((s >> 8) & 0xFFFFFF) / double(0xFFFFFF) - 0.5)));
                        }
                    }
                    cardio::Pipeline p(opt);
                    Run r = runPipeline(p, x);
                    const double gap = minRrMs(r, fs);
                    worst = std::min(worst, gap);
                    if ((kind == 0 && r.beats.size() < 10) || gap < opt.refractoryMs) held = false;
                    const auto& d = p.detector();
                    if (!d.learning() && !(std::isfinite(d.threshold1()) && d.threshold2() > 0.0
                                           && d.threshold1() > d.threshold2()
                                           && d.signalLevel() > 0.0 && d.noiseLevel() >= 0.0)) sane = false;
                }
            }
        }
        std::cout << "  random input: smallest gap=" << worst << " ms\n";
        check(held, "random spikes and noise: refractory period holds");
        check(sane, "random spikes and noise: thresholds finite and positive");
    }

    // 500 Hz without decimation: integrator window of 75 samples
    {
        EcgShape shape; shape.bpm = 72.0;
        std::vector<double> truth;
        auto x = makeEcg(fs, 30.0, shape, &truth);
        cardio::Options opt; opt.decimation = 1;
        cardio::Pipeline p(opt);
        Run r = runPipeline(p, x);
        check(unmatched(r, truth, fs, 2.2) == 0, "500 Hz detector: every beat detected");
        check(maxRrError(r, fs, 60000.0 / 72.0) < 0.02, "500 Hz detector: R-R within 2%");
    }

    // Lightweight decimator topology
    {
        EcgShape shape; shape.bpm = 72.0;
        std::vector<double> truth;
        auto x = makeEcg(fs, 30.0, shape, &truth);
        cardio::Options opt; opt.topology = cardio::Topology::LIGHTWEIGHT; opt.decimation = 4;
        cardio::BasicPipeline<cardio::LightweightAntiAlias> p(opt);
        Run r = runPipeline(p, x);
        check(unmatched(r, truth, fs, 2.2) == 0, "lightweight /4: every beat detected");
        check(maxRrError(r, fs, 60000.0 / 72.0) < 0.02, "lightweight /4: R-R within 2%");
    }

    // 360 Hz front-end without decimation, 60 Hz mains
    {
        const double fs360 = 360.0;
        EcgShape shape; shape.bpm = 75.0; shape.mainsHz = 60.0;
        std::vector<double> truth;
        auto x = makeEcg(fs360, 30.0, shape, &truth);
        cardio::Options opt; opt.sampleRateHz = fs360; opt.decimation = 1; opt.applyMainsPreset(60.0);
        cardio::Pipeline p(opt);
        Run r = runPipeline(p, x);
        check(unmatched(r, truth, fs360, 2.2) == 0, "360 Hz: every beat detected");
        check(maxRrError(r, fs360, 800.0) < 0.02, "360 Hz: R-R within 2%");
    }

    // Flat input never produces a beat and keeps the detector learning
    {
        cardio::QrsDetector det(250.0, cardio::Options{});
        bool any = false;
        for (int i = 0; i < 250 * 20; ++i) {
            cardio::HeartbeatEvent ev;
            if (det.update(0.0f, ev)) any = true;
        }
        check(!any && det.learning(), "flat line: no beats, still learning");
    }

    return failures == 0 ? 0 : 1;
}
