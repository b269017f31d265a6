// End-to-end pipeline: determinism, degraded input, display path, C bridge
#include <iostream>
#include <vector>
#include <string>
#include <cmath>
#include <stdexcept>
#include "../cpp/cardio_pipeline.h"
#include "synthetic_ecg.h"

static int failures = 0;
static void check(bool ok, const char* what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++failures;
}

static bool throwsCode(const cardio::Options& opt, const char* code) {
    try {
        cardio::Pipeline p(opt);
    } catch (const std::invalid_argument& e) {
        return std::string(e.what()).rfind(code, 0) == 0;
    }
    return false;
}

int main() {
    const double fs = 500.0;
    EcgShape shape;
    std::vector<double> truth;
    auto x = makeEcg(fs, 30.0, shape, &truth);

    // Same input, same output, bit for bit
    {
        cardio::Pipeline a, b;
        bool same = true;
        for (float v : x) {
            auto oa = a.tick({v, cardio::InputStatus::VALID});
            auto ob = b.tick({v, cardio::InputStatus::VALID});
            if (oa.sample != ob.sample || oa.beatDetected != ob.beatDetected
                || oa.beat.index != ob.beat.index || oa.rate.bpm != ob.rate.bpm) same = false;
        }
        check(same, "deterministic output");
        check(a.ticks() == x.size(), "one output per input tick");
    }

    // Lead-off for 300 ticks: held output flagged degraded, recovery is immediate
    {
        cardio::Pipeline p;
        const size_t from = 5000, len = 300;
        bool flagged = true, held = true, recovered = false, finite = true;
        float last = 0.0f;
        for (size_t i = 0; i < x.size(); ++i) {
            cardio::RawSample s{x[i], cardio::InputStatus::VALID};
            if (i >= from && i < from + len) s.status = cardio::InputStatus::LEAD_OFF;
            auto o = p.tick(s);
            if (!std::isfinite(o.sample)) finite = false;
            const bool bad = (i >= from && i < from + len);
            if (bad != (o.quality == cardio::SignalQuality::DEGRADED)) flagged = false;
            if (bad && o.sample != last) held = false;
            if (i == from + len && o.quality == cardio::SignalQuality::GOOD) recovered = true;
            last = o.sample;
        }
        check(flagged, "exactly the lead-off ticks are degraded");
        check(held, "last good sample held while degraded");
        check(recovered && finite, "good quality on the first valid tick");
    }

    // Non-finite and saturated values never reach the filters
    {
        cardio::Pipeline p;
        bool ok = true;
        for (size_t i = 0; i < x.size(); ++i) {
            cardio::RawSample s{x[i], cardio::InputStatus::VALID};
            if (i % 997 == 0) s.value = NAN;
            if (i % 1499 == 0) { s.value = 1e30f; s.status = cardio::InputStatus::SATURATED; }
            auto o = p.tick(s);
            if (!std::isfinite(o.sample) || o.stageReset) ok = false;
            if (i % 997 == 0 && o.quality != cardio::SignalQuality::DEGRADED) ok = false;
        }
        check(ok, "NaN and saturated samples are held, not filtered");
        check(p.resetCount() == 0, "no filter stage had to reset");
    }

    // Alternating full-scale input overflows the baseline stage: every reset
    // is flagged on its tick and counted by the pipeline
    {
        cardio::Pipeline p;
        unsigned flagged = 0;
        bool finite = true;
        for (int i = 0; i < 1000; ++i) {
            auto o = p.tick({(i % 2) ? -3e38f : 3e38f, cardio::InputStatus::VALID});
            if (o.stageReset) ++flagged;
            if (!std::isfinite(o.sample)) finite = false;
        }
        check(finite && flagged > 0, "diverged stage is reset and flagged");
        check(p.resetCount() >= flagged && p.resetCount() >= p.chain().resetCount(),
              "pipeline reset count covers every flagged tick");
    }

    // Signal lost for 6 s: detector re-learns and beats resume
    {
        cardio::Pipeline p;
        auto y = makeEcg(fs, 40.0, shape);
        bool relearned = false, rateDropped = false;
        std::vector<double> after;
        for (size_t i = 0; i < y.size(); ++i) {
            const bool off = i >= 10 * 500 && i < 16 * 500;
            auto o = p.tick({y[i], off ? cardio::InputStatus::LEAD_OFF : cardio::InputStatus::VALID});
            if (off && p.detector().learning()) relearned = true;
            if (off && !o.rate.available) rateDropped = true;
            if (o.beatDetected && i >= 16 * 500) after.push_back(o.beat.index / fs);
        }
        check(relearned, "detector re-learns after losing the signal");
        check(rateDropped, "rate estimate times out during the gap");
        check(!after.empty() && after.front() < 19.0 && after.size() >= 20, "beats resume after the gap");
    }

    // Display waveform at fs/8
    {
        cardio::Pipeline p;
        size_t n = 0;
        for (int i = 0; i < 4000; ++i) if (p.tick({x[i], cardio::InputStatus::VALID}).hasDisplaySample) ++n;
        check(n == 4000 / cardio::DisplayDownsampler::kFactor, "display sample every 8 ticks");
        cardio::Options opt; opt.displayOutput = false;
        cardio::Pipeline q(opt);
        bool none = true;
        for (int i = 0; i < 4000; ++i) if (q.tick({x[i], cardio::InputStatus::VALID}).hasDisplaySample) none = false;
        check(none, "display path can be switched off");
    }

    // Construction rejects invalid options with a stable code
    {
        cardio::Options bad; bad.sampleRateHz = 20.0;
        check(throwsCode(bad, "CARDIO_E001"), "sample rate out of range -> E001");
        cardio::Options sb; sb.searchBackFactor = 0.9;
        check(throwsCode(sb, "CARDIO_E015"), "search-back factor out of range -> E015");
        cardio::Options topo;
        topo.topology = (cardio::kBuildTopology == cardio::Topology::STANDARD)
                      ? cardio::Topology::LIGHTWEIGHT : cardio::Topology::STANDARD;
        check(throwsCode(topo, "CARDIO_E004"), "topology not built in -> E004");
    }

    // Filter strength presets change only the baseline corner
    {
        cardio::Options o;
        o.applyFilterStrength(cardio::FilterStrength::STRONG);
        check(o.baselineHz == 1.0 && o.lowPassHz == 40.0, "strong preset");
        o.applyFilterStrength(cardio::FilterStrength::NONE);
        const char* code = nullptr;
        check(o.baselineHz == 0.05 && cardio::validateOptions(o, &code, nullptr), "none preset is valid");
    }

    // C bridge
    {
        const char* code = nullptr;
        void* h = cardio_rt_create(nullptr, &code);
        check(h != nullptr, "bridge: create with defaults");
        int beats = 0;
        cardio::PipelineOutput out;
        for (float v : x) beats += cardio_rt_tick(h, v, 0, &out);
        check(beats == 28 && out.rate.available, "bridge: beats and rate");
        check(cardio_rt_tick(h, 0.0f, 1, &out) == 0 && out.quality == cardio::SignalQuality::DEGRADED,
              "bridge: lead-off status");
        cardio_rt_destroy(h);

        cardio::Options bad; bad.decimation = 0;
        code = nullptr;
        check(cardio_rt_create(&bad, &code) == nullptr && code && std::string(code) == "CARDIO_E002",
              "bridge: invalid options -> nullptr + code");
    }

    return failures == 0 ? 0 : 1;
}
