// Heart-rate estimator: median, outlier rejection, timeout
#include <iostream>
#include <cmath>
#include "../cpp/cardio_rate.h"

static int failures = 0;
static void check(bool ok, const char* what) {
    std::cout << (ok ? "OK" : "FAIL") << ": " << what << "\n";
    if (!ok) ++failures;
}

static cardio::HeartbeatEvent at(std::uint64_t tick) {
    cardio::HeartbeatEvent ev; ev.index = tick; return ev;
}

int main() {
    const double fs = 500.0;
    cardio::Options opt;

    // Intervals of 1000 ms -> 60 bpm
    {
        cardio::HeartRateEstimator est(fs, opt);
        check(!est.current().available, "no estimate before the first interval");
        for (int k = 0; k <= 4; ++k) est.onBeat(at(static_cast<std::uint64_t>(k) * 500));
        check(est.current().available && std::fabs(est.current().bpm - 60.0) < 1e-9, "4 x 1000 ms -> 60 bpm");
        check(est.current().intervals == 4, "four intervals held");
    }

    // A 50 ms interval is rejected and the reference stays on the real beat
    {
        cardio::HeartRateEstimator est(fs, opt);
        for (int k = 0; k <= 4; ++k) est.onBeat(at(static_cast<std::uint64_t>(k) * 500));
        bool rejected = false;
        est.onBeat(at(2000 + 25), &rejected);
        check(rejected, "50 ms interval rejected");
        check(std::fabs(est.current().bpm - 60.0) < 1e-9, "rate unchanged by the outlier");
        est.onBeat(at(2500), &rejected);
        check(!rejected && est.current().intervals == 5, "next beat measured from the kept reference");
    }

    // Median resists a single long interval inside the bounds
    {
        cardio::HeartRateEstimator est(fs, opt);
        std::uint64_t t = 0;
        est.onBeat(at(t));
        for (int k = 0; k < 6; ++k) { t += 500; est.onBeat(at(t)); }
        t += 900;   // 1800 ms, a missed beat
        est.onBeat(at(t));
        check(std::fabs(est.current().bpm - 60.0) < 1e-9, "median ignores one long interval");
    }

    // Intervals above maxRrMs are rejected but move the reference
    {
        cardio::HeartRateEstimator est(fs, opt);
        bool rejected = false;
        est.onBeat(at(0));
        est.onBeat(at(1250), &rejected);  // 2500 ms
        check(rejected && !est.current().available, "2500 ms interval rejected");
        est.onBeat(at(1750), &rejected);
        check(!rejected && std::fabs(est.current().rrMs - 1000.0) < 1e-9, "following interval accepted");
    }

    // Bare intervals share the acceptance logic
    {
        cardio::HeartRateEstimator est(fs, opt);
        bool rejected = false;
        est.onInterval(800.0); est.onInterval(820.0); est.onInterval(780.0);
        est.onInterval(NAN, &rejected);
        check(rejected, "non-finite interval rejected");
        check(std::fabs(est.current().rrMs - 800.0) < 1e-9, "median of 780/800/820");
    }

    // History length bounds the median
    {
        cardio::Options o2 = opt; o2.rrHistory = 3;
        cardio::HeartRateEstimator est(fs, o2);
        for (double rr : {1000.0, 1000.0, 1000.0, 500.0, 500.0}) est.onInterval(rr);
        check(std::fabs(est.current().bpm - 120.0) < 1e-9 && est.current().intervals == 3,
              "only the last rrHistory intervals count");
    }

    // No beat for rateTimeoutMs: estimate unavailable, history dropped
    {
        cardio::HeartRateEstimator est(fs, opt);
        for (int k = 0; k <= 4; ++k) est.onBeat(at(static_cast<std::uint64_t>(k) * 500));
        est.update(2000 + 2000);
        check(est.current().available, "still available inside the timeout");
        est.update(2000 + 2001);
        check(!est.current().available, "unavailable after the timeout");
        est.onBeat(at(5000));
        check(!est.current().available, "first beat after a timeout only sets the reference");
        est.onBeat(at(5500));
        check(est.current().available && est.current().intervals == 1, "recovers with fresh history");
    }

    return failures == 0 ? 0 : 1;
}
