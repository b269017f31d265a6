// Tick latency bench: average and worst per-sample cost of the pipeline
#include <iostream>
#include <vector>
#include <chrono>
#include <algorithm>
#include "../cpp/cardio_pipeline.h"
#include "synthetic_ecg.h"

int main() {
    const double fs = 500.0;
    auto x = makeEcg(fs, 60.0, EcgShape{});

    cardio::Pipeline p;
    double worst = 0.0;
    auto t0 = std::chrono::steady_clock::now();
    for (float v : x) {
        auto a = std::chrono::steady_clock::now();
        (void)p.tick({v, cardio::InputStatus::VALID});
        auto b = std::chrono::steady_clock::now();
        worst = std::max(worst, std::chrono::duration<double, std::micro>(b - a).count());
    }
    auto t1 = std::chrono::steady_clock::now();
    double us = std::chrono::duration<double, std::micro>(t1 - t0).count() / x.size();
    std::cout << "tick_latency_us_avg=" << us << "\n";
    std::cout << "tick_latency_us_worst=" << worst << "\n";
    std::cout << "sample_period_us=" << 1e6 / fs << "\n";
    return 0;
}
