// Tick budget guard: real pipeline fits its sample period, a slow one is fatal
#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <stdexcept>
#include "../cpp/cardio_pipeline.h"
#include "synthetic_ecg.h"

// Pipeline stand-in that takes longer than one 500 Hz period per tick
struct SlowPipeline {
    cardio::Options opt;
    std::uint64_t n = 0;
    const cardio::Options& options() const { return opt; }
    cardio::PipelineOutput tick(const cardio::RawSample&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        cardio::PipelineOutput o; o.index = n++; return o;
    }
};

int main() {
    int failures = 0;

    {
        cardio::Pipeline p;
        // generous budget so a loaded CI machine does not fail the run
        cardio::TickBudgetGuard<cardio::Pipeline> guard(p, 100000.0);
        auto x = makeEcg(500.0, 10.0, EcgShape{});
        bool ok = true;
        try {
            for (float v : x) guard.tick({v, cardio::InputStatus::VALID});
        } catch (const std::runtime_error& e) {
            std::cout << "unexpected: " << e.what() << "\n";
            ok = false;
        }
        std::cout << (ok ? "OK" : "FAIL") << ": pipeline within budget, worst=" << guard.worstUs() << " us\n";
        if (!ok) ++failures;

        cardio::TickBudgetGuard<cardio::Pipeline> byRate(p);
        bool period = byRate.budgetUs() == 2000.0;
        std::cout << (period ? "OK" : "FAIL") << ": default budget is one sample period\n";
        if (!period) ++failures;
    }

    {
        SlowPipeline slow;
        cardio::TickBudgetGuard<SlowPipeline> guard(slow);
        bool thrown = false;
        try {
            guard.tick({0.0f, cardio::InputStatus::VALID});
        } catch (const std::runtime_error& e) {
            thrown = std::string(e.what()).rfind("CARDIO_E201", 0) == 0;
        }
        std::cout << (thrown ? "OK" : "FAIL") << ": overrun raises CARDIO_E201\n";
        if (!thrown) ++failures;
    }

    return failures == 0 ? 0 : 1;
}
