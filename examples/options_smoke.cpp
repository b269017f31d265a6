// Option validation: every rejected configuration maps to its error code
#include <iostream>
#include <string>
#include <climits>
#include <cmath>
#include <functional>
#include <vector>
#include "../cpp/cardio_core.h"

int main() {
    struct Case { const char* code; std::function<void(cardio::Options&)> edit; };
    const std::vector<Case> cases = {
        {"CARDIO_E001", [](cardio::Options& o){ o.sampleRateHz = 20.0; }},
        {"CARDIO_E001", [](cardio::Options& o){ o.sampleRateHz = NAN; }},
        {"CARDIO_E002", [](cardio::Options& o){ o.decimation = 0; }},
        {"CARDIO_E002", [](cardio::Options& o){ o.decimation = 8; }},              // 62.5 Hz detector
        {"CARDIO_E002", [](cardio::Options& o){ o.sampleRateHz = 2000.0; o.decimation = 2; }},
        {"CARDIO_E003", [](cardio::Options& o){ o.integrationMs = 400.0; }},     // 100 samples at 250 Hz
        {"CARDIO_E003", [](cardio::Options& o){ o.integrationMs = 1e30; }},
        {"CARDIO_E011", [](cardio::Options& o){ o.lowPassHz = 0.3; }},
        {"CARDIO_E011", [](cardio::Options& o){ o.lowPassHz = 260.0; }},
        {"CARDIO_E012", [](cardio::Options& o){ o.notchQ = 0.2; }},
        {"CARDIO_E012", [](cardio::Options& o){ o.mainsHz = 300.0; }},
        {"CARDIO_E013", [](cardio::Options& o){ o.minRrMs = 150.0; }},
        {"CARDIO_E013", [](cardio::Options& o){ o.maxRrMs = 250.0; }},
        {"CARDIO_E014", [](cardio::Options& o){ o.refractoryMs = 20.0; o.minRrMs = 200.0; }},
        {"CARDIO_E015", [](cardio::Options& o){ o.learningMs = 100.0; }},
        {"CARDIO_E015", [](cardio::Options& o){ o.tWaveWindowMs = 100.0; }},
        {"CARDIO_E015", [](cardio::Options& o){ o.learningMs = 1e13; }},
        {"CARDIO_E015", [](cardio::Options& o){ o.tWaveWindowMs = 1e9; }},
        {"CARDIO_E016", [](cardio::Options& o){ o.rrHistory = 17; }},
        {"CARDIO_E017", [](cardio::Options& o){ o.signalLostMs = 1000.0; }},
        {"CARDIO_E017", [](cardio::Options& o){ o.rateTimeoutMs = 0.0; }},
        {"CARDIO_E017", [](cardio::Options& o){ o.signalLostMs = 1e12; }},
        {"CARDIO_E017", [](cardio::Options& o){ o.rateTimeoutMs = 1e12; }},
        {"CARDIO_E018", [](cardio::Options& o){ o.tickBudgetUs = INFINITY; }},
    };

    int failures = 0;
    {
        const char* code = nullptr; std::string msg;
        bool ok = cardio::validateOptions(cardio::Options{}, &code, &msg);
        std::cout << (ok ? "OK" : "FAIL") << ": defaults are valid\n";
        if (!ok) ++failures;
    }
    for (const auto& c : cases) {
        cardio::Options o;
        c.edit(o);
        const char* code = nullptr; std::string msg;
        bool rejected = !cardio::validateOptions(o, &code, &msg);
        bool ok = rejected && code && std::string(code) == c.code && !msg.empty();
        std::cout << (ok ? "OK" : "FAIL") << ": " << c.code << " (" << (code ? code : "accepted")
                  << ", " << msg << ")\n";
        if (!ok) ++failures;
    }

    // Boundary configurations that must stay valid
    {
        cardio::Options a; a.decimation = 1;                  // 500 Hz detector, 75-sample window
        cardio::Options b; b.integrationMs = 320.0;           // exactly 80 samples at 250 Hz
        cardio::Options c; c.signalLostMs = 600000.0; c.rateTimeoutMs = 600000.0;
        for (const auto* opt : {&a, &b, &c}) {
            const char* code = nullptr; std::string msg;
            bool ok = cardio::validateOptions(*opt, &code, &msg);
            std::cout << (ok ? "OK" : "FAIL") << ": boundary accepted (" << (code ? code : "valid") << ")\n";
            if (!ok) ++failures;
        }
    }

    // Sample counts saturate instead of overflowing
    {
        bool ok = cardio::msToSamples(1e30, 500.0) == INT_MAX
               && cardio::msToSamples(NAN, 500.0) == 1
               && cardio::msToSamples(-5.0, 500.0) == 1
               && cardio::msToSamples(150.0, 250.0) == 38;
        std::cout << (ok ? "OK" : "FAIL") << ": millisecond conversion saturates\n";
        if (!ok) ++failures;
    }

    // Mains presets snap to 50/60 Hz
    cardio::Options o;
    o.applyMainsPreset(59.9);
    bool ok = o.mainsHz == 60.0;
    o.applyMainsPreset(50.2);
    ok = ok && o.mainsHz == 50.0;
    std::cout << (ok ? "OK" : "FAIL") << ": mains presets\n";
    if (!ok) ++failures;

    return failures == 0 ? 0 : 1;
}
