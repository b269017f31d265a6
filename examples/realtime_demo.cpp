// Simple realtime_demo: synthesize ECG, run the pipeline tick by tick, print JSON
#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <cmath>
#include <cstdlib>
#include "../cpp/cardio_pipeline.h"
#include "synthetic_ecg.h"

struct Summary {
    int beats = 0;
    int searchBack = 0;
    int rrRejected = 0;
    int degradedTicks = 0;
    int displaySamples = 0;
    unsigned stageResets = 0;
    cardio::RateEstimate rate;
};

static std::string to_json(const Summary& s, const cardio::Options& o) {
    std::ostringstream os;
    os << "{";
    os << "\"fs\":" << o.sampleRateHz << ",\"decimation\":" << o.decimation << ",";
    os << "\"topology\":\"" << (o.topology == cardio::Topology::STANDARD ? "standard" : "lightweight") << "\",";
    os << "\"bpm\":" << (s.rate.available ? s.rate.bpm : 0.0) << ",";
    os << "\"rrMs\":" << s.rate.rrMs << ",";
    os << "\"beats\":" << s.beats << ",\"searchBack\":" << s.searchBack << ",";
    os << "\"rrRejected\":" << s.rrRejected << ",";
    os << "\"quality\":{\"degradedTicks\":" << s.degradedTicks
       << ",\"stageResets\":" << s.stageResets << "},";
    os << "\"displaySamples\":" << s.displaySamples;
    os << "}";
    return os.str();
}

int main(int argc, char** argv) {
    // defaults
    double fs = 500.0;
    double seconds = 60.0;
    double bpm = 72.0;
    double noise = 0.02;
    std::string strength; // "none" | "weak" | "strong" | ""
    cardio::Options opt;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--fs" || a == "-f") && i + 1 < argc) { fs = std::atof(argv[++i]); }
        else if ((a == "--seconds" || a == "-s") && i + 1 < argc) { seconds = std::atof(argv[++i]); }
        else if (a == "--bpm" && i + 1 < argc) { bpm = std::atof(argv[++i]); }
        else if (a == "--noise" && i + 1 < argc) { noise = std::atof(argv[++i]); }
        else if (a == "--decimation" && i + 1 < argc) { opt.decimation = std::atoi(argv[++i]); }
        else if (a == "--mains" && i + 1 < argc) { opt.applyMainsPreset(std::atof(argv[++i])); }
        else if (a == "--filter" && i + 1 < argc) { strength = argv[++i]; }
        else if (a == "--verbose") { cardio::setLogLevel(cardio::LogLevel::DEBUG); }
    }
    opt.sampleRateHz = fs;
    if (strength == "none") opt.applyFilterStrength(cardio::FilterStrength::NONE);
    else if (strength == "strong") opt.applyFilterStrength(cardio::FilterStrength::STRONG);
    else if (strength == "weak") opt.applyFilterStrength(cardio::FilterStrength::WEAK);

    const char* code = nullptr;
    std::string msg;
    if (!cardio_validate_options(&opt, &code, &msg)) {
        std::cout << "{\"error\":\"" << (code ? code : "") << "\",\"message\":\"" << msg << "\"}" << std::endl;
        return 2;
    }

    EcgShape shape; shape.bpm = bpm; shape.noise = noise; shape.mainsHz = opt.mainsHz;
    auto x = makeEcg(fs, seconds, shape);

    cardio::Pipeline p(opt);
    Summary s;
    for (float v : x) {
        auto o = p.tick({v, cardio::InputStatus::VALID});
        if (o.beatDetected) { ++s.beats; if (o.beat.searchBack) ++s.searchBack; }
        if (o.rrRejected) ++s.rrRejected;
        if (o.quality == cardio::SignalQuality::DEGRADED) ++s.degradedTicks;
        if (o.hasDisplaySample) ++s.displaySamples;
        s.rate = o.rate;
    }
    s.stageResets = p.resetCount();
    std::cout << to_json(s, opt) << std::endl;
    return 0;
}
