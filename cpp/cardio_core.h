#pragma once

#include <climits>
#include <cstdint>
#include <string>

namespace cardio {

// Which anti-alias stage the decimator wraps (chosen at build time)
enum class Topology { STANDARD, LIGHTWEIGHT };

#ifdef CARDIO_LIGHTWEIGHT_DECIMATOR
constexpr Topology kBuildTopology = Topology::LIGHTWEIGHT;
#else
constexpr Topology kBuildTopology = Topology::STANDARD;
#endif

// Display high-pass presets, same three steps as the device settings menu
enum class FilterStrength { NONE, WEAK, STRONG };

// Pipeline configuration. Fixed for the lifetime of a pipeline instance.
struct Options {
    // Sampling
    double sampleRateHz = 500.0;
    int decimation = 2;          // detector runs at sampleRateHz / decimation
    Topology topology = kBuildTopology;

    // Conditioning chain
    double baselineHz = 0.5;     // baseline wander high-pass corner
    double mainsHz = 50.0;       // power-line notch centre (50 or 60)
    double notchQ = 30.0;        // notch quality factor (narrow band)
    double lowPassHz = 40.0;     // smoothing low-pass corner
    bool displayOutput = true;   // emit the /8 display waveform

    // QRS detection
    double refractoryMs = 200.0;     // minimum distance between accepted beats
    double tWaveWindowMs = 360.0;    // window for the T-wave slope check
    double integrationMs = 150.0;    // moving-window integrator width
    double learningMs = 2000.0;      // cold-start statistics window
    double searchBackFactor = 1.5;   // x mean RR before search-back
    double signalLostMs = 3000.0;    // re-learn after this long without beats

    // Heart-rate estimation
    int rrHistory = 8;           // R-R ring buffer length (<= kMaxRrHistory)
    double minRrMs = 300.0;      // shorter intervals are rejected (200 bpm)
    double maxRrMs = 2000.0;     // longer intervals are rejected (30 bpm)
    double rateTimeoutMs = 4000.0; // estimate becomes unavailable after this

    // Timing budget per tick; <= 0 means one sample period
    double tickBudgetUs = 0.0;

    void applyFilterStrength(FilterStrength s) {
        switch (s) {
            case FilterStrength::NONE:   baselineHz = 0.05; break;
            case FilterStrength::WEAK:   baselineHz = 0.5;  break;
            case FilterStrength::STRONG: baselineHz = 1.0;  break;
        }
    }
    void applyMainsPreset(double hz) { mainsHz = (hz >= 55.0) ? 60.0 : 50.0; }
};

constexpr int kMaxRrHistory = 16;
constexpr int kMaxIntegrationSamples = 80;
constexpr int kMaxDecimation = 16;
constexpr int kSearchBackCapacity = 32;
// Upper bounds for the millisecond settings, checked before any sample conversion
constexpr double kMaxIntegrationMs = 1000.0;
constexpr double kMaxLearningMs = 60000.0;
constexpr double kMaxTWaveWindowMs = 2000.0;
constexpr double kMaxTimeoutMs = 600000.0;

// Front-end validity reported with every sample
enum class InputStatus : std::uint8_t { VALID, LEAD_OFF, SATURATED };

struct RawSample {
    float value = 0.0f;
    InputStatus status = InputStatus::VALID;
};

enum class SignalQuality : std::uint8_t { GOOD, DEGRADED };

struct HeartbeatEvent {
    std::uint64_t index = 0;   // tick index (input rate) of the R-peak
    float amplitude = 0.0f;    // integrator peak value
    float confidence = 0.0f;   // 0..1, amplitude relative to signal level
    bool searchBack = false;   // recovered retroactively
};

struct RateEstimate {
    bool available = false;
    double bpm = 0.0;
    double rrMs = 0.0;         // median interval the bpm was derived from
    int intervals = 0;         // intervals currently held
};

struct PipelineOutput {
    std::uint64_t index = 0;   // tick index of this sample
    float sample = 0.0f;       // conditioned sample
    SignalQuality quality = SignalQuality::GOOD;
    bool beatDetected = false;
    HeartbeatEvent beat;
    RateEstimate rate;
    bool rrRejected = false;   // beat produced an implausible interval
    bool stageReset = false;   // a filter stage recovered from non-finite state
    bool hasDisplaySample = false;
    float displaySample = 0.0f;
};

// Validates options. On failure fills err_code (e.g. "CARDIO_E001") and
// err_msg and returns false. The topology is checked by the pipeline, which
// knows which decimator it was built with.
bool validateOptions(const Options& opt, const char** err_code, std::string* err_msg);

// Rounded sample count, at least 1. Out-of-range and NaN durations saturate.
inline int msToSamples(double ms, double fs) {
    const double n = ms * 0.001 * fs + 0.5;
    if (!(n >= 1.0)) return 1;
    if (n >= static_cast<double>(INT_MAX)) return INT_MAX;
    return static_cast<int>(n);
}

} // namespace cardio
