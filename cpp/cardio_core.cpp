#include "cardio_core.h"
#include <cmath>

namespace cardio {

static inline bool isFinite(double x) {
    return std::isfinite(x) != 0;
}

static bool fail(const char* code, const char* msg, const char** err_code, std::string* err_msg) {
    if (err_code) *err_code = code;
    if (err_msg) *err_msg = msg;
    return false;
}

bool validateOptions(const Options& opt, const char** err_code, std::string* err_msg) {
    const double fs = opt.sampleRateHz;
    // fs: 50..10000
    if (!isFinite(fs) || fs < 50.0 || fs > 10000.0)
        return fail("CARDIO_E001", "Invalid sample rate (50-10000 Hz)", err_code, err_msg);

    // detector rate: 100..500 Hz
    if (opt.decimation < 1 || opt.decimation > kMaxDecimation
        || fs / opt.decimation < 100.0 || fs / opt.decimation > 500.0)
        return fail("CARDIO_E002", "Invalid decimation (1-16, detector rate 100-500 Hz)", err_code, err_msg);

    const double fsd = fs / opt.decimation;
    if (!isFinite(opt.integrationMs) || opt.integrationMs < 50.0 || opt.integrationMs > kMaxIntegrationMs
        || msToSamples(opt.integrationMs, fsd) > kMaxIntegrationSamples)
        return fail("CARDIO_E003", "Invalid integration window (50-1000 ms, at most 80 samples)", err_code, err_msg);

    // conditioning: 0 < baseline < lowpass < fs/2
    if (!isFinite(opt.baselineHz) || !isFinite(opt.lowPassHz) || opt.baselineHz <= 0.0
        || opt.lowPassHz <= opt.baselineHz || opt.lowPassHz >= fs * 0.5)
        return fail("CARDIO_E011", "Invalid band (0<baseline<lowpass<fs/2)", err_code, err_msg);

    if (!isFinite(opt.mainsHz) || !isFinite(opt.notchQ) || opt.mainsHz <= 0.0
        || opt.mainsHz >= fs * 0.5 || opt.notchQ <= 0.5)
        return fail("CARDIO_E012", "Invalid notch (0<mains<fs/2, Q>0.5)", err_code, err_msg);

    // RR bounds: refractory <= minRr < maxRr
    if (!isFinite(opt.minRrMs) || !isFinite(opt.maxRrMs) || opt.minRrMs < opt.refractoryMs
        || !(opt.minRrMs < opt.maxRrMs) || opt.maxRrMs > 6000.0)
        return fail("CARDIO_E013", "Invalid RR bounds (refractory<=min<max<=6000 ms)", err_code, err_msg);

    // refractoryMs: 50..2000
    if (!isFinite(opt.refractoryMs) || opt.refractoryMs < 50.0 || opt.refractoryMs > 2000.0)
        return fail("CARDIO_E014", "Invalid refractory (50-2000 ms)", err_code, err_msg);

    if (!isFinite(opt.learningMs) || opt.learningMs < 500.0 || opt.learningMs > kMaxLearningMs
        || !isFinite(opt.searchBackFactor) || opt.searchBackFactor < 1.1 || opt.searchBackFactor > 3.0
        || !isFinite(opt.tWaveWindowMs) || opt.tWaveWindowMs < opt.refractoryMs
        || opt.tWaveWindowMs > kMaxTWaveWindowMs)
        return fail("CARDIO_E015", "Invalid detector tuning (learning 0.5-60 s, search-back 1.1-3, refractory<=T-wave<=2 s)", err_code, err_msg);

    if (opt.rrHistory < 1 || opt.rrHistory > kMaxRrHistory)
        return fail("CARDIO_E016", "Invalid RR history (1-16)", err_code, err_msg);

    if (!isFinite(opt.signalLostMs) || !isFinite(opt.rateTimeoutMs)
        || opt.signalLostMs < opt.maxRrMs || opt.signalLostMs > kMaxTimeoutMs
        || opt.rateTimeoutMs <= 0.0 || opt.rateTimeoutMs > kMaxTimeoutMs)
        return fail("CARDIO_E017", "Invalid timeouts (maxRr<=signalLost<=600 s, 0<rateTimeout<=600 s)", err_code, err_msg);

    if (!isFinite(opt.tickBudgetUs))
        return fail("CARDIO_E018", "Invalid tick budget (NaN/Inf)", err_code, err_msg);

    return true;
}

} // namespace cardio
