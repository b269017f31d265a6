#include "cardio_filters.h"
#include <algorithm>
#include <complex>

namespace cardio {

namespace {
constexpr double kPi = 3.141592653589793;

struct RawCoeffs { double b0, b1, b2, a0, a1, a2; };

SBiquad normalise(const RawCoeffs& c) {
    SBiquad bi;
    bi.b0 = c.b0 / c.a0;
    bi.b1 = c.b1 / c.a0;
    bi.b2 = c.b2 / c.a0;
    bi.a1 = c.a1 / c.a0;
    bi.a2 = c.a2 / c.a0;
    return bi;
}

// keep the corner strictly inside (0, fs/2)
double clampCorner(double fs, double f0) {
    return std::clamp(f0, 1e-4 * fs, 0.499 * fs);
}
} // namespace

SBiquad designLowPass(double fs, double f0, double Q) {
    const double w0 = 2.0 * kPi * clampCorner(fs, f0) / fs;
    const double alpha = std::sin(w0) / (2.0 * std::max(1e-6, Q));
    const double cosw0 = std::cos(w0);
    return normalise({(1.0 - cosw0) * 0.5, 1.0 - cosw0, (1.0 - cosw0) * 0.5,
                      1.0 + alpha, -2.0 * cosw0, 1.0 - alpha});
}

SBiquad designHighPass(double fs, double f0, double Q) {
    const double w0 = 2.0 * kPi * clampCorner(fs, f0) / fs;
    const double alpha = std::sin(w0) / (2.0 * std::max(1e-6, Q));
    const double cosw0 = std::cos(w0);
    return normalise({(1.0 + cosw0) * 0.5, -(1.0 + cosw0), (1.0 + cosw0) * 0.5,
                      1.0 + alpha, -2.0 * cosw0, 1.0 - alpha});
}

SBiquad designNotch(double fs, double f0, double Q) {
    const double w0 = 2.0 * kPi * clampCorner(fs, f0) / fs;
    const double alpha = std::sin(w0) / (2.0 * std::max(1e-6, Q));
    const double cosw0 = std::cos(w0);
    return normalise({1.0, -2.0 * cosw0, 1.0,
                      1.0 + alpha, -2.0 * cosw0, 1.0 - alpha});
}

double SBiquad::magnitudeAt(double f, double fs) const {
    const double w = 2.0 * kPi * f / fs;
    const std::complex<double> z1 = std::polar(1.0, -w);
    const std::complex<double> z2 = std::polar(1.0, -2.0 * w);
    const std::complex<double> num = b0 + b1 * z1 + b2 * z2;
    const std::complex<double> den = 1.0 + a1 * z1 + a2 * z2;
    return std::abs(num / den);
}

} // namespace cardio
