#include "cardio_decimator.h"

namespace cardio {

// Blackman-windowed half-band low-pass, cut-off at a quarter of the input
// rate, unity DC gain. Every second tap away from the centre is zero.
static const float kHalfBandTaps[43] = {
     0.0f,           0.0f,          -0.000139263539f, 0.0f,  0.000676086429f,
     0.0f,          -0.00191947617f, 0.0f,             0.00437516602f, 0.0f,
    -0.00878326009f, 0.0f,           0.0162402318f,    0.0f, -0.0286478135f,
     0.0f,           0.0504522592f,  0.0f,            -0.0976533529f,  0.0f,
     0.315400088f,   0.499998669f,   0.315400088f,     0.0f, -0.0976533529f,
     0.0f,           0.0504522592f,  0.0f,            -0.0286478135f,  0.0f,
     0.0162402318f,  0.0f,          -0.00878326009f,   0.0f,  0.00437516602f,
     0.0f,          -0.00191947617f, 0.0f,             0.000676086429f, 0.0f,
    -0.000139263539f, 0.0f,          0.0f,
};

HalfBandDownsampler::HalfBandDownsampler() : fir_(kHalfBandTaps) {}

} // namespace cardio
