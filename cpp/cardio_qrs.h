// Pan-Tompkins style QRS detector over the decimated, conditioned signal
#pragma once

#include <cstdint>
#include "cardio_core.h"
#include "cardio_filters.h"
#include "cardio_ring.h"

namespace cardio {

class QrsDetector {
public:
    // fs is the rate of the samples passed to update() (after decimation)
    QrsDetector(double fs, const Options& opt);

    // Feeds one sample. Returns true and fills beat when a beat is accepted;
    // beat.index is in detector samples and may lie in the past (search-back).
    bool update(float x, HeartbeatEvent& beat);

    bool learning() const { return learning_; }
    double signalLevel() const { return spk_; }
    double noiseLevel() const { return npk_; }
    double threshold1() const { return t1_; }
    double threshold2() const { return t2_; }
    double meanRrSamples() const;  // 0 when no interval is known yet

private:
    struct Peak {
        std::uint64_t index {0};  // R-peak location in the filtered signal
        float amplitude {0.0f};   // integrator peak
        float slope {0.0f};       // largest |derivative| while it rose
    };

    bool trackPeak(float m, float slope, std::uint64_t n, Peak& out);
    std::uint64_t locateRPeak(std::uint64_t mwiIndex) const;
    bool classify(const Peak& pk, HeartbeatEvent& beat);
    bool searchBack(std::uint64_t n, HeartbeatEvent& beat);
    void accept(const Peak& pk, bool retro, HeartbeatEvent& beat);
    bool looksLikeTWave(const Peak& pk) const;
    void finishLearning(std::uint64_t n);
    void startLearning(std::uint64_t n);
    void updateThresholds();

    // configuration (in detector samples)
    double fs_;
    int refractory_;
    int tWave_;
    int peakHold_;
    int learnSamples_;
    int lostSamples_;
    int rrUsed_;
    int minRr_;
    int maxRr_;
    double searchBackFactor_;

    // transform
    RingBuffer<float, 5> xd_;               // derivative taps
    RingBuffer<float, 2 * kMaxIntegrationSamples> xf_;  // filtered history for R-peak location
    MovingAverage<kMaxIntegrationSamples> mwi_;
    std::uint64_t n_ {0};

    // peak tracking on the integrator output
    float prevM_ {0.0f};
    bool tracking_ {false};
    float trackMax_ {0.0f};
    std::uint64_t trackIdx_ {0};
    float trackSlope_ {0.0f};
    int sinceMax_ {0};

    // learning
    bool learning_ {true};
    std::uint64_t learnEnd_ {0};
    float learnMax_ {0.0f};
    double learnSum_ {0.0};
    std::uint64_t learnCount_ {0};

    // adaptive levels
    double spk_ {0.0};
    double npk_ {0.0};
    double t1_ {0.0};
    double t2_ {0.0};

    // beat history
    bool haveBeat_ {false};
    std::uint64_t lastBeat_ {0};
    float lastSlope_ {0.0f};
    std::uint64_t lastEvent_ {0};           // last beat or end of learning
    RingBuffer<std::uint32_t, kMaxRrHistory> rr_;
    RingBuffer<Peak, kSearchBackCapacity> candidates_;
    bool searchBackArmed_ {false};
};

} // namespace cardio
