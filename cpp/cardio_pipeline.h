// Per-sample ECG pipeline: conditioning chain -> decimator -> QRS detector
// -> heart-rate estimator. One instance per recording session.
#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include "cardio_core.h"
#include "cardio_decimator.h"
#include "cardio_filters.h"
#include "cardio_log.h"
#include "cardio_qrs.h"
#include "cardio_rate.h"

namespace cardio {

// Throws std::invalid_argument("CARDIO_Exxx: ...") on invalid options
const Options& checkedOptions(const Options& opt, Topology built);

template <typename AntiAlias>
class BasicPipeline {
public:
    // baseline wander -> mains notch -> smoothing, in that order
    using Chain = StageChain<BaselineHighPass, NotchFilter, LowPassFilter>;
    static constexpr Topology kTopology = AntiAlias::kTopology;

    explicit BasicPipeline(const Options& opt = {})
        : opt_(checkedOptions(opt, kTopology)),
          chain_(BaselineHighPass(opt_.sampleRateHz, opt_.baselineHz),
                 NotchFilter(opt_.sampleRateHz, opt_.mainsHz, opt_.notchQ),
                 LowPassFilter(opt_.sampleRateHz, opt_.lowPassHz)),
          decim_(opt_.sampleRateHz, opt_.decimation),
          qrs_(opt_.sampleRateHz / opt_.decimation, opt_),
          rate_(opt_.sampleRateHz, opt_) {}

    PipelineOutput tick(const RawSample& in) {
        PipelineOutput out;
        out.index = n_++;

        // invalid input never reaches the filters: hold the last good output
        if (in.status == InputStatus::VALID && std::isfinite(in.value)) {
            lastGood_ = chain_.process(in.value);
        } else {
            out.quality = SignalQuality::DEGRADED;
        }
        out.sample = lastGood_;

        if (opt_.displayOutput)
            out.hasDisplaySample = display_.push(out.sample, out.displaySample);

        float d = 0.0f;
        if (decim_.push(out.sample, d)) {
            HeartbeatEvent ev;
            if (qrs_.update(d, ev)) {
                // detector sample j covers input ticks up to (j + 1) * D - 1
                ev.index = (ev.index + 1) * static_cast<std::uint64_t>(decim_.factor()) - 1;
                rate_.onBeat(ev, &out.rrRejected);
                out.beatDetected = true;
                out.beat = ev;
            }
        }

        const unsigned resets = resetCount();
        if (resets != resetsSeen_) {
            resetsSeen_ = resets;
            out.stageReset = true;
            CARDIO_LOGW("cardio.pipeline", "filter state diverged at tick %llu, stage reset",
                        static_cast<unsigned long long>(out.index));
        }

        rate_.update(out.index);
        out.rate = rate_.current();
        return out;
    }

    const Options& options() const { return opt_; }
    const QrsDetector& detector() const { return qrs_; }
    const HeartRateEstimator& estimator() const { return rate_; }
    const Chain& chain() const { return chain_; }
    // recoveries from non-finite state across the chain and the decimator
    unsigned resetCount() const { return chain_.resetCount() + decim_.resetCount(); }
    std::uint64_t ticks() const { return n_; }

private:
    Options opt_;
    Chain chain_;
    Decimator<AntiAlias> decim_;
    QrsDetector qrs_;
    HeartRateEstimator rate_;
    DisplayDownsampler display_;
    std::uint64_t n_ {0};
    float lastGood_ {0.0f};
    unsigned resetsSeen_ {0};
};

extern template class BasicPipeline<StandardAntiAlias>;
extern template class BasicPipeline<LightweightAntiAlias>;

using Pipeline = BasicPipeline<BuildAntiAlias>;

// Wraps a pipeline and treats a tick slower than the budget as fatal.
template <typename P>
class TickBudgetGuard {
public:
    TickBudgetGuard(P& p, double budgetUs) : p_(p), budgetUs_(budgetUs) {}
    explicit TickBudgetGuard(P& p)
        : p_(p),
          budgetUs_(p.options().tickBudgetUs > 0.0 ? p.options().tickBudgetUs
                                                   : 1e6 / p.options().sampleRateHz) {}

    PipelineOutput tick(const RawSample& s) {
        const auto t0 = std::chrono::steady_clock::now();
        PipelineOutput out = p_.tick(s);
        const auto t1 = std::chrono::steady_clock::now();
        const double us = std::chrono::duration<double, std::micro>(t1 - t0).count();
        if (us > worstUs_) worstUs_ = us;
        if (us > budgetUs_) {
            CARDIO_LOGE("cardio.pipeline", "tick %llu took %.1f us (budget %.1f us)",
                        static_cast<unsigned long long>(out.index), us, budgetUs_);
            throw std::runtime_error("CARDIO_E201: tick overrun, compute budget too small for "
                                     "sample rate / filter topology");
        }
        return out;
    }

    double budgetUs() const { return budgetUs_; }
    double worstUs() const { return worstUs_; }

private:
    P& p_;
    double budgetUs_;
    double worstUs_ {0.0};
};

} // namespace cardio

// Plain C bridge for scheduler code (symbols have C linkage; still compiled as C++)
extern "C" {
    // Returns nullptr and fills err_code when options are invalid
    void* cardio_rt_create(const cardio::Options* opt, const char** err_code);
    // status: 0 valid, 2 saturated, anything else lead-off. Returns 1 when a beat was detected.
    int   cardio_rt_tick(void* h, float value, int status, cardio::PipelineOutput* out);
    void  cardio_rt_destroy(void* h);
    bool  cardio_validate_options(const cardio::Options* opt, const char** err_code, std::string* err_msg);
}
