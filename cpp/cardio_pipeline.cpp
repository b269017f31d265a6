#include "cardio_pipeline.h"
#include <new>

namespace cardio {

const Options& checkedOptions(const Options& opt, Topology built) {
    const char* code = nullptr;
    std::string msg;
    if (!validateOptions(opt, &code, &msg)) {
        std::string m = (code ? code : "CARDIO_E015");
        m += ": ";
        m += msg;
        throw std::invalid_argument(m);
    }
    if (opt.topology != built)
        throw std::invalid_argument("CARDIO_E004: decimator topology not built into this firmware");
    return opt;
}

template class BasicPipeline<StandardAntiAlias>;
template class BasicPipeline<LightweightAntiAlias>;

} // namespace cardio

extern "C" bool cardio_validate_options(const cardio::Options* opt,
                                         const char** err_code,
                                         std::string* err_msg) {
    if (!opt) {
        if (err_code) *err_code = "CARDIO_E015";
        if (err_msg) *err_msg = "Missing options";
        return false;
    }
    if (!cardio::validateOptions(*opt, err_code, err_msg)) return false;
    if (opt->topology != cardio::Pipeline::kTopology) {
        if (err_code) *err_code = "CARDIO_E004";
        if (err_msg) *err_msg = "Decimator topology not built into this firmware";
        return false;
    }
    return true;
}

extern "C" void* cardio_rt_create(const cardio::Options* opt, const char** err_code) {
    cardio::Options o = opt ? *opt : cardio::Options{};
    std::string msg;
    if (!cardio_validate_options(&o, err_code, &msg)) {
        CARDIO_LOGE("cardio.bridge", "create rejected: %s", msg.c_str());
        return nullptr;
    }
    // options are valid, the constructor cannot throw
    auto* p = new (std::nothrow) cardio::Pipeline(o);
    if (!p && err_code) *err_code = "CARDIO_E005"; // allocation failed
    return p;
}

extern "C" int cardio_rt_tick(void* h, float value, int status, cardio::PipelineOutput* out) {
    if (!h) return 0;
    auto* p = static_cast<cardio::Pipeline*>(h);
    cardio::RawSample s;
    s.value = value;
    s.status = (status == 0) ? cardio::InputStatus::VALID
             : (status == 2) ? cardio::InputStatus::SATURATED
                             : cardio::InputStatus::LEAD_OFF;
    cardio::PipelineOutput o = p->tick(s);
    if (out) *out = o;
    return o.beatDetected ? 1 : 0;
}

extern "C" void cardio_rt_destroy(void* h) {
    delete static_cast<cardio::Pipeline*>(h);
}
