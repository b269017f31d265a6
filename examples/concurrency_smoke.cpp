// Concurrency smoke: sampling thread ticks the pipeline and hands outputs to a
// slower consumer through the drop-oldest queue
#include <iostream>
#include <thread>
#include <atomic>
#include <vector>
#include <chrono>
#include "../cpp/cardio_pipeline.h"
#include "../cpp/cardio_queue.h"
#include "synthetic_ecg.h"

int main() {
    const double fs = 500.0;
    auto x = makeEcg(fs, 20.0, EcgShape{});

    cardio::Pipeline p;
    cardio::DropOldestQueue<cardio::PipelineOutput, 64> displayQ;
    cardio::DropOldestQueue<cardio::HeartbeatEvent, 8> beatQ;

    std::atomic<bool> done{false};
    std::uint64_t pushed = 0, beatsPushed = 0;
    std::thread producer([&]{
        for (size_t i = 0; i < x.size(); ++i) {
            auto o = p.tick({x[i], cardio::InputStatus::VALID});
            if (o.hasDisplaySample) { displayQ.push(o); ++pushed; }
            if (o.beatDetected) { beatQ.push(o.beat); ++beatsPushed; }
            // 1000 samples in one 20 ms burst, like a DMA half-buffer
            if (i % 1000 == 999) std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        done = true;
    });

    std::uint64_t received = 0, beats = 0, lastIndex = 0;
    bool ordered = true;
    for (;;) {
        const bool finished = done.load();
        cardio::PipelineOutput o;
        while (displayQ.pop(o)) {
            if (received > 0 && o.index <= lastIndex) ordered = false;
            lastIndex = o.index;
            ++received;
        }
        cardio::HeartbeatEvent ev;
        while (beatQ.pop(ev)) ++beats;
        if (finished) break;
        // slow consumer
        std::this_thread::sleep_for(std::chrono::milliseconds(35));
    }
    producer.join();

    bool ok = (received + displayQ.dropped() == pushed) && ordered
           && beats + beatQ.dropped() == beatsPushed && beats > 0;
    std::cout << (ok ? "OK" : "FAIL") << ": display pushed=" << pushed << " received=" << received
              << " dropped=" << displayQ.dropped() << " beats=" << beats << "\n";
    return ok ? 0 : 1;
}
