#include "flush_stats.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include <cstring>

namespace decaf {

void FlushStats::subscribe_events(EventBus& bus) {
    decaf::subscribe<ChunkBufferedEvent>(bus,
        [this](const ChunkBufferedEvent& ev) {
            chunks_in_++;
            bytes_in_ += ev.bytes;
        });

    decaf::subscribe<TextFlushedEvent>(bus,
        [this](const TextFlushedEvent& ev) {
            if (std::strcmp(ev.reason, flush_reasons::PromptResponse) == 0) {
                response_flushes_++;
            } else if (std::strcmp(ev.reason, flush_reasons::OtherMessage) == 0) {
                other_flushes_++;
            } else {
                timer_flushes_++;
            }
        });
}

uint64_t FlushStats::chunks_out() const {
    return timer_flushes_.load() + response_flushes_.load() + other_flushes_.load();
}

std::string FlushStats::summary() const {
    return "coalesced " + std::to_string(chunks_in()) + " chunks (" +
           std::to_string(bytes_in()) + " bytes) into " +
           std::to_string(chunks_out()) + " (" +
           flush_reasons::Timer + " " + std::to_string(timer_flushes()) + ", " +
           flush_reasons::PromptResponse + " " + std::to_string(response_flushes()) + ", " +
           flush_reasons::OtherMessage + " " + std::to_string(other_flushes()) + ")";
}

} // namespace decaf
