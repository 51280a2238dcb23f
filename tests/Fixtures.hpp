#pragma once

#include "engine/CommitmentVerifier.hpp"
#include "engine/EventSink.hpp"
#include "shared/Encoding.hpp"

#include <mutex>
#include <string_view>
#include <vector>

namespace WordleChain::testing {

    // Keeps every published event for later inspection.
    class RecordingEventSink : public EventSink {
    public:
        void publish(const GameEvent& event) override {
            std::lock_guard lock(mutex);
            events.push_back(event);
        }

        std::vector<GameEvent> snapshot() const {
            std::lock_guard lock(mutex);
            return events;
        }

        std::size_t count() const {
            std::lock_guard lock(mutex);
            return events.size();
        }

    private:
        mutable std::mutex mutex;
        std::vector<GameEvent> events;
    };

    inline Word word(std::string_view text) {
        return *toWord(bytesOf(text));
    }

    inline Digest commitmentFor(std::string_view answer) {
        return CommitmentVerifier::digest(bytesOf(answer));
    }
}
