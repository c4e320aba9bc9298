// XrayEngine outbound event queue.

#include "xray/engine.h"
#include "xray/internal/engine_state.h"

#include <algorithm>

void XrayEngine::clearEventState() {
    state().eventHead_ = 0;
    state().eventTail_ = 0;
    state().eventCount_ = 0;
    state().eventOverflowed_ = false;
    state().eventOverflowGeneration_ = 0;
}

bool XrayEngine::pushEvent(const EngineEvent& ev) {
    EngineState& s = state();
    if (s.eventOverflowed_) return false;
    if (s.eventCount_ >= EngineState::kMaxEvents) {
        s.eventOverflowed_ = true;
        s.eventOverflowGeneration_ = s.generation;
        s.eventHead_ = 0;
        s.eventTail_ = 0;
        s.eventCount_ = 0;
        return false;
    }
    s.eventQueue_[s.eventTail_] = ev;
    s.eventTail_ = (s.eventTail_ + 1) % EngineState::kMaxEvents;
    s.eventCount_++;
    return true;
}

XrayEngine::EventBufferMeta XrayEngine::pollEvents(std::uint32_t maxEvents) {
    EngineState& s = state();
    s.eventBuffer_.clear();

    if (s.eventOverflowed_) {
        s.eventBuffer_.push_back(EngineEvent{
            static_cast<std::uint16_t>(EventType::Overflow),
            0,
            s.eventOverflowGeneration_,
            0,
        });
        return EventBufferMeta{
            s.generation,
            static_cast<std::uint32_t>(s.eventBuffer_.size()),
            reinterpret_cast<std::uintptr_t>(s.eventBuffer_.data()),
        };
    }

    if (s.eventCount_ == 0 || maxEvents == 0) {
        return EventBufferMeta{s.generation, 0, 0};
    }

    const std::size_t count = std::min<std::size_t>(maxEvents, s.eventCount_);
    for (std::size_t i = 0; i < count; ++i) {
        s.eventBuffer_.push_back(s.eventQueue_[s.eventHead_]);
        s.eventHead_ = (s.eventHead_ + 1) % EngineState::kMaxEvents;
        s.eventCount_--;
    }

    return EventBufferMeta{
        s.generation,
        static_cast<std::uint32_t>(s.eventBuffer_.size()),
        reinterpret_cast<std::uintptr_t>(s.eventBuffer_.data()),
    };
}

void XrayEngine::ackResync(std::uint32_t resyncGeneration) {
    if (!state().eventOverflowed_) return;
    if (resyncGeneration < state().eventOverflowGeneration_) return;
    clearEventState();
}
