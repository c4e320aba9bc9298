#include "xray/internal/engine_state.h"

EngineState::EngineState() {
    eventQueue_.resize(kMaxEvents);
    eventBuffer_.reserve(kMaxEvents + 1);
    lastError = xray::XrayError::Ok;
}
