#include "Session/ReadyState.hpp"

struct ReadyStateTransition {
    ReadyState from;
    ReadyState to;
};

static constexpr const ReadyStateTransition VALID_TRANSITIONS[] = {
    { ReadyState::NoDevice,         ReadyState::RequestingDevice },
    { ReadyState::RequestingDevice, ReadyState::NoDevice },
    { ReadyState::RequestingDevice, ReadyState::HaveDevice },
    { ReadyState::HaveDevice,       ReadyState::Connecting },
    { ReadyState::HaveDevice,       ReadyState::RequestingDevice },
    { ReadyState::Connecting,       ReadyState::HaveDevice },
    { ReadyState::Connecting,       ReadyState::Ready },
    { ReadyState::Ready,            ReadyState::Connecting },
    { ReadyState::Ready,            ReadyState::HaveDevice },
};

bool is_ready_state_transition_ok(ReadyState from, ReadyState to) {
    for (const auto& transition : VALID_TRANSITIONS) {
        if (transition.from == from && transition.to == to) {
            return true;
        }
    }
    return false;
}

const char* ready_state_to_str(ReadyState state) {
    switch (state) {
    case ReadyState::NoDevice:
        return "NoDevice";
    case ReadyState::RequestingDevice:
        return "RequestingDevice";
    case ReadyState::HaveDevice:
        return "HaveDevice";
    case ReadyState::Connecting:
        return "Connecting";
    case ReadyState::Ready:
        return "Ready";
    }
    return "?";
}
