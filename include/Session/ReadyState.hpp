#pragma once

#include <zephyr/types.h>

enum class ReadyState : uint8_t {
    NoDevice,
    RequestingDevice,
    HaveDevice,
    Connecting,
    Ready,
};

bool is_ready_state_transition_ok(ReadyState from, ReadyState to);
const char* ready_state_to_str(ReadyState state);
