#pragma once

#include <errno.h>

struct SessionError {
    const char* message;
    int cause;

    // Timeouts and explicit disconnects both abort an operation
    bool is_cancellation() const { return cause == -ECANCELED || cause == -ETIMEDOUT; }
};
