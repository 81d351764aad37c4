#include "Async/CancelToken.hpp"

CancelToken::CancelToken() {
    k_poll_signal_init(&signal);
}

void CancelToken::cancel(int reason) {
    k_poll_signal_raise(&signal, reason);
}

bool CancelToken::is_cancelled() const {
    unsigned int signaled = 0;
    int result = 0;
    k_poll_signal_check(&signal, &signaled, &result);
    return signaled != 0;
}

void CancelToken::reset() {
    k_poll_signal_reset(&signal);
}
