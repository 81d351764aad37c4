#pragma once

#include <zephyr/kernel.h>

/**
 * @brief Cooperative cancellation flag that waiters can k_poll() on.
 *
 * Once cancelled it stays cancelled until reset(). Every wait inside
 * with_abortable() races against it.
 */
class CancelToken {
public:
    CancelToken();

    void cancel(int reason = -ECANCELED);
    bool is_cancelled() const;
    void reset();

    k_poll_signal* get_signal() { return &signal; }

private:
    mutable k_poll_signal signal;
};
