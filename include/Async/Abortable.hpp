#pragma once

#include <zephyr/kernel.h>
#include <zephyr/sys_clock.h>

#include "Async/CancelToken.hpp"
#include "Async/Completion.hpp"

struct AbortOptions {
    k_timeout_t timeout = K_FOREVER;
    CancelToken* token = nullptr;
};

/**
 * @brief Shared deadline and cancellation token for a multi-step operation.
 *
 * Each await() races one step against both, so a composite operation stops
 * at the first step boundary after a timeout or a cancel. The step itself
 * keeps running; its late result is discarded by the Completion.
 */
class Abortable {
public:
    explicit Abortable(const AbortOptions& options)
        : deadline(sys_timepoint_calc(options.timeout)), token(options.token) {}

    bool is_cancelled() const { return token && token->is_cancelled(); }

    // 0 while the operation may continue, -ECANCELED or -ETIMEDOUT otherwise
    int check() const {
        if (is_cancelled()) {
            return -ECANCELED;
        }
        if (sys_timepoint_expired(deadline)) {
            return -ETIMEDOUT;
        }
        return 0;
    }

    template<typename T>
    int await(Completion<T>& completion, T* out = nullptr) {
        int result = 0;
        while (true) {
            if (is_cancelled()) {
                return -ECANCELED;
            }
            if (completion.try_take(result, out)) {
                return result;
            }

            k_poll_event events[2];
            int num_events = 1;
            k_poll_event_init(&events[0], K_POLL_TYPE_SIGNAL, K_POLL_MODE_NOTIFY_ONLY,
                              completion.get_signal());
            if (token) {
                k_poll_event_init(&events[1], K_POLL_TYPE_SIGNAL, K_POLL_MODE_NOTIFY_ONLY,
                                  token->get_signal());
                num_events = 2;
            }

            int err = k_poll(events, num_events, sys_timepoint_timeout(deadline));
            if (err == -EAGAIN) {
                if (completion.try_take(result, out)) {
                    return result;
                }
                return -ETIMEDOUT;
            }
            if (err && err != -EINTR) {
                return err;
            }
        }
    }

private:
    k_timepoint_t deadline;
    CancelToken* token;
};

/**
 * @brief Runs operation(Abortable&) under the given deadline and token.
 *
 * The operation is skipped with -ECANCELED when the token is already
 * cancelled.
 */
template<typename Operation>
int with_abortable(const AbortOptions& options, Operation&& operation) {
    Abortable abortable(options);
    if (abortable.is_cancelled()) {
        return -ECANCELED;
    }
    return operation(abortable);
}
