#pragma once

#include <zephyr/kernel.h>
#include <zephyr/spinlock.h>

typedef int (*TickCallback)(int64_t now, void* context);

/**
 * @brief Runs a callback on a work queue, re-arming after each run.
 *
 * The next run is scheduled interval_ms after the previous one returns, so
 * runs never overlap. A negative return from the callback is logged and
 * ticking continues.
 */
class Ticker {
public:
    Ticker(k_work_q* queue, TickCallback callback, void* context, uint32_t interval_ms);

    int start();

    // Blocks until a running callback has returned. The run triggered by
    // start() always happens, even when stop() follows right away. Must not
    // be called from the ticker's own work queue.
    void stop();

    // Stays true until stop() returns
    bool is_started() const { return started; }

private:
    static void work_handler(k_work* work_ptr);
    void process();

    k_work_q* queue;
    TickCallback callback;
    void* context;
    uint32_t interval_ms;

    k_work_delayable work;
    k_spinlock lock;
    uint32_t generation = 0;
    uint32_t armed_generation = 0;
    bool started = false;
    bool first_run_pending = false;
};
