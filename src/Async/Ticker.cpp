#include <zephyr/logging/log.h>

#include "Async/Ticker.hpp"

LOG_MODULE_REGISTER(Ticker, CONFIG_BREATHLINK_LOG_LEVEL);

Ticker::Ticker(k_work_q* queue, TickCallback callback, void* context, uint32_t interval_ms)
    : queue(queue), callback(callback), context(context), interval_ms(interval_ms) {
    k_work_init_delayable(&work, work_handler);
}

int Ticker::start() {
    k_spinlock_key_t key = k_spin_lock(&lock);
    if (started) {
        k_spin_unlock(&lock, key);
        __ASSERT(false, "Ticker already started");
        LOG_ERR("Ticker already started");
        return -EALREADY;
    }
    started = true;
    first_run_pending = true;
    armed_generation = ++generation;
    k_work_reschedule_for_queue(queue, &work, K_NO_WAIT);
    k_spin_unlock(&lock, key);
    return 0;
}

void Ticker::stop() {
    k_spinlock_key_t key = k_spin_lock(&lock);
    generation++;
    const bool flush = first_run_pending;
    k_spin_unlock(&lock, key);

    struct k_work_sync sync;
    // the first run was already triggered by start(), let it settle
    if (flush) {
        k_work_flush_delayable(&work, &sync);
    }
    k_work_cancel_delayable_sync(&work, &sync);

    key = k_spin_lock(&lock);
    started = false;
    first_run_pending = false;
    k_spin_unlock(&lock, key);
}

void Ticker::work_handler(k_work* work_ptr) {
    auto* dwork = k_work_delayable_from_work(work_ptr);
    auto* obj = CONTAINER_OF(dwork, Ticker, work);
    obj->process();
}

void Ticker::process() {
    k_spinlock_key_t key = k_spin_lock(&lock);
    const uint32_t current = generation;
    const bool run = first_run_pending || (started && armed_generation == current);
    first_run_pending = false;
    k_spin_unlock(&lock, key);

    if (!run) {
        return;
    }

    int err = callback(k_uptime_get(), context);
    if (err) {
        LOG_WRN("Tick failed (err %d)", err);
    }

    key = k_spin_lock(&lock);
    if (started && generation == current && armed_generation == current) {
        k_work_reschedule_for_queue(queue, &work, K_MSEC(interval_ms));
    }
    k_spin_unlock(&lock, key);
}
