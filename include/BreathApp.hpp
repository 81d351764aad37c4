#pragma once
#include <zephyr/kernel.h>

#include "Session/BreathSession.hpp"
#include "Transport/ZephyrGattTransport.hpp"

class BreathApp {
public:
    void run();

private:
    static void on_ready_state(ReadyState state, void* context);
    static void on_calibration_state(bool calibrating, void* context);
    static void on_error(const SessionError& error, void* context);

    void select_device();
    void report_breath();

    ZephyrGattTransport transport;

    struct k_work_q work_queue;
    K_KERNEL_STACK_MEMBER(work_queue_stack, CONFIG_BREATHLINK_WORKQ_STACK_SIZE);

    BreathSession session{ transport, &work_queue };

    ReadyStateListener ready_state_listener{ on_ready_state, this, {} };
    CalibrationStateListener calibration_listener{ on_calibration_state, this, {} };
    ErrorListener error_listener{ on_error, this, {} };

    uint32_t error_count = 0;

    static inline const int32_t REQUEST_RETRY_MS = 5'000;
    static inline const int32_t REPORT_PERIOD_MS = 500;
};
