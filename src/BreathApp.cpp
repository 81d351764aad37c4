#include "BreathApp.hpp"
#include <zephyr/bluetooth/bluetooth.h>
#include <zephyr/logging/log.h>

LOG_MODULE_REGISTER(breath_app, CONFIG_BREATHLINK_LOG_LEVEL);

void BreathApp::run() {
    int err = 0;

    err = bt_enable(NULL);
    if (err) {
        LOG_ERR("Bluetooth init failed (err %d)", err);
        k_sleep(K_FOREVER);
    }

    err = transport.init();
    if (err) {
        LOG_ERR("Transport init failed (err %d)", err);
        k_sleep(K_FOREVER);
    }

    k_work_queue_init(&work_queue);
    k_work_queue_start(&work_queue, work_queue_stack, K_KERNEL_STACK_SIZEOF(work_queue_stack),
                       CONFIG_BREATHLINK_WORKQ_PRIORITY, NULL);

    session.add_listener(&ready_state_listener);
    session.add_listener(&calibration_listener);
    session.add_listener(&error_listener);

    select_device();

    err = session.connect();
    if (err) {
        LOG_ERR("Connect failed (err %d)", err);
        k_sleep(K_FOREVER);
    }

    err = session.calibrate();
    if (err) {
        LOG_WRN("Calibration failed (err %d), using offset 0", err);
    }

    while (true) {
        report_breath();
        k_msleep(REPORT_PERIOD_MS);
    }
}

void BreathApp::select_device() {
    while (true) {
        int err = session.request_device();
        if (err == 0) {
            return;
        }
        LOG_WRN("No sensor selected (err %d), retrying", err);
        k_msleep(REQUEST_RETRY_MS);
    }
}

void BreathApp::report_breath() {
    float value = 0.0f;
    if (session.get_breath_value(value) != 0) {
        return;
    }
    // no float formatting in the log backend
    LOG_INF("Breath %d/1000", (int)(value * 1000.0f));
}

void BreathApp::on_ready_state(ReadyState state, void* context) {
    LOG_INF("Ready state: %s", ready_state_to_str(state));
}

void BreathApp::on_calibration_state(bool calibrating, void* context) {
    LOG_INF("%s", calibrating ? "Calibrating, keep the tube at rest" : "Calibration finished");
}

void BreathApp::on_error(const SessionError& error, void* context) {
    auto* app = static_cast<BreathApp*>(context);
    app->error_count++;
    LOG_WRN("%s (err %d, %u so far)", error.message, error.cause, app->error_count);
}
