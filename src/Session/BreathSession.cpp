#include <zephyr/logging/log.h>

#include "Session/BreathSession.hpp"
#include "Async/Abortable.hpp"
#include "SignalProcessor.hpp"
#include "Transport/DeviceProfile.hpp"

LOG_MODULE_REGISTER(BreathSession, CONFIG_BREATHLINK_LOG_LEVEL);

BreathSession::BreathSession(GattTransport& transport, k_work_q* work_queue)
    : transport(transport),
      ticker(work_queue, tick_handler, this, TICK_INTERVAL_MS),
      dead_zone(CONFIG_BREATHLINK_DEFAULT_DEAD_ZONE_PERMILLE / 1000.0f) {
    k_mutex_init(&mutex);
    value_handler.set_ptr(this);
}

BreathSession::~BreathSession() {
    cancel_token.cancel();
    ticker.stop();
}

int BreathSession::request_device() {
    lock();
    if (!can_request_device()) {
        unlock();
        LOG_WRN("request_device(): Already got a device or busy requesting one");
        return -EBUSY;
    }

    abort_calibration("Calibration aborted: request_device() has been called", true);
    transition_to(ReadyState::RequestingDevice);
    Resolver<PeripheralDevice> resolver = device_completion.prepare();
    unlock();

    const DeviceFilter filter = {
        .service = &MelodySmartProfile::SERVICE_UUID.uuid,
    };
    transport.request_device(filter, resolver);

    PeripheralDevice found{};
    int err = with_abortable(AbortOptions{}, [&](Abortable& abortable) {
        return abortable.await(device_completion, &found);
    });

    lock();
    if (err) {
        const LogField fields[] = { { .key = "err", .str = nullptr, .num = err } };
        diag.error("request_device(): Failed to request device", fields, ARRAY_SIZE(fields));
        transition_to(ReadyState::NoDevice);
        unlock();
        return err;
    }

    if (!found.connectable) {
        diag.error("request_device(): Found device is not connectable");
        transition_to(ReadyState::NoDevice);
        unlock();
        return -ENOTSUP;
    }

    device = found;
    transition_to(ReadyState::HaveDevice);

    char addr[BT_ADDR_LE_STR_LEN];
    bt_addr_le_to_str(&device.addr, addr, sizeof(addr));
    const LogField fields[] = { { .key = "device", .str = addr, .num = 0 } };
    diag.info("Have device", fields, ARRAY_SIZE(fields));
    unlock();
    return 0;
}

int BreathSession::connect() {
    lock();
    if (!can_connect()) {
        const bool no_device = state == ReadyState::NoDevice;
        unlock();
        if (no_device) {
            LOG_WRN("connect(): Must call request_device() first");
            return -ENODEV;
        }
        LOG_WRN("connect(): Invalid state");
        return -EINVAL;
    }

    // next tick attempts right away
    last_connect_attempt = k_uptime_get() - CONNECT_RETRY_MS;
    cancel_token.reset();
    Completion<> connected;
    connect_resolver = connected.prepare();
    transition_to(ReadyState::Connecting);

    int err = ticker.start();
    if (err) {
        connect_resolver = Resolver<>();
        transition_to(ReadyState::HaveDevice);
        unlock();
        return err;
    }
    unlock();

    err = with_abortable(AbortOptions{}, [&connected](Abortable& abortable) {
        return abortable.await(connected);
    });
    if (err) {
        LOG_WRN("connect() failed (err %d)", err);
    }
    return err;
}

int BreathSession::disconnect() {
    lock();
    if (!can_disconnect()) {
        unlock();
        LOG_WRN("disconnect(): Invalid state");
        return -EINVAL;
    }
    if (disconnecting) {
        unlock();
        return -EALREADY;
    }

    disconnecting = true;
    cancel_token.cancel();
    if (connect_resolver.is_valid()) {
        diag.info("disconnect() has been requested");
        connect_resolver.reject(-ECANCELED);
        connect_resolver = Resolver<>();
    }
    abort_calibration("Calibration aborted: disconnect() has been called", false);
    unlock();

    ticker.stop();

    Resolver<> resolver = unlink_completion.prepare();
    transport.disconnect(resolver);
    int err = with_abortable(AbortOptions{ .timeout = K_MSEC(DISCONNECT_DEADLINE_MS) }, [this](Abortable& abortable) {
        return abortable.await(unlink_completion);
    });
    if (err) {
        LOG_WRN("Transport disconnect failed (err %d)", err);
    }

    lock();
    gatt = GattConnection{};
    disconnecting = false;
    transition_to(ReadyState::HaveDevice);
    unlock();
    return err;
}

int BreathSession::calibrate() {
    lock();
    if (calibrator.is_calibrating()) {
        unlock();
        LOG_WRN("calibrate(): Already calibrating");
        return -EALREADY;
    }

    calibrator.start();
    Completion<> calibrated;
    calibration_resolver = calibrated.prepare();
    diag.info("Calibration started");
    calibration_state_events.emit(true);
    unlock();

    return with_abortable(AbortOptions{}, [&calibrated](Abortable& abortable) {
        return abortable.await(calibrated);
    });
}

ReadyState BreathSession::get_ready_state() const {
    lock();
    ReadyState current = state;
    unlock();
    return current;
}

bool BreathSession::can_request_device() const {
    ReadyState current = get_ready_state();
    return current == ReadyState::NoDevice || current == ReadyState::HaveDevice;
}

bool BreathSession::can_connect() const {
    return get_ready_state() == ReadyState::HaveDevice;
}

bool BreathSession::can_disconnect() const {
    ReadyState current = get_ready_state();
    return current == ReadyState::Connecting || current == ReadyState::Ready;
}

bool BreathSession::is_calibrating() const {
    lock();
    bool calibrating = calibrator.is_calibrating();
    unlock();
    return calibrating;
}

int BreathSession::get_breath_value(float& value) const {
    lock();
    if (!has_breath_value) {
        unlock();
        return -ENODATA;
    }
    value = breath_value;
    unlock();
    return 0;
}

float BreathSession::get_dead_zone() const {
    lock();
    float current = dead_zone;
    unlock();
    return current;
}

int BreathSession::set_dead_zone(float new_dead_zone) {
    if (!(new_dead_zone >= 0.0f && new_dead_zone <= 1.0f)) {
        return -EINVAL;
    }
    lock();
    dead_zone = new_dead_zone;
    unlock();
    return 0;
}

void BreathSession::add_listener(ReadyStateListener* listener) {
    lock();
    ready_state_events.add(listener);
    unlock();
}

void BreathSession::add_listener(BreathListener* listener) {
    lock();
    breath_events.add(listener);
    unlock();
}

void BreathSession::add_listener(CalibrationStateListener* listener) {
    lock();
    calibration_state_events.add(listener);
    unlock();
}

void BreathSession::add_listener(ErrorListener* listener) {
    lock();
    error_events.add(listener);
    unlock();
}

bool BreathSession::remove_listener(ReadyStateListener* listener) {
    lock();
    bool removed = ready_state_events.remove(listener);
    unlock();
    return removed;
}

bool BreathSession::remove_listener(BreathListener* listener) {
    lock();
    bool removed = breath_events.remove(listener);
    unlock();
    return removed;
}

bool BreathSession::remove_listener(CalibrationStateListener* listener) {
    lock();
    bool removed = calibration_state_events.remove(listener);
    unlock();
    return removed;
}

bool BreathSession::remove_listener(ErrorListener* listener) {
    lock();
    bool removed = error_events.remove(listener);
    unlock();
    return removed;
}

void BreathSession::set_diagnostic_sink(DiagnosticSink sink, void* context) {
    lock();
    diag.set_sink(sink, context);
    unlock();
}

int BreathSession::tick_handler(int64_t now, void* context) {
    auto* session = static_cast<BreathSession*>(context);
    return session->tick(now);
}

int BreathSession::tick(int64_t now) {
    int err = run_tick(now);
    if (err) {
        report_error("Error during tick", err);
    }
    return err;
}

int BreathSession::run_tick(int64_t now) {
    lock();
    const ReadyState current = state;

    if (current == ReadyState::NoDevice || current == ReadyState::RequestingDevice) {
        unlock();
        LOG_ERR("Tick in state %s", ready_state_to_str(current));
        return -EPERM;
    }

    if (current == ReadyState::Ready && !transport.is_connected()) {
        LOG_WRN("Link lost, reconnecting");
        transition_to(ReadyState::Connecting);
        unlock();
        return 0;
    }

    if (current == ReadyState::Connecting) {
        if (now - last_connect_attempt < CONNECT_RETRY_MS) {
            unlock();
            return 0;
        }
        last_connect_attempt = now;
        unlock();
        return establish_connection();
    }
    unlock();

    if (current == ReadyState::Ready) {
        return request_breath();
    }
    return 0;
}

int BreathSession::establish_connection() {
    lock();
    const PeripheralDevice target = device;
    diag.info("Connection attempt...");
    unlock();

    // No deadline here, the link may come up once the sensor is back in range
    int err = with_abortable(AbortOptions{ .timeout = K_FOREVER, .token = &cancel_token }, [&](Abortable& abortable) {
        transport.connect(target, link_completion.prepare());
        return abortable.await(link_completion);
    });
    if (err) {
        return err;
    }

    GattConnection connection{};
    const AbortOptions init_options = {
        .timeout = K_MSEC(INIT_DEADLINE_MS),
        .token = &cancel_token,
    };
    err = with_abortable(init_options, [&](Abortable& abortable) {
        transport.get_service(&MelodySmartProfile::SERVICE_UUID.uuid, service_completion.prepare());
        int result = abortable.await(service_completion, &connection.service);
        if (result) {
            return result;
        }

        transport.get_characteristic(connection.service, &MelodySmartProfile::DATA_UUID.uuid,
                                     characteristic_completion.prepare());
        result = abortable.await(characteristic_completion, &connection.characteristic);
        if (result) {
            return result;
        }

        transport.subscribe(connection.characteristic, &value_handler, subscribe_completion.prepare());
        return abortable.await(subscribe_completion);
    });
    if (err) {
        return err;
    }

    lock();
    if (cancel_token.is_cancelled()) {
        unlock();
        return -ECANCELED;
    }
    gatt = connection;
    diag.info("Connected");
    transition_to(ReadyState::Ready);
    if (connect_resolver.is_valid()) {
        connect_resolver.resolve();
        connect_resolver = Resolver<>();
    }
    unlock();
    return 0;
}

int BreathSession::request_breath() {
    lock();
    const GattCharacteristic characteristic = gatt.characteristic;
    unlock();

    const AbortOptions write_options = {
        .timeout = K_MSEC(WRITE_DEADLINE_MS),
        .token = &cancel_token,
    };
    return with_abortable(write_options, [&](Abortable& abortable) {
        transport.write(characteristic, MelodySmartProfile::REQUEST_BREATH_COMMAND,
                        sizeof(MelodySmartProfile::REQUEST_BREATH_COMMAND), write_completion.prepare());
        return abortable.await(write_completion);
    });
}

void BreathSession::SessionValueHandler::on_value(const uint8_t* data, uint16_t len) {
    session_ptr->handle_value(data, len);
}

void BreathSession::handle_value(const uint8_t* data, uint16_t len) {
    int32_t raw_value = 0;
    int err = SignalProcessor::parse_frame(data, len, raw_value);
    if (err) {
        report_error("Error during characteristic value change", err);
        return;
    }

    lock();
    if (state != ReadyState::Ready) {
        // late notification
        unlock();
        return;
    }

    if (calibrator.is_calibrating()) {
        if (calibrator.add_sample(raw_value)) {
            const LogField fields[] = { { .key = "mean", .str = nullptr, .num = calibrator.get_offset() } };
            diag.info("Calibration complete", fields, ARRAY_SIZE(fields));
            calibration_resolver.resolve();
            calibration_resolver = Resolver<>();
            calibration_state_events.emit(false);
        }
        unlock();
        return;
    }

    breath_value = SignalProcessor::interpret(raw_value, dead_zone, calibrator.get_offset());
    has_breath_value = true;
    breath_events.emit(breath_value);
    unlock();
}

void BreathSession::transition_to(ReadyState next_state) {
    const ReadyState old_state = state;
    if (!is_ready_state_transition_ok(old_state, next_state)) {
        __ASSERT(false, "Invalid transition of ready state from %s to %s",
                 ready_state_to_str(old_state), ready_state_to_str(next_state));
        LOG_ERR("Invalid transition of ready state from %s to %s",
                ready_state_to_str(old_state), ready_state_to_str(next_state));
        return;
    }

    state = next_state;
    has_breath_value = false;

    const LogField fields[] = {
        { .key = "old", .str = ready_state_to_str(old_state), .num = 0 },
        { .key = "new", .str = ready_state_to_str(next_state), .num = 0 },
    };
    diag.info("Ready state has changed", fields, ARRAY_SIZE(fields));
    ready_state_events.emit(next_state);
}

void BreathSession::abort_calibration(const char* reason, bool reset_offset) {
    if (!calibrator.abort(reset_offset)) {
        return;
    }

    diag.info(reason);
    calibration_resolver.reject(-ECANCELED);
    calibration_resolver = Resolver<>();
    calibration_state_events.emit(false);
}

void BreathSession::report_error(const char* message, int cause) {
    const LogField fields[] = { { .key = "err", .str = nullptr, .num = cause } };
    diag.error(message, fields, ARRAY_SIZE(fields));

    const SessionError error = {
        .message = message,
        .cause = cause,
    };
    lock();
    error_events.emit(error);
    unlock();
}
