#pragma once

#include <zephyr/kernel.h>

#include "Async/CancelToken.hpp"
#include "Async/Completion.hpp"
#include "Async/Ticker.hpp"
#include "Session/Calibrator.hpp"
#include "Session/DiagnosticLog.hpp"
#include "Session/EventChannel.hpp"
#include "Session/ReadyState.hpp"
#include "Transport/GattTransport.hpp"

struct GattConnection {
    GattService service;
    GattCharacteristic characteristic;
};

/**
 * @brief Session with one breath sensor.
 *
 * Commands block the calling thread and return 0 or a negative errno.
 * Connection attempts, reconnects and breath polling run on the given
 * work queue. Listeners are called with the session locked and must not
 * issue commands.
 */
class BreathSession {
public:
    BreathSession(GattTransport& transport, k_work_q* work_queue);
    ~BreathSession();

    BreathSession(const BreathSession&) = delete;
    BreathSession& operator=(const BreathSession&) = delete;

    // Selects a sensor. Resets the calibration offset.
    int request_device();

    // Returns after the first successful connection, or -ECANCELED when
    // disconnect() is called first. Reconnects until disconnect().
    int connect();

    int disconnect();

    // Returns once enough samples were collected while Ready
    int calibrate();

    ReadyState get_ready_state() const;
    bool can_request_device() const;
    bool can_connect() const;
    bool can_disconnect() const;
    bool is_calibrating() const;

    // -ENODATA until a reading arrives in the current state
    int get_breath_value(float& value) const;

    float get_dead_zone() const;
    int set_dead_zone(float new_dead_zone);

    void add_listener(ReadyStateListener* listener);
    void add_listener(BreathListener* listener);
    void add_listener(CalibrationStateListener* listener);
    void add_listener(ErrorListener* listener);
    bool remove_listener(ReadyStateListener* listener);
    bool remove_listener(BreathListener* listener);
    bool remove_listener(CalibrationStateListener* listener);
    bool remove_listener(ErrorListener* listener);

    void set_diagnostic_sink(DiagnosticSink sink, void* context);

private:
    static int tick_handler(int64_t now, void* context);
    int tick(int64_t now);
    int run_tick(int64_t now);
    int establish_connection();
    int request_breath();

    void handle_value(const uint8_t* data, uint16_t len);
    void transition_to(ReadyState next_state);
    void abort_calibration(const char* reason, bool reset_offset);
    void report_error(const char* message, int cause);

    void lock() const { k_mutex_lock(&mutex, K_FOREVER); }
    void unlock() const { k_mutex_unlock(&mutex); }

    GattTransport& transport;
    Ticker ticker;
    mutable k_mutex mutex;

    ReadyState state{ ReadyState::NoDevice };
    PeripheralDevice device{};
    GattConnection gatt{};
    int64_t last_connect_attempt = 0;
    float dead_zone;
    float breath_value = 0.0f;
    bool has_breath_value{ false };
    bool disconnecting{ false };

    CancelToken cancel_token;
    Calibrator calibrator;
    DiagnosticLog diag;

    EventChannel<ReadyState> ready_state_events;
    EventChannel<float> breath_events;
    EventChannel<bool> calibration_state_events;
    EventChannel<const SessionError&> error_events;

    Completion<PeripheralDevice> device_completion;
    Completion<> link_completion;
    Completion<GattService> service_completion;
    Completion<GattCharacteristic> characteristic_completion;
    Completion<> subscribe_completion;
    Completion<> write_completion;
    Completion<> unlink_completion;

    // Point into the Completion on the stack of the blocked connect() and
    // calibrate() calls. Settled and cleared together under the mutex.
    Resolver<> connect_resolver;
    Resolver<> calibration_resolver;

    static inline const uint32_t TICK_INTERVAL_MS = CONFIG_BREATHLINK_TICK_INTERVAL_MS;
    static inline const int64_t CONNECT_RETRY_MS = CONFIG_BREATHLINK_CONNECT_RETRY_MS;
    static inline const uint32_t INIT_DEADLINE_MS = CONFIG_BREATHLINK_INIT_DEADLINE_MS;
    static inline const uint32_t DISCONNECT_DEADLINE_MS = CONFIG_BREATHLINK_DISCONNECT_DEADLINE_MS;
    static inline const uint32_t WRITE_DEADLINE_MS = CONFIG_BREATHLINK_WRITE_DEADLINE_MS;

    class SessionValueHandler : public GattValueHandler {
    public:
        virtual void on_value(const uint8_t* data, uint16_t len) override;
        void set_ptr(BreathSession* new_ptr) { session_ptr = new_ptr; }
    private:
        BreathSession* session_ptr{ nullptr };
    } value_handler;
};
