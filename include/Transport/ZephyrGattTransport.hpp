#pragma once

#include <zephyr/kernel.h>
#include <zephyr/spinlock.h>
#include <zephyr/bluetooth/bluetooth.h>
#include <zephyr/bluetooth/conn.h>
#include <zephyr/bluetooth/gatt.h>

#include "Transport/GattTransport.hpp"

/**
 * @brief GattTransport over the Zephyr Bluetooth host as a central.
 *
 * Handles one peripheral link at a time. Completions are delivered from
 * the Bluetooth host threads.
 */
class ZephyrGattTransport final : public GattTransport {
public:
    int init();

    void request_device(const DeviceFilter& filter, Resolver<PeripheralDevice> resolver) override;
    void connect(const PeripheralDevice& device, Resolver<> resolver) override;
    void disconnect(Resolver<> resolver) override;
    bool is_connected() const override { return linked; }

    void get_service(const bt_uuid* uuid, Resolver<GattService> resolver) override;
    void get_characteristic(const GattService& service, const bt_uuid* uuid,
                            Resolver<GattCharacteristic> resolver) override;
    void subscribe(const GattCharacteristic& characteristic, GattValueHandler* handler,
                   Resolver<> resolver) override;
    void write(const GattCharacteristic& characteristic, const uint8_t* data, uint16_t len,
               Resolver<> resolver) override;

private:
    static void device_found(const bt_addr_le_t* addr, int8_t rssi, uint8_t adv_type, net_buf_simple* ad);
    static bool match_service_uuid(bt_data* data, void* user_data);
    static void on_scan_timeout(k_work* work);

    static uint8_t discover_func(bt_conn* conn, const bt_gatt_attr* attr, bt_gatt_discover_params* params);
    static uint8_t notify_func(bt_conn* conn, bt_gatt_subscribe_params* params, const void* data, uint16_t length);
    static void subscribe_func(bt_conn* conn, uint8_t err, bt_gatt_subscribe_params* params);
    static void write_func(bt_conn* conn, uint8_t err, bt_gatt_write_params* params);

    void on_connected(bt_conn* conn, uint8_t err);
    void on_disconnected(bt_conn* conn, uint8_t reason);
    void finish_scan(int err, const PeripheralDevice* found);
    void fail_pending(int err);

    template<typename T>
    Resolver<T> take(Resolver<T>& slot) {
        k_spinlock_key_t key = k_spin_lock(&lock);
        Resolver<T> taken = slot;
        slot = Resolver<T>();
        k_spin_unlock(&lock, key);
        return taken;
    }

    static ZephyrGattTransport* instance;

    k_spinlock lock;

    bt_conn* current_conn{ nullptr };
    volatile bool linked{ false };

    const bt_uuid* scan_filter{ nullptr };
    bool scanning{ false };
    Resolver<PeripheralDevice> scan_resolver;
    k_work_delayable scan_timeout_work;

    Resolver<> connect_resolver;
    Resolver<> disconnect_resolver;

    bt_gatt_discover_params discover_params;
    uint16_t discover_end_handle{ 0 };
    Resolver<GattService> service_resolver;
    Resolver<GattCharacteristic> characteristic_resolver;

    bt_gatt_subscribe_params subscribe_params;
    bt_gatt_discover_params ccc_discover_params;
    GattValueHandler* value_handler{ nullptr };
    Resolver<> subscribe_resolver;

    bt_gatt_write_params write_params;
    uint8_t write_buffer[20];
    bool write_in_flight{ false };
    Resolver<> write_resolver;

    static inline const uint32_t SCAN_TIMEOUT_MS = CONFIG_BREATHLINK_SCAN_TIMEOUT_MS;

    static inline const bt_le_scan_param scan_param = BT_LE_SCAN_PARAM_INIT(
        BT_LE_SCAN_TYPE_ACTIVE,
        BT_LE_SCAN_OPT_FILTER_DUPLICATE,
        BT_GAP_SCAN_FAST_INTERVAL,
        BT_GAP_SCAN_FAST_WINDOW
    );
    static inline const bt_conn_le_create_param create_param = BT_CONN_LE_CREATE_PARAM_INIT(
        BT_CONN_LE_OPT_NONE,
        BT_GAP_SCAN_FAST_INTERVAL,
        BT_GAP_SCAN_FAST_INTERVAL
    );
    static inline const bt_le_conn_param conn_param = BT_LE_CONN_PARAM_INIT(
        BT_GAP_INIT_CONN_INT_MIN,
        BT_GAP_INIT_CONN_INT_MAX,
        0,
        400
    );
};
