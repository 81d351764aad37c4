#include <zephyr/bluetooth/uuid.h>
#include <zephyr/bluetooth/hci.h>
#include <zephyr/logging/log.h>
#include <string.h>

#include "Transport/ZephyrGattTransport.hpp"

LOG_MODULE_REGISTER(ZephyrGattTransport, CONFIG_BREATHLINK_LOG_LEVEL);

ZephyrGattTransport* ZephyrGattTransport::instance = nullptr;

struct ScanMatch {
    const bt_uuid* filter;
    bool found;
};

int ZephyrGattTransport::init() {
    instance = this;
    k_work_init_delayable(&scan_timeout_work, on_scan_timeout);

    static struct bt_conn_cb conn_callbacks = {
        .connected = [](struct bt_conn *conn, uint8_t err) {
            if (instance) instance->on_connected(conn, err);
        },
        .disconnected = [](struct bt_conn *conn, uint8_t reason) {
            if (instance) instance->on_disconnected(conn, reason);
        },
    };

    return bt_conn_cb_register(&conn_callbacks);
}

void ZephyrGattTransport::request_device(const DeviceFilter& filter, Resolver<PeripheralDevice> resolver) {
    if (scanning) {
        resolver.reject(-EBUSY);
        return;
    }

    scan_filter = filter.service;
    scan_resolver = resolver;
    scanning = true;

    int err = bt_le_scan_start(&scan_param, device_found);
    if (err) {
        LOG_ERR("Scanning failed to start (err %d)", err);
        scanning = false;
        take(scan_resolver).reject(err);
        return;
    }

    LOG_INF("Scanning for sensor");
    k_work_reschedule(&scan_timeout_work, K_MSEC(SCAN_TIMEOUT_MS));
}

void ZephyrGattTransport::device_found(const bt_addr_le_t* addr, int8_t rssi, uint8_t adv_type, net_buf_simple* ad) {
    if (!instance || !instance->scanning) {
        return;
    }

    ScanMatch match = {
        .filter = instance->scan_filter,
        .found = false,
    };
    bt_data_parse(ad, match_service_uuid, &match);
    if (!match.found) {
        return;
    }

    char addr_str[BT_ADDR_LE_STR_LEN];
    bt_addr_le_to_str(addr, addr_str, sizeof(addr_str));
    LOG_INF("Found sensor %s (RSSI %d)", addr_str, rssi);

    PeripheralDevice device = {
        .addr = *addr,
        .connectable = adv_type == BT_GAP_ADV_TYPE_ADV_IND ||
                       adv_type == BT_GAP_ADV_TYPE_ADV_DIRECT_IND ||
                       adv_type == BT_GAP_ADV_TYPE_SCAN_RSP,
    };
    instance->finish_scan(0, &device);
}

bool ZephyrGattTransport::match_service_uuid(bt_data* data, void* user_data) {
    auto* match = static_cast<ScanMatch*>(user_data);

    if (data->type != BT_DATA_UUID128_SOME && data->type != BT_DATA_UUID128_ALL) {
        return true;
    }
    if (data->data_len % BT_UUID_SIZE_128 != 0) {
        LOG_WRN("AD malformed");
        return true;
    }

    for (uint8_t i = 0; i < data->data_len; i += BT_UUID_SIZE_128) {
        bt_uuid_128 uuid;
        if (!bt_uuid_create(&uuid.uuid, &data->data[i], BT_UUID_SIZE_128)) {
            continue;
        }
        if (bt_uuid_cmp(&uuid.uuid, match->filter) == 0) {
            match->found = true;
            return false;
        }
    }
    return true;
}

void ZephyrGattTransport::on_scan_timeout(k_work* work) {
    if (instance) {
        LOG_WRN("No sensor found");
        instance->finish_scan(-ETIMEDOUT, nullptr);
    }
}

void ZephyrGattTransport::finish_scan(int err, const PeripheralDevice* found) {
    if (!scanning) {
        return;
    }
    scanning = false;
    k_work_cancel_delayable(&scan_timeout_work);

    int stop_err = bt_le_scan_stop();
    if (stop_err) {
        LOG_WRN("Stop LE scan failed (err %d)", stop_err);
    }

    Resolver<PeripheralDevice> resolver = take(scan_resolver);
    if (err) {
        resolver.reject(err);
    } else {
        resolver.resolve(*found);
    }
}

void ZephyrGattTransport::connect(const PeripheralDevice& device, Resolver<> resolver) {
    if (current_conn && linked) {
        resolver.resolve();
        return;
    }

    connect_resolver = resolver;
    if (current_conn) {
        // an earlier attempt is still pending, it completes this one too
        return;
    }

    int err = bt_conn_le_create(&device.addr, &create_param, &conn_param, &current_conn);
    if (err) {
        LOG_ERR("Create conn failed (err %d)", err);
        current_conn = nullptr;
        take(connect_resolver).reject(err);
    }
}

void ZephyrGattTransport::disconnect(Resolver<> resolver) {
    if (!current_conn) {
        resolver.resolve();
        return;
    }

    disconnect_resolver = resolver;
    int err = bt_conn_disconnect(current_conn, BT_HCI_ERR_REMOTE_USER_TERM_CONN);
    if (err) {
        LOG_ERR("Disconnect failed (err %d)", err);
        take(disconnect_resolver).reject(err);
    }
}

void ZephyrGattTransport::on_connected(bt_conn* conn, uint8_t err) {
    if (conn != current_conn) {
        return;
    }

    if (err) {
        LOG_WRN("Connection failed (err %u)", err);
        bt_conn_unref(current_conn);
        current_conn = nullptr;
        take(connect_resolver).reject(-EIO);
        take(disconnect_resolver).resolve();
        return;
    }

    LOG_INF("Connected");
    linked = true;
    take(connect_resolver).resolve();
}

void ZephyrGattTransport::on_disconnected(bt_conn* conn, uint8_t reason) {
    if (conn != current_conn) {
        return;
    }

    LOG_INF("Disconnected (reason 0x%02x)", reason);
    linked = false;
    bt_conn_unref(current_conn);
    current_conn = nullptr;

    fail_pending(-ENOTCONN);
    take(disconnect_resolver).resolve();
}

void ZephyrGattTransport::fail_pending(int err) {
    write_in_flight = false;
    take(connect_resolver).reject(err);
    take(service_resolver).reject(err);
    take(characteristic_resolver).reject(err);
    take(subscribe_resolver).reject(err);
    take(write_resolver).reject(err);
}

void ZephyrGattTransport::get_service(const bt_uuid* uuid, Resolver<GattService> resolver) {
    if (!linked) {
        resolver.reject(-ENOTCONN);
        return;
    }

    service_resolver = resolver;
    discover_params.uuid = uuid;
    discover_params.func = discover_func;
    discover_params.start_handle = BT_ATT_FIRST_ATTRIBUTE_HANDLE;
    discover_params.end_handle = BT_ATT_LAST_ATTRIBUTE_HANDLE;
    discover_params.type = BT_GATT_DISCOVER_PRIMARY;

    int err = bt_gatt_discover(current_conn, &discover_params);
    if (err) {
        LOG_ERR("Service discovery failed (err %d)", err);
        take(service_resolver).reject(err);
    }
}

void ZephyrGattTransport::get_characteristic(const GattService& service, const bt_uuid* uuid,
                                             Resolver<GattCharacteristic> resolver) {
    if (!linked) {
        resolver.reject(-ENOTCONN);
        return;
    }

    characteristic_resolver = resolver;
    discover_end_handle = service.end_handle;
    discover_params.uuid = uuid;
    discover_params.func = discover_func;
    discover_params.start_handle = service.start_handle + 1;
    discover_params.end_handle = service.end_handle;
    discover_params.type = BT_GATT_DISCOVER_CHARACTERISTIC;

    int err = bt_gatt_discover(current_conn, &discover_params);
    if (err) {
        LOG_ERR("Characteristic discovery failed (err %d)", err);
        take(characteristic_resolver).reject(err);
    }
}

uint8_t ZephyrGattTransport::discover_func(bt_conn* conn, const bt_gatt_attr* attr, bt_gatt_discover_params* params) {
    if (!instance) {
        return BT_GATT_ITER_STOP;
    }

    if (params->type == BT_GATT_DISCOVER_PRIMARY) {
        Resolver<GattService> resolver = instance->take(instance->service_resolver);
        if (!attr) {
            resolver.reject(-ENOENT);
            return BT_GATT_ITER_STOP;
        }
        auto* service_val = static_cast<const bt_gatt_service_val*>(attr->user_data);
        const GattService service = {
            .start_handle = attr->handle,
            .end_handle = service_val->end_handle,
        };
        LOG_DBG("Service handles 0x%04x..0x%04x", service.start_handle, service.end_handle);
        resolver.resolve(service);
        return BT_GATT_ITER_STOP;
    }

    Resolver<GattCharacteristic> resolver = instance->take(instance->characteristic_resolver);
    if (!attr) {
        resolver.reject(-ENOENT);
        return BT_GATT_ITER_STOP;
    }
    auto* chrc = static_cast<const bt_gatt_chrc*>(attr->user_data);
    const GattCharacteristic characteristic = {
        .value_handle = chrc->value_handle,
        .end_handle = instance->discover_end_handle,
        .properties = chrc->properties,
    };
    LOG_DBG("Characteristic value handle 0x%04x", characteristic.value_handle);
    resolver.resolve(characteristic);
    return BT_GATT_ITER_STOP;
}

void ZephyrGattTransport::subscribe(const GattCharacteristic& characteristic, GattValueHandler* handler,
                                   Resolver<> resolver) {
    if (!linked) {
        resolver.reject(-ENOTCONN);
        return;
    }
    if (!(characteristic.properties & BT_GATT_CHRC_NOTIFY)) {
        resolver.reject(-ENOTSUP);
        return;
    }

    value_handler = handler;
    subscribe_resolver = resolver;

    subscribe_params.notify = notify_func;
    subscribe_params.subscribe = subscribe_func;
    subscribe_params.value = BT_GATT_CCC_NOTIFY;
    subscribe_params.value_handle = characteristic.value_handle;
    subscribe_params.ccc_handle = BT_GATT_AUTO_DISCOVER_CCC_HANDLE;
    subscribe_params.end_handle = characteristic.end_handle;
    subscribe_params.disc_params = &ccc_discover_params;

    int err = bt_gatt_subscribe(current_conn, &subscribe_params);
    if (err == -EALREADY) {
        take(subscribe_resolver).resolve();
    } else if (err) {
        LOG_ERR("Subscribe failed (err %d)", err);
        take(subscribe_resolver).reject(err);
    }
}

void ZephyrGattTransport::subscribe_func(bt_conn* conn, uint8_t err, bt_gatt_subscribe_params* params) {
    if (!instance) {
        return;
    }

    Resolver<> resolver = instance->take(instance->subscribe_resolver);
    if (err) {
        LOG_ERR("Subscribe rejected (ATT err %u)", err);
        resolver.reject(-EIO);
        return;
    }
    resolver.resolve();
}

uint8_t ZephyrGattTransport::notify_func(bt_conn* conn, bt_gatt_subscribe_params* params,
                                         const void* data, uint16_t length) {
    if (!data) {
        LOG_DBG("Unsubscribed");
        params->value_handle = 0U;
        return BT_GATT_ITER_STOP;
    }

    if (instance && instance->value_handler) {
        instance->value_handler->on_value(static_cast<const uint8_t*>(data), length);
    }
    return BT_GATT_ITER_CONTINUE;
}

void ZephyrGattTransport::write(const GattCharacteristic& characteristic, const uint8_t* data, uint16_t len,
                               Resolver<> resolver) {
    if (!linked) {
        resolver.reject(-ENOTCONN);
        return;
    }
    if (write_in_flight) {
        resolver.reject(-EBUSY);
        return;
    }
    if (len > sizeof(write_buffer)) {
        resolver.reject(-EMSGSIZE);
        return;
    }

    memcpy(write_buffer, data, len);
    write_resolver = resolver;

    write_params.func = write_func;
    write_params.handle = characteristic.value_handle;
    write_params.offset = 0;
    write_params.data = write_buffer;
    write_params.length = len;

    write_in_flight = true;
    int err = bt_gatt_write(current_conn, &write_params);
    if (err) {
        write_in_flight = false;
        LOG_WRN("Write failed (err %d)", err);
        take(write_resolver).reject(err);
    }
}

void ZephyrGattTransport::write_func(bt_conn* conn, uint8_t err, bt_gatt_write_params* params) {
    if (!instance) {
        return;
    }

    instance->write_in_flight = false;
    Resolver<> resolver = instance->take(instance->write_resolver);
    if (err) {
        LOG_WRN("Write rejected (ATT err %u)", err);
        resolver.reject(-EIO);
        return;
    }
    resolver.resolve();
}
