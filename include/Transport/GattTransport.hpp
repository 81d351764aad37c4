#pragma once

#include <zephyr/types.h>
#include <zephyr/bluetooth/addr.h>
#include <zephyr/bluetooth/uuid.h>

#include "Async/Completion.hpp"

struct DeviceFilter {
    const bt_uuid* service;
};

struct PeripheralDevice {
    bt_addr_le_t addr;
    bool connectable;
};

struct GattService {
    uint16_t start_handle;
    uint16_t end_handle;
};

struct GattCharacteristic {
    uint16_t value_handle;
    uint16_t end_handle;
    uint8_t properties;
};

class GattValueHandler {
public:
    virtual ~GattValueHandler() = default;

    virtual void on_value(const uint8_t* data, uint16_t len) {}
};

/**
 * @brief GATT client operations used by a breath session.
 *
 * Every operation completes exactly once through its resolver, possibly
 * before the call returns. Errors are negative errno values.
 */
class GattTransport {
public:
    virtual ~GattTransport() = default;

    virtual void request_device(const DeviceFilter& filter, Resolver<PeripheralDevice> resolver) = 0;
    virtual void connect(const PeripheralDevice& device, Resolver<> resolver) = 0;
    virtual void disconnect(Resolver<> resolver) = 0;
    virtual bool is_connected() const = 0;

    virtual void get_service(const bt_uuid* uuid, Resolver<GattService> resolver) = 0;
    virtual void get_characteristic(const GattService& service, const bt_uuid* uuid,
                                    Resolver<GattCharacteristic> resolver) = 0;
    virtual void subscribe(const GattCharacteristic& characteristic, GattValueHandler* handler,
                           Resolver<> resolver) = 0;
    virtual void write(const GattCharacteristic& characteristic, const uint8_t* data, uint16_t len,
                       Resolver<> resolver) = 0;
};
