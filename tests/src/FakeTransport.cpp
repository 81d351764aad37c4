#include <string.h>

#include "FakeTransport.hpp"

static const GattService FAKE_SERVICE = {
    .start_handle = 0x0010,
    .end_handle = 0x0020,
};

static const GattCharacteristic FAKE_CHARACTERISTIC = {
    .value_handle = 0x0012,
    .end_handle = 0x0020,
    .properties = 0x1A, // read, write, notify
};

PeripheralDevice make_fake_device(uint8_t last_addr_byte, bool connectable) {
    PeripheralDevice device{};
    device.addr.type = BT_ADDR_LE_RANDOM;
    device.addr.a.val[0] = last_addr_byte;
    device.addr.a.val[5] = 0xC0;
    device.connectable = connectable;
    return device;
}

void FakeTransport::reset() {
    request_op.reset(make_fake_device(0x01, true));
    connect_op.reset(NoValue{});
    disconnect_op.reset(NoValue{});
    service_op.reset(FAKE_SERVICE);
    characteristic_op.reset(FAKE_CHARACTERISTIC);
    subscribe_op.reset(NoValue{});
    write_op.reset(NoValue{});

    connected = false;
    last_filter = nullptr;
    last_service_uuid = nullptr;
    last_characteristic_uuid = nullptr;
    last_write_handle = 0;
    memset(last_write, 0, sizeof(last_write));
    last_write_len = 0;
    value_handler = nullptr;
}

void FakeTransport::request_device(const DeviceFilter& filter, Resolver<PeripheralDevice> resolver) {
    last_filter = filter.service;
    request_op.complete(resolver);
}

void FakeTransport::connect(const PeripheralDevice& device, Resolver<> resolver) {
    if (connect_op.mode != FakeMode::Reject) {
        connected = true;
    }
    connect_op.complete(resolver);
}

void FakeTransport::disconnect(Resolver<> resolver) {
    connected = false;
    disconnect_op.complete(resolver);
}

void FakeTransport::get_service(const bt_uuid* uuid, Resolver<GattService> resolver) {
    last_service_uuid = uuid;
    service_op.complete(resolver);
}

void FakeTransport::get_characteristic(const GattService& service, const bt_uuid* uuid,
                                       Resolver<GattCharacteristic> resolver) {
    last_characteristic_uuid = uuid;
    characteristic_op.complete(resolver);
}

void FakeTransport::subscribe(const GattCharacteristic& characteristic, GattValueHandler* handler,
                              Resolver<> resolver) {
    value_handler = handler;
    subscribe_op.complete(resolver);
}

void FakeTransport::write(const GattCharacteristic& characteristic, const uint8_t* data, uint16_t len,
                          Resolver<> resolver) {
    last_write_handle = characteristic.value_handle;
    last_write_len = MIN(len, sizeof(last_write));
    memcpy(last_write, data, last_write_len);
    write_op.complete(resolver);
}

void FakeTransport::notify(const char* text) {
    notify_raw(reinterpret_cast<const uint8_t*>(text), strlen(text));
}

void FakeTransport::notify_raw(const uint8_t* data, uint16_t len) {
    if (value_handler) {
        value_handler->on_value(data, len);
    }
}
