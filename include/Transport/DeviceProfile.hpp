#pragma once

#include <zephyr/bluetooth/uuid.h>

// Melody Smart UART bridge inside the breath sensor
struct MelodySmartProfile {
    static inline const bt_uuid_128 SERVICE_UUID = BT_UUID_INIT_128(
        BT_UUID_128_ENCODE(0xbc2f4cc6, 0xaaef, 0x4351, 0x9034, 0xd66268e328f0));

    // Commands are written here, sensor frames are notified from here
    static inline const bt_uuid_128 DATA_UUID = BT_UUID_INIT_128(
        BT_UUID_128_ENCODE(0x06d1e5e7, 0x79ad, 0x4a71, 0x8faa, 0x373789f7d93c));

    static inline const uint8_t REQUEST_BREATH_COMMAND[] = { 0x3F, 0x62 }; // "?b"
};
