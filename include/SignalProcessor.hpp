#pragma once

#include <zephyr/types.h>
#include <stddef.h>

class SignalProcessor final {
public:
    // Half scale of the sensor; frames carry value + BREATH_RANGE
    static inline const int32_t BREATH_RANGE = 2048;
    static inline const size_t MAX_FRAME_DIGITS = 7;

    /**
     * @brief Normalizes a raw reading to [-1, 1].
     *
     * Readings within dead_zone * BREATH_RANGE of offset map to exactly 0.
     * Outside of it the dead band is subtracted so the output is continuous
     * at its edge.
     */
    static float interpret(int32_t raw_value, float dead_zone, int32_t offset);

    static float mean(const int32_t* samples, size_t count);

    // Frame is hexadecimal text. Returns -ENODATA for an empty frame and
    // -EBADMSG for anything that is not 1..7 hex digits.
    static int parse_frame(const uint8_t* data, uint16_t len, int32_t& value);
};
