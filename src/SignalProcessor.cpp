#include <errno.h>
#include <math.h>

#include "SignalProcessor.hpp"

float SignalProcessor::interpret(int32_t raw_value, float dead_zone, int32_t offset) {
    const float dz = dead_zone * BREATH_RANGE;
    float value = (float)(raw_value - offset);

    if (value > -dz && value < dz) {
        return 0.0f;
    }

    const float range = BREATH_RANGE - dz;
    if (range <= 0.0f) return 0.0f;

    value -= (value < 0.0f) ? -dz : dz;
    value /= range;

    if (value > 1.0f) value = 1.0f;
    if (value < -1.0f) value = -1.0f;

    return value;
}

float SignalProcessor::mean(const int32_t* samples, size_t count) {
    if (samples == nullptr || count == 0) {
        return 0.0f;
    }

    int64_t sum = 0;
    for (size_t i = 0; i < count; i++) {
        sum += samples[i];
    }
    return (float)sum / (float)count;
}

static int hex_digit(uint8_t c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int SignalProcessor::parse_frame(const uint8_t* data, uint16_t len, int32_t& value) {
    if (data == nullptr || len == 0) {
        return -ENODATA;
    }

    // UART bridge may terminate the text
    while (len > 0 && (data[len - 1] == '\0' || data[len - 1] == '\r' || data[len - 1] == '\n')) {
        len--;
    }
    if (len == 0) {
        return -ENODATA;
    }
    if (len > MAX_FRAME_DIGITS) {
        return -EBADMSG;
    }

    int32_t parsed = 0;
    for (uint16_t i = 0; i < len; i++) {
        int digit = hex_digit(data[i]);
        if (digit < 0) {
            return -EBADMSG;
        }
        parsed = (parsed << 4) | digit;
    }

    value = parsed - BREATH_RANGE;
    return 0;
}
