#include <zephyr/logging/log.h>
#include <math.h>

#include "Session/Calibrator.hpp"
#include "SignalProcessor.hpp"

LOG_MODULE_REGISTER(Calibrator, CONFIG_BREATHLINK_LOG_LEVEL);

void Calibrator::start() {
    sample_count = 0;
    pending = true;
}

bool Calibrator::add_sample(int32_t raw_value) {
    if (!pending) {
        return false;
    }

    samples[sample_count++] = raw_value;
    if (sample_count < SAMPLE_COUNT) {
        return false;
    }

    const float mean = SignalProcessor::mean(samples, sample_count);
    offset = (int32_t)floorf(mean + 0.5f);
    sample_count = 0;
    pending = false;

    LOG_INF("Calibrated, offset %d", (int)offset);
    return true;
}

bool Calibrator::abort(bool reset_offset) {
    const bool was_pending = pending;

    sample_count = 0;
    pending = false;
    if (reset_offset) {
        offset = 0;
    }
    return was_pending;
}
