#pragma once

#include <zephyr/kernel.h>

/**
 * @brief Collects raw samples and turns their mean into the neutral offset.
 *
 * Samples and offset survive a reconnect. abort() drops the samples, and
 * the offset too when the peripheral may have changed.
 */
class Calibrator final {
public:
    static inline const size_t SAMPLE_COUNT = CONFIG_BREATHLINK_CALIBRATION_SAMPLES;

    void start();

    // Returns true when this sample completed the calibration
    bool add_sample(int32_t raw_value);

    // Returns true if a calibration was pending
    bool abort(bool reset_offset);

    bool is_calibrating() const { return pending; }
    size_t get_sample_count() const { return sample_count; }
    int32_t get_offset() const { return offset; }

private:
    int32_t samples[SAMPLE_COUNT];
    size_t sample_count = 0;
    int32_t offset = 0;
    bool pending = false;
};
