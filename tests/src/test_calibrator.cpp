#include <zephyr/ztest.h>

#include "Session/Calibrator.hpp"

static Calibrator calibrator;

static void calibrator_before(void* fixture) {
    calibrator.abort(true);
}

ZTEST_SUITE(calibrator, NULL, NULL, calibrator_before, NULL, NULL);

ZTEST(calibrator, test_idle_by_default)
{
    zassert_false(calibrator.is_calibrating());
    zassert_false(calibrator.add_sample(100));
    zassert_equal(calibrator.get_offset(), 0);
    zassert_false(calibrator.abort(false));
}

ZTEST(calibrator, test_completes_on_last_sample)
{
    calibrator.start();
    zassert_true(calibrator.is_calibrating());

    for (size_t i = 0; i < Calibrator::SAMPLE_COUNT - 1; i++) {
        zassert_false(calibrator.add_sample(64));
    }
    zassert_equal(calibrator.get_sample_count(), Calibrator::SAMPLE_COUNT - 1);
    zassert_true(calibrator.add_sample(64));

    zassert_false(calibrator.is_calibrating());
    zassert_equal(calibrator.get_sample_count(), 0);
    zassert_equal(calibrator.get_offset(), 64);
}

ZTEST(calibrator, test_mean_is_rounded)
{
    calibrator.start();
    for (size_t i = 0; i < Calibrator::SAMPLE_COUNT; i++) {
        calibrator.add_sample(i % 2 == 0 ? 0 : 1);
    }
    zassert_equal(calibrator.get_offset(), 1, "0.5 rounds up");

    calibrator.start();
    for (size_t i = 0; i < Calibrator::SAMPLE_COUNT; i++) {
        calibrator.add_sample(i % 2 == 0 ? 0 : -1);
    }
    zassert_equal(calibrator.get_offset(), 0, "-0.5 rounds up");
}

ZTEST(calibrator, test_start_discards_partial_samples)
{
    calibrator.start();
    for (size_t i = 0; i < 10; i++) {
        calibrator.add_sample(1000);
    }

    calibrator.start();
    zassert_equal(calibrator.get_sample_count(), 0);
    for (size_t i = 0; i < Calibrator::SAMPLE_COUNT - 1; i++) {
        zassert_false(calibrator.add_sample(-10));
    }
    zassert_true(calibrator.add_sample(-10));
    zassert_equal(calibrator.get_offset(), -10);
}

ZTEST(calibrator, test_abort_keeps_offset_unless_reset)
{
    calibrator.start();
    for (size_t i = 0; i < Calibrator::SAMPLE_COUNT; i++) {
        calibrator.add_sample(20);
    }

    calibrator.start();
    calibrator.add_sample(500);
    zassert_true(calibrator.abort(false));
    zassert_false(calibrator.is_calibrating());
    zassert_equal(calibrator.get_offset(), 20);

    zassert_false(calibrator.abort(true));
    zassert_equal(calibrator.get_offset(), 0);
}
