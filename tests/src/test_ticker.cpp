#include <zephyr/ztest.h>

#include "Async/Ticker.hpp"
#include "TestSupport.hpp"

struct TickProbe {
    volatile uint32_t calls;
    volatile uint32_t finished;
    int32_t sleep_ms;
    int result;
    Ticker* ticker;
    volatile bool started_while_running;
};

static TickProbe probe;

static int probe_tick(int64_t now, void* context) {
    auto* tick_probe = static_cast<TickProbe*>(context);
    tick_probe->calls = tick_probe->calls + 1;
    if (tick_probe->sleep_ms > 0) {
        k_msleep(tick_probe->sleep_ms);
    }
    if (tick_probe->ticker) {
        tick_probe->started_while_running = tick_probe->ticker->is_started();
    }
    tick_probe->finished = tick_probe->finished + 1;
    return tick_probe->result;
}

static void ticker_before(void* fixture) {
    probe = {};
}

ZTEST_SUITE(ticker, NULL, NULL, ticker_before, NULL, NULL);

ZTEST(ticker, test_ticks_until_stopped)
{
    Ticker ticker(get_test_work_queue(), probe_tick, &probe, 10);

    zassert_ok(ticker.start());
    zassert_true(ticker.is_started());
    k_yield();
    zassert_equal(probe.calls, 1, "first run is not delayed");

    k_msleep(105);
    ticker.stop();
    zassert_false(ticker.is_started());

    const uint32_t calls = probe.calls;
    zassert_true(calls >= 9 && calls <= 12, "%u calls", calls);

    k_msleep(300);
    zassert_equal(probe.calls, calls, "ticked after stop()");
}

ZTEST(ticker, test_start_only_once)
{
    Ticker ticker(get_test_work_queue(), probe_tick, &probe, 10);

    zassert_ok(ticker.start());
    zassert_equal(ticker.start(), -EALREADY);
    ticker.stop();
}

ZTEST(ticker, test_keeps_ticking_when_callback_fails)
{
    Ticker ticker(get_test_work_queue(), probe_tick, &probe, 10);
    probe.result = -EIO;

    zassert_ok(ticker.start());
    k_msleep(55);
    ticker.stop();

    zassert_true(probe.calls >= 5, "%u calls", probe.calls);
}

ZTEST(ticker, test_stop_waits_for_running_callback)
{
    Ticker ticker(get_test_work_queue(), probe_tick, &probe, 10);
    probe.sleep_ms = 50;

    const int64_t start = k_uptime_get();
    zassert_ok(ticker.start());
    k_yield();
    zassert_equal(probe.calls, 1);
    zassert_equal(probe.finished, 0);

    ticker.stop();
    zassert_equal(probe.finished, 1, "stop() returned before the callback settled");
    zassert_true(k_uptime_get() - start >= 50);

    k_msleep(200);
    zassert_equal(probe.calls, 1);
}

ZTEST(ticker, test_interval_counts_from_callback_return)
{
    Ticker ticker(get_test_work_queue(), probe_tick, &probe, 10);
    probe.sleep_ms = 20;

    zassert_ok(ticker.start());
    k_msleep(295);
    ticker.stop();

    // 20 ms of work plus 10 ms of delay per run
    zassert_true(probe.calls >= 9 && probe.calls <= 11, "%u calls", probe.calls);
}

ZTEST(ticker, test_restart_after_stop)
{
    Ticker ticker(get_test_work_queue(), probe_tick, &probe, 10);

    zassert_ok(ticker.start());
    ticker.stop();
    const uint32_t calls = probe.calls;
    zassert_equal(calls, 1);

    zassert_ok(ticker.start());
    k_msleep(25);
    ticker.stop();
    zassert_true(probe.calls > calls);
}

ZTEST(ticker, test_stop_right_after_start_runs_first_tick)
{
    Ticker ticker(get_test_work_queue(), probe_tick, &probe, 10);

    zassert_ok(ticker.start());
    ticker.stop();
    zassert_equal(probe.calls, 1);
    zassert_equal(probe.finished, 1);
    zassert_false(ticker.is_started());

    k_msleep(50);
    zassert_equal(probe.calls, 1);
}

ZTEST(ticker, test_started_until_stop_returns)
{
    Ticker ticker(get_test_work_queue(), probe_tick, &probe, 10);
    probe.sleep_ms = 30;
    probe.ticker = &ticker;

    zassert_ok(ticker.start());
    k_yield();
    zassert_equal(probe.calls, 1);

    // the callback samples is_started() while stop() waits for it
    ticker.stop();
    zassert_equal(probe.finished, 1);
    zassert_true(probe.started_while_running);
    zassert_false(ticker.is_started());
}
