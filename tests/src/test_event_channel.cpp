#include <zephyr/ztest.h>

#include "Session/EventChannel.hpp"

struct CallLog {
    char order[8];
    size_t count;
};

static CallLog call_log;

static void record(int value, void* context) {
    const char name = *static_cast<const char*>(context);
    if (call_log.count < sizeof(call_log.order)) {
        call_log.order[call_log.count++] = name;
    }
}

static const char NAME_A = 'a';
static const char NAME_B = 'b';
static const char NAME_C = 'c';

static void event_channel_before(void* fixture) {
    call_log = {};
}

ZTEST_SUITE(event_channel, NULL, NULL, event_channel_before, NULL, NULL);

ZTEST(event_channel, test_registration_order)
{
    EventChannel<int> channel;
    EventChannel<int>::Listener a{ record, (void*)&NAME_A, {} };
    EventChannel<int>::Listener b{ record, (void*)&NAME_B, {} };
    EventChannel<int>::Listener c{ record, (void*)&NAME_C, {} };

    channel.add(&b);
    channel.add(&a);
    channel.add(&c);
    channel.emit(1);

    zassert_equal(call_log.count, 3);
    zassert_mem_equal(call_log.order, "bac", 3);
}

ZTEST(event_channel, test_remove)
{
    EventChannel<int> channel;
    EventChannel<int>::Listener a{ record, (void*)&NAME_A, {} };
    EventChannel<int>::Listener b{ record, (void*)&NAME_B, {} };

    channel.add(&a);
    channel.add(&b);
    zassert_true(channel.remove(&a));
    zassert_false(channel.remove(&a));
    channel.emit(1);

    zassert_equal(call_log.count, 1);
    zassert_equal(call_log.order[0], 'b');
}

ZTEST(event_channel, test_adding_twice_registers_once)
{
    EventChannel<int> channel;
    EventChannel<int>::Listener a{ record, (void*)&NAME_A, {} };
    EventChannel<int>::Listener b{ record, (void*)&NAME_B, {} };

    channel.add(&a);
    channel.add(&b);
    channel.add(&a);
    channel.emit(1);

    zassert_equal(call_log.count, 2);
    zassert_mem_equal(call_log.order, "ba", 2);
}

static EventChannel<int> self_removing_channel;

static void remove_self(int value, void* context) {
    auto* listener = static_cast<EventChannel<int>::Listener*>(context);
    self_removing_channel.remove(listener);
    call_log.order[call_log.count++] = 's';
}

ZTEST(event_channel, test_listener_may_remove_itself)
{
    EventChannel<int>::Listener self{ remove_self, nullptr, {} };
    EventChannel<int>::Listener b{ record, (void*)&NAME_B, {} };
    self.context = &self;

    self_removing_channel.add(&self);
    self_removing_channel.add(&b);
    self_removing_channel.emit(1);
    self_removing_channel.emit(2);

    zassert_equal(call_log.count, 3);
    zassert_mem_equal(call_log.order, "sbb", 3);
    self_removing_channel.remove(&b);
}
