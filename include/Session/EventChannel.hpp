#pragma once

#include <zephyr/sys/slist.h>

#include "Session/ReadyState.hpp"
#include "Session/SessionError.hpp"

/**
 * @brief Ordered list of listeners for one kind of event.
 *
 * Listeners are intrusive nodes owned by the caller and must stay alive
 * while registered. emit() calls them in registration order.
 */
template<typename... Args>
class EventChannel {
public:
    typedef void (*Handler)(Args... args, void* context);

    struct Listener {
        Handler handler;
        void* context;
        sys_snode_t node;
    };

    EventChannel() {
        sys_slist_init(&listeners);
    }

    void add(Listener* listener) {
        sys_slist_find_and_remove(&listeners, &listener->node);
        sys_slist_append(&listeners, &listener->node);
    }

    bool remove(Listener* listener) {
        return sys_slist_find_and_remove(&listeners, &listener->node);
    }

    void emit(Args... args) {
        Listener* listener;
        Listener* next;
        SYS_SLIST_FOR_EACH_CONTAINER_SAFE(&listeners, listener, next, node) {
            listener->handler(args..., listener->context);
        }
    }

private:
    sys_slist_t listeners;
};

typedef EventChannel<ReadyState>::Listener ReadyStateListener;
typedef EventChannel<float>::Listener BreathListener;
typedef EventChannel<bool>::Listener CalibrationStateListener;
typedef EventChannel<const SessionError&>::Listener ErrorListener;
