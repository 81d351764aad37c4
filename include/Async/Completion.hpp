#pragma once

#include <zephyr/kernel.h>
#include <zephyr/spinlock.h>

struct NoValue {};

template<typename T>
class Completion;

/**
 * @brief Handle given to whoever finishes an asynchronous step.
 *
 * A resolver belongs to one generation of its Completion. Once the
 * completion is re-armed with prepare() older resolvers become no-ops, so a
 * result that arrives after its waiter gave up is dropped.
 */
template<typename T = NoValue>
class Resolver {
public:
    Resolver() = default;

    void resolve(const T& value = T{}) const {
        if (owner) owner->finish(token, 0, value);
    }
    void reject(int err) const {
        if (owner) owner->finish(token, err, T{});
    }
    bool is_valid() const { return owner != nullptr; }

private:
    friend class Completion<T>;
    Resolver(Completion<T>* owner, uint32_t token) : owner(owner), token(token) {}

    Completion<T>* owner{ nullptr };
    uint32_t token{ 0 };
};

/**
 * @brief Single-waiter result slot backed by a k_poll_signal.
 */
template<typename T = NoValue>
class Completion {
public:
    Completion() {
        k_poll_signal_init(&signal);
    }

    Completion(const Completion&) = delete;
    Completion& operator=(const Completion&) = delete;

    Resolver<T> prepare() {
        k_spinlock_key_t key = k_spin_lock(&lock);
        token++;
        settled = false;
        k_poll_signal_reset(&signal);
        k_spin_unlock(&lock, key);
        return Resolver<T>(this, token);
    }

    bool is_settled() const { return settled; }

    // Returns true and the settled result if the current generation finished.
    // Otherwise clears a stale wakeup so the caller can k_poll() again.
    bool try_take(int& result, T* out) {
        k_spinlock_key_t key = k_spin_lock(&lock);
        if (settled) {
            result = settled_result;
            if (out) {
                *out = value;
            }
            k_spin_unlock(&lock, key);
            return true;
        }
        k_poll_signal_reset(&signal);
        k_spin_unlock(&lock, key);
        return false;
    }

    k_poll_signal* get_signal() { return &signal; }

private:
    friend class Resolver<T>;

    void finish(uint32_t from, int result, const T& new_value) {
        k_spinlock_key_t key = k_spin_lock(&lock);
        if (from != token || settled) {
            k_spin_unlock(&lock, key);
            return;
        }
        settled = true;
        settled_result = result;
        value = new_value;
        // raised under the lock, the waiter may own this object on its stack
        k_poll_signal_raise(&signal, result);
        k_spin_unlock(&lock, key);
    }

    k_poll_signal signal;
    k_spinlock lock;
    uint32_t token{ 0 };
    bool settled{ false };
    int settled_result{ 0 };
    T value{};
};
