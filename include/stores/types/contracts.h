#ifndef STORES_TYPES_CONTRACTS_H
#define STORES_TYPES_CONTRACTS_H

#include <stores/types/callback.h>
#include <stores/types/unsubscriber.h>

#include <concepts>
#include <type_traits>
#include <utility>

namespace stores {
    /**
     * Can register no-argument change listeners. listen() never invokes the callback itself.
     */
    template<typename T>
    concept Emitter = requires(T &t, Listener callback) {
        { t.listen(std::move(callback)) } -> std::same_as<Unsubscriber>;
    };

    /**
     * Can hand out the current value by copy, and subscribe a callback that receives the current value
     * immediately and every new value afterwards.
     */
    template<typename T, typename Value>
    concept Readable = requires(T &t, const T &ct, Subscriber<Value> callback) {
        { ct.get() } -> std::convertible_to<Value>;
        { t.subscribe(std::move(callback)) } -> std::same_as<Unsubscriber>;
    };

    /**
     * Can replace or transform the current value. Every write notifies.
     */
    template<typename T, typename Value>
    concept Writable = requires(T &t, Value value, Updater<Value> updater) {
        t.set(std::move(value));
        t.update(std::move(updater));
    };

    /**
     * Requirements on the values carried by Cell and Derived: handed out by copy to every callback and cache.
     */
    template<typename Value>
    concept StorableValue = std::copy_constructible<Value> && std::is_copy_assignable_v<Value> &&
                            std::is_move_assignable_v<Value>;
} // namespace stores

#endif  // STORES_TYPES_CONTRACTS_H
