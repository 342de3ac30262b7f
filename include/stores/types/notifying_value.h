#ifndef STORES_TYPES_NOTIFYING_VALUE_H
#define STORES_TYPES_NOTIFYING_VALUE_H

#include <stores/types/callback_registry.h>
#include <stores/types/contracts.h>
#include <stores/util/errors.h>

#include <concepts>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace stores {
    /**
     * A value plus the registry of callbacks interested in it.
     *
     * The value lock and the registry lock are distinct. notify() copies the value under the read lock and releases
     * it before any callback runs, so callbacks may freely call get/subscribe/listen on the same entity.
     *
     * Writers hold guard() across store + notify, which serialises writes of one entity and keeps subscribers
     * seeing values in write order.
     */
    template<StorableValue Value>
    class NotifyingValue {
    public:
        using registry_type = CallbackRegistry<Callback<Value>>;

        NotifyingValue(std::string_view owner_kind, Value value)
            : _value(std::move(value)), _registry(owner_kind) {}

        [[nodiscard]] Value get() const {
            std::shared_lock lock(_value_lock);
            return _value;
        }

        Unsubscriber listen(Listener callback) {
            if (!callback) { throw_error<std::invalid_argument>("listen() requires a callable listener"); }
            return _registry.add(Callback<Value>{std::in_place_type<Listener>, std::move(callback)});
        }

        /**
         * Registers, then delivers the current value synchronously.
         *
         * The value is read after the callback is added, so a write that is not reflected in the immediate delivery
         * dispatches to the new callback. The write guard is not taken: registering from inside another thread's
         * dispatch never waits on that dispatch, and the immediate delivery can interleave with a concurrent write's
         * delivery. If the immediate delivery throws, the registration is dropped before the exception propagates.
         */
        Unsubscriber subscribe(Subscriber<Value> callback) {
            if (!callback) { throw_error<std::invalid_argument>("subscribe() requires a callable subscriber"); }
            auto shared_callback = std::make_shared<Subscriber<Value>>(std::move(callback));
            auto unsubscriber = _registry.add(Callback<Value>{
                std::in_place_type<Subscriber<Value>>,
                [shared_callback](const Value &value) { (*shared_callback)(value); }});
            try {
                (*shared_callback)(get());
            } catch (...) {
                unsubscriber();
                throw;
            }
            return unsubscriber;
        }

        void store(Value value) {
            std::unique_lock lock(_value_lock);
            _value = std::move(value);
        }

        /**
         * Replace the value only when it differs from the held one. Returns true when a replacement happened.
         */
        bool store_if_changed(const Value &value)
            requires std::equality_comparable<Value>
        {
            std::unique_lock lock(_value_lock);
            if (_value == value) { return false; }
            _value = value;
            return true;
        }

        void notify() const {
            const Value value = get();
            _registry.notify([&value](const Callback<Value> &callback) {
                invoke_callback<Value>(callback, value);
            });
        }

        void publish(Value value) {
            auto guard = _registry.guard();
            store(std::move(value));
            notify();
        }

        [[nodiscard]] auto guard() const { return _registry.guard(); }

        [[nodiscard]] std::size_t callback_count() const { return _registry.size(); }

    private:
        mutable std::shared_mutex _value_lock;
        Value _value;
        registry_type _registry;
    };
} // namespace stores

#endif  // STORES_TYPES_NOTIFYING_VALUE_H
