#ifndef STORES_TYPES_DEDUPED_H
#define STORES_TYPES_DEDUPED_H

#include <stores/types/cell.h>
#include <stores/types/notifying_value.h>

#include <concepts>
#include <memory>
#include <stdexcept>
#include <utility>

namespace stores {
    /**
     * Mirrors a readable source but only notifies when the value actually changes.
     *
     * The shadow value is updated from the source's own notifications: on each one the source value is read and
     * compared with the shadow. When the source is writable so is the Deduped: set/update forward to the source, and
     * the shadow catches up through the source's notification, not inside set().
     */
    template<StorableValue Value, typename Target = Cell<Value>>
        requires std::equality_comparable<Value> && Readable<Target, Value> && Emitter<Target>
    class Deduped {
        struct private_tag {};

    public:
        using value_type = Value;
        using target_type = Target;
        using ptr = std::shared_ptr<Deduped>;

        Deduped(private_tag, std::shared_ptr<Target> target)
            : _target(std::move(target)), _state("Deduped", _target->get()) {}

        Deduped(const Deduped &) = delete;

        Deduped &operator=(const Deduped &) = delete;

        ~Deduped() { _source_registration.unsubscribe(); }

        /**
         * Wrap an existing source.
         */
        static ptr create(std::shared_ptr<Target> target) {
            if (!target) { throw_error<std::invalid_argument>("Deduped requires a non-null source"); }

            auto instance = std::make_shared<Deduped>(private_tag{}, std::move(target));
            std::weak_ptr<Deduped> weak = instance;
            instance->_source_registration = instance->_target->listen([weak] {
                if (auto self = weak.lock()) { self->on_source_change(); }
            });
            // A write landing between the shadow copy and the registration is picked up here.
            instance->on_source_change();
            return instance;
        }

        /**
         * Standalone deduplicated value, wraps a fresh Cell holding the initial value.
         */
        static ptr create(Value initial)
            requires std::same_as<Target, Cell<Value>>
        {
            return create(Cell<Value>::create(std::move(initial)));
        }

        [[nodiscard]] Value get() const { return _state.get(); }

        Unsubscriber subscribe(Subscriber<Value> callback) { return _state.subscribe(std::move(callback)); }

        Unsubscriber listen(Listener callback) { return _state.listen(std::move(callback)); }

        void set(Value value)
            requires Writable<Target, Value>
        {
            _target->set(std::move(value));
        }

        void update(const Updater<Value> &updater)
            requires Writable<Target, Value>
        {
            _target->update(updater);
        }

        [[nodiscard]] const std::shared_ptr<Target> &target() const noexcept { return _target; }

        [[nodiscard]] std::size_t callback_count() const { return _state.callback_count(); }

    private:
        // The source holds its own write guard across dispatch, so the value read here is the one being notified.
        void on_source_change() {
            auto guard = _state.guard();
            if (_state.store_if_changed(_target->get())) { _state.notify(); }
        }

        std::shared_ptr<Target> _target;
        NotifyingValue<Value> _state;
        Unsubscriber _source_registration;
    };
} // namespace stores

#endif  // STORES_TYPES_DEDUPED_H
