#ifndef STORES_TYPES_DERIVED_H
#define STORES_TYPES_DERIVED_H

#include <stores/types/any_emitter.h>
#include <stores/types/notifying_value.h>

#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace stores {
    /**
     * A read-only value computed from other entities.
     *
     * The recomputation function is evaluated once at construction, then again every time any upstream emitter
     * notifies. Each upstream notification produces one recomputation and one downstream notification; nothing is
     * coalesced. The cached value is push-updated, it reflects the upstream state as of the last notification.
     *
     * A Derived listens to its upstreams through a weak reference and removes those registrations when it is
     * destroyed, so it never keeps its upstreams' registries busy after it is gone.
     */
    template<StorableValue Value>
    class Derived {
        struct private_tag {};

    public:
        using value_type = Value;
        using ptr = std::shared_ptr<Derived>;
        using compute_fn = std::function<Value()>;

        Derived(private_tag, compute_fn compute)
            : _compute(std::move(compute)), _state("Derived", _compute()) {}

        Derived(const Derived &) = delete;

        Derived &operator=(const Derived &) = delete;

        ~Derived() {
            for (const auto &registration : _upstream_registrations) { registration.unsubscribe(); }
        }

        /**
         * @param upstreams Entities whose notifications trigger a recomputation, at least one.
         * @param compute   Pure function producing the value, capturing whatever upstream handles it reads.
         */
        static ptr create(std::vector<AnyEmitter> upstreams, compute_fn compute) {
            if (upstreams.empty()) { throw_error<std::invalid_argument>("Derived requires at least one upstream emitter"); }
            for (std::size_t i = 0; i < upstreams.size(); ++i) {
                if (!upstreams[i]) { throw_error<std::invalid_argument>("Derived upstream #{} is null", i); }
            }
            if (!compute) { throw_error<std::invalid_argument>("Derived requires a recomputation function"); }

            auto instance = std::make_shared<Derived>(private_tag{}, std::move(compute));
            std::weak_ptr<Derived> weak = instance;
            instance->_upstream_registrations.reserve(upstreams.size());
            for (const auto &upstream : upstreams) {
                instance->_upstream_registrations.push_back(upstream.listen([weak] {
                    if (auto self = weak.lock()) { self->recompute(); }
                }));
            }
            return instance;
        }

        [[nodiscard]] Value get() const { return _state.get(); }

        Unsubscriber subscribe(Subscriber<Value> callback) { return _state.subscribe(std::move(callback)); }

        Unsubscriber listen(Listener callback) { return _state.listen(std::move(callback)); }

        [[nodiscard]] std::size_t callback_count() const { return _state.callback_count(); }

    private:
        // Compute, store and dispatch all happen under the write guard.
        void recompute() {
            auto guard = _state.guard();
            _state.publish(_compute());
        }

        compute_fn _compute;
        NotifyingValue<Value> _state;
        std::vector<Unsubscriber> _upstream_registrations;
    };
} // namespace stores

#endif  // STORES_TYPES_DERIVED_H
