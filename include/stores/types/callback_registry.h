#ifndef STORES_TYPES_CALLBACK_REGISTRY_H
#define STORES_TYPES_CALLBACK_REGISTRY_H

#include <stores/types/callback.h>
#include <stores/types/unsubscriber.h>
#include <stores/util/trace.h>

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace stores {
    /**
     * Registry of callbacks keyed by a monotonically increasing id.
     *
     * Ids are never reused for the lifetime of the registry, so an Unsubscriber can only ever remove the entry it
     * was issued for. Iteration order is unspecified (the map compacts on erase).
     *
     * Notification takes a snapshot of the live callbacks under the read lock and invokes them after the lock is
     * released. A callback may therefore register or unregister on the same registry while it runs; a callback added
     * during an in-flight pass may be missed by that pass, one removed during it may still be invoked once.
     *
     * The registry also owns the write-path lock of its entity (see guard()). It is recursive so that a callback
     * which writes back to the entity that is notifying it, on the same thread, nests rather than deadlocks.
     */
    template<typename CallbackT>
    class CallbackRegistry {
    public:
        using callback_type = CallbackT;
        using callback_ptr = std::shared_ptr<const CallbackT>;
        using LockType = std::recursive_mutex;
        using LockGuard = std::unique_lock<LockType>;

        explicit CallbackRegistry(std::string_view owner_kind) : _state(std::make_shared<State>(owner_kind)) {}

        CallbackRegistry(const CallbackRegistry &) = delete;

        CallbackRegistry &operator=(const CallbackRegistry &) = delete;

        Unsubscriber add(CallbackT callback) {
            const subscription_id_t id = _state->next_id.fetch_add(1, std::memory_order_relaxed);
            std::size_t live;
            {
                std::unique_lock lock(_state->lock);
                _state->callbacks.emplace(id, std::make_shared<CallbackT>(std::move(callback)));
                live = _state->callbacks.size();
            }
            trace("{} {}: registered id={} live={}", _state->owner_kind, fmt::ptr(_state.get()), id, live);

            return Unsubscriber{[weak = std::weak_ptr<State>(_state), id] {
                if (auto state = weak.lock()) { remove_from(*state, id); }
            }};
        }

        /**
         * Remove the entry for id if present. Removing an absent id is a no-op.
         */
        bool remove(subscription_id_t id) { return remove_from(*_state, id); }

        [[nodiscard]] std::vector<callback_ptr> snapshot() const {
            std::shared_lock lock(_state->lock);
            std::vector<callback_ptr> result;
            result.reserve(_state->callbacks.size());
            for (const auto &[_, callback] : _state->callbacks) { result.push_back(callback); }
            return result;
        }

        template<typename Fn>
        void notify(Fn &&invoke) const {
            const auto callbacks = snapshot();
            trace("{} {}: dispatch to {} callback(s)", _state->owner_kind, fmt::ptr(_state.get()), callbacks.size());
            for (const auto &callback : callbacks) { invoke(*callback); }
        }

        [[nodiscard]] std::size_t size() const {
            std::shared_lock lock(_state->lock);
            return _state->callbacks.size();
        }

        [[nodiscard]] bool empty() const { return size() == 0; }

        /**
         * Serialises the write path (store + dispatch) of the owning entity.
         */
        [[nodiscard]] auto guard() const -> LockGuard { return LockGuard(_write_lock); }

    private:
        struct State {
            explicit State(std::string_view kind) : owner_kind(kind) {}

            std::string_view owner_kind;
            mutable std::shared_mutex lock;
            ankerl::unordered_dense::map<subscription_id_t, callback_ptr> callbacks;
            std::atomic<subscription_id_t> next_id{0};
        };

        static bool remove_from(State &state, subscription_id_t id) {
            std::size_t erased;
            {
                std::unique_lock lock(state.lock);
                erased = state.callbacks.erase(id);
            }
            if (erased > 0) { trace("{} {}: unregistered id={}", state.owner_kind, fmt::ptr(&state), id); }
            return erased > 0;
        }

        std::shared_ptr<State> _state;
        mutable LockType _write_lock;
    };
} // namespace stores

#endif  // STORES_TYPES_CALLBACK_REGISTRY_H
