#ifndef STORES_TYPES_UNSUBSCRIBER_H
#define STORES_TYPES_UNSUBSCRIBER_H

#include <stores/stores_export.h>

#include <functional>
#include <memory>

namespace stores {
    /**
     * Handle returned by every registration call.
     *
     * Invoking it removes the registration. It is safe to invoke any number of times (from any copy, on any thread);
     * only the first invocation has an effect. Dropping the handle does NOT unregister, registrations are permanent
     * unless explicitly removed (use ScopedSubscription for RAII removal).
     */
    class STORES_EXPORT Unsubscriber {
    public:
        Unsubscriber() = default;

        explicit Unsubscriber(std::function<void()> remove_fn);

        void operator()() const;

        void unsubscribe() const;

        /**
         * True until the handle (or any copy of it) has been invoked. An empty handle is never active.
         */
        [[nodiscard]] bool active() const noexcept;

        explicit operator bool() const noexcept { return active(); }

    private:
        struct Handle;
        std::shared_ptr<Handle> _handle;
    };

    /**
     * Move-only owner of a registration, unsubscribes when destroyed.
     */
    class STORES_EXPORT ScopedSubscription {
    public:
        ScopedSubscription() = default;

        explicit ScopedSubscription(Unsubscriber unsubscriber) noexcept;

        ~ScopedSubscription();

        ScopedSubscription(const ScopedSubscription &) = delete;

        ScopedSubscription &operator=(const ScopedSubscription &) = delete;

        ScopedSubscription(ScopedSubscription &&other) noexcept;

        ScopedSubscription &operator=(ScopedSubscription &&other) noexcept;

        /**
         * Unsubscribe now, leaving this holder empty.
         */
        void reset();

        /**
         * Detach the registration from this holder without removing it.
         */
        [[nodiscard]] Unsubscriber release() noexcept;

        [[nodiscard]] bool active() const noexcept { return _unsubscriber.active(); }

    private:
        Unsubscriber _unsubscriber;
    };
} // namespace stores

#endif  // STORES_TYPES_UNSUBSCRIBER_H
