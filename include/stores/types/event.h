#ifndef STORES_TYPES_EVENT_H
#define STORES_TYPES_EVENT_H

#include <stores/stores_export.h>
#include <stores/types/callback_registry.h>

#include <cstddef>
#include <memory>

namespace stores {
    /**
     * An emitter without a value. dispatch() fires every registered listener.
     *
     * Dispatches from several threads run concurrently and independently, each against its own snapshot of the
     * listeners.
     */
    class STORES_EXPORT Event {
    public:
        using ptr = std::shared_ptr<Event>;

        Event();

        Event(const Event &) = delete;

        Event &operator=(const Event &) = delete;

        static ptr create();

        Unsubscriber listen(Listener callback);

        void dispatch() const;

        [[nodiscard]] std::size_t callback_count() const;

    private:
        CallbackRegistry<Listener> _registry;
    };
} // namespace stores

#endif  // STORES_TYPES_EVENT_H
