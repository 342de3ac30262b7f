#ifndef STORES_TYPES_CELL_H
#define STORES_TYPES_CELL_H

#include <stores/types/notifying_value.h>

#include <memory>
#include <utility>

namespace stores {
    /**
     * A readable and writable value that notifies on every write.
     *
     * There is no change detection: set() with the value already held still notifies. Wrap the cell in a Deduped
     * to suppress redundant notifications.
     */
    template<StorableValue Value>
    class Cell {
    public:
        using value_type = Value;
        using ptr = std::shared_ptr<Cell>;

        explicit Cell(Value value) : _state("Cell", std::move(value)) {}

        Cell(const Cell &) = delete;

        Cell &operator=(const Cell &) = delete;

        static ptr create(Value value) { return std::make_shared<Cell>(std::move(value)); }

        [[nodiscard]] Value get() const { return _state.get(); }

        Unsubscriber subscribe(Subscriber<Value> callback) { return _state.subscribe(std::move(callback)); }

        Unsubscriber listen(Listener callback) { return _state.listen(std::move(callback)); }

        void set(Value value) { _state.publish(std::move(value)); }

        /**
         * Read-compute-write as one step with respect to other writers of this cell, concurrent updates are never
         * lost. The updater runs on the calling thread with the write guard held.
         */
        void update(const Updater<Value> &updater) {
            auto guard = _state.guard();
            _state.publish(updater(_state.get()));
        }

        [[nodiscard]] std::size_t callback_count() const { return _state.callback_count(); }

    private:
        NotifyingValue<Value> _state;
    };
} // namespace stores

#endif  // STORES_TYPES_CELL_H
