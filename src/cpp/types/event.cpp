#include <stores/types/event.h>
#include <stores/util/errors.h>

#include <stdexcept>
#include <utility>

namespace stores {
    Event::Event() : _registry("Event") {}

    Event::ptr Event::create() { return std::make_shared<Event>(); }

    Unsubscriber Event::listen(Listener callback) {
        if (!callback) { throw_error<std::invalid_argument>("listen() requires a callable listener"); }
        return _registry.add(std::move(callback));
    }

    void Event::dispatch() const {
        _registry.notify([](const Listener &listener) { listener(); });
    }

    std::size_t Event::callback_count() const { return _registry.size(); }
} // namespace stores
