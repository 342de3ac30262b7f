#ifndef STORES_TYPES_ANY_EMITTER_H
#define STORES_TYPES_ANY_EMITTER_H

#include <stores/types/contracts.h>
#include <stores/util/errors.h>

#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

namespace stores {
    /**
     * Type-erased shared reference to anything satisfying Emitter, used to hand a heterogeneous list of upstream
     * entities to Derived.
     */
    class AnyEmitter {
    public:
        AnyEmitter() = default;

        template<Emitter T>
        AnyEmitter(std::shared_ptr<T> emitter) {  // NOLINT(google-explicit-constructor)
            if (emitter) {
                _listen = [emitter = std::move(emitter)](Listener callback) {
                    return emitter->listen(std::move(callback));
                };
            }
        }

        Unsubscriber listen(Listener callback) const {
            if (!_listen) { throw_error<std::invalid_argument>("Cannot listen on an empty emitter reference"); }
            return _listen(std::move(callback));
        }

        explicit operator bool() const noexcept { return static_cast<bool>(_listen); }

    private:
        std::function<Unsubscriber(Listener)> _listen;
    };
} // namespace stores

#endif  // STORES_TYPES_ANY_EMITTER_H
