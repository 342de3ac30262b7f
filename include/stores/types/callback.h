#ifndef STORES_TYPES_CALLBACK_H
#define STORES_TYPES_CALLBACK_H

#include <cstdint>
#include <functional>
#include <variant>

namespace stores {
    using subscription_id_t = std::uint64_t;

    /**
     * Fired with no argument whenever the owning entity changes.
     */
    using Listener = std::function<void()>;

    /**
     * Fired with the current value once at registration and again on every change.
     */
    template<typename Value>
    using Subscriber = std::function<void(const Value &)>;

    template<typename Value>
    using Updater = std::function<Value(const Value &)>;

    /**
     * The two callback shapes share a single registry, so notification has one iteration path.
     */
    template<typename Value>
    using Callback = std::variant<Listener, Subscriber<Value>>;

    template<typename... Fs>
    struct overloaded : Fs... {
        using Fs::operator()...;
    };

    template<typename... Fs>
    overloaded(Fs...) -> overloaded<Fs...>;

    template<typename Value>
    void invoke_callback(const Callback<Value> &callback, const Value &value) {
        std::visit(overloaded{
                       [](const Listener &listener) { listener(); },
                       [&value](const Subscriber<Value> &subscriber) { subscriber(value); },
                   },
                   callback);
    }
} // namespace stores

#endif  // STORES_TYPES_CALLBACK_H
