#include <stores/types/unsubscriber.h>

#include <atomic>
#include <utility>

namespace stores {
    struct Unsubscriber::Handle {
        explicit Handle(std::function<void()> fn) : remove_fn(std::move(fn)) {}

        std::function<void()> remove_fn;
        std::atomic<bool> invoked{false};
    };

    Unsubscriber::Unsubscriber(std::function<void()> remove_fn)
        : _handle(remove_fn ? std::make_shared<Handle>(std::move(remove_fn)) : nullptr) {}

    void Unsubscriber::operator()() const { unsubscribe(); }

    void Unsubscriber::unsubscribe() const {
        if (_handle == nullptr) { return; }
        if (_handle->invoked.exchange(true, std::memory_order_acq_rel)) { return; }
        _handle->remove_fn();
    }

    bool Unsubscriber::active() const noexcept {
        return _handle != nullptr && !_handle->invoked.load(std::memory_order_acquire);
    }

    ScopedSubscription::ScopedSubscription(Unsubscriber unsubscriber) noexcept : _unsubscriber(std::move(unsubscriber)) {}

    ScopedSubscription::~ScopedSubscription() { _unsubscriber.unsubscribe(); }

    ScopedSubscription::ScopedSubscription(ScopedSubscription &&other) noexcept : _unsubscriber(other.release()) {}

    ScopedSubscription &ScopedSubscription::operator=(ScopedSubscription &&other) noexcept {
        if (this != &other) {
            _unsubscriber.unsubscribe();
            _unsubscriber = other.release();
        }
        return *this;
    }

    void ScopedSubscription::reset() { std::exchange(_unsubscriber, Unsubscriber{}).unsubscribe(); }

    Unsubscriber ScopedSubscription::release() noexcept { return std::exchange(_unsubscriber, Unsubscriber{}); }
} // namespace stores
