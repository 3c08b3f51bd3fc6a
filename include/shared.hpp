#pragma once

#include <mutex>
#include <utility>

namespace modtui {

// Exclusive access to a collaborator that background threads also touch.
// The lock is held only for the duration of one with() call.
template <typename T>
class Shared {
public:
    explicit Shared(T &value) : value_(value) {}

    Shared(const Shared &) = delete;
    Shared &operator=(const Shared &) = delete;

    template <typename Fn>
    decltype(auto) with(Fn &&fn) {
        std::lock_guard lock(mutex_);
        return std::forward<Fn>(fn)(value_);
    }

private:
    T &value_;
    std::mutex mutex_;
};

}
