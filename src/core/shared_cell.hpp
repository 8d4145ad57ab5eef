#pragma once

#include <memory>
#include <mutex>
#include <utility>

namespace tabhost
{

// A single value guarded by its own mutex. Shared through std::shared_ptr
// between the host thread and a window-discovery thread, so either side can
// outlive the other. The lock is held only for the duration of a copy.
template <typename T>
class SharedCell
{
   public:
    SharedCell() = default;
    explicit SharedCell(T initial) : value_(std::move(initial)) {}

    SharedCell(const SharedCell&)            = delete;
    SharedCell& operator=(const SharedCell&) = delete;

    T get() const
    {
        std::lock_guard lock(mu_);
        return value_;
    }

    void set(T value)
    {
        std::lock_guard lock(mu_);
        value_ = std::move(value);
    }

    // Runs fn(value&) under the lock and returns its result.
    template <typename Fn>
    auto update(Fn&& fn)
    {
        std::lock_guard lock(mu_);
        return fn(value_);
    }

   private:
    mutable std::mutex mu_;
    T                  value_{};
};

template <typename T>
using SharedCellPtr = std::shared_ptr<SharedCell<T>>;

template <typename T>
SharedCellPtr<T> make_shared_cell(T initial = T{})
{
    return std::make_shared<SharedCell<T>>(std::move(initial));
}

}   // namespace tabhost
