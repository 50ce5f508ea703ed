// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include <herald/infra/concurrency/event.hpp>

namespace herald::concurrency {

/**
 * Value wrapper notifying its listeners on every mutation performed through \ref update.
 * Notifications are edge-triggered: any update fires, whether or not the value actually changed.
 * The value itself is not synchronized: concurrent readers and updaters need external coordination.
 * Copies share the same \ref Event, so an update through any copy wakes the listeners of all of them.
 */
template <typename T>
class ChangeNotifier {
  public:
    explicit ChangeNotifier(T value) : inner_{std::move(value)}, event_{Event::make()} {}

    //! Construct the value in place, e.g. for non-movable types like std::atomic
    template <typename... Args>
    explicit ChangeNotifier(std::in_place_t, Args&&... args)
        : inner_{std::forward<Args>(args)...}, event_{Event::make()} {}

    ChangeNotifier(const ChangeNotifier&) = default;
    ChangeNotifier& operator=(const ChangeNotifier&) = default;
    ChangeNotifier(ChangeNotifier&&) = default;
    ChangeNotifier& operator=(ChangeNotifier&&) = default;

    const T& get() const noexcept { return inner_; }
    const T& operator*() const noexcept { return inner_; }
    const T* operator->() const noexcept { return &inner_; }

    //! Create a listener woken by the next update
    Listener listen() const { return event_->listen(); }

    //! Apply the given function to the value, then notify all the listeners
    //! If the function throws, the exception propagates and no notification is fired
    template <typename F>
        requires std::invocable<F, T&>
    std::invoke_result_t<F, T&> update(F&& apply_update) {
        using Result = std::invoke_result_t<F, T&>;
        if constexpr (std::is_void_v<Result>) {
            std::invoke(std::forward<F>(apply_update), inner_);
            event_->notify_all();
        } else {
            Result result = std::invoke(std::forward<F>(apply_update), inner_);
            event_->notify_all();
            return std::forward<Result>(result);
        }
    }

    const std::shared_ptr<Event>& event() const { return event_; }

  private:
    T inner_;
    std::shared_ptr<Event> event_;
};

}  // namespace herald::concurrency
