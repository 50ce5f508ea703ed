// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <herald/infra/concurrency/task.hpp>

namespace herald::concurrency {

class Event;

/**
 * Single-use handle to await the next notification of an \ref Event.
 * A listener observes the first Event::notify_all() whose generation bump happens after Event::listen() returned.
 * Registration in the Event waiter set is lazy: it happens on the first suspension in \ref wait().
 * \warning The listener must not be moved while waiting.
 */
class Listener {
  public:
    enum class State {
        kCreated,
        kRegistered,
        kNotified,
        kConsumed,
    };

    Listener(Listener&& other) noexcept;
    Listener& operator=(Listener&& other) noexcept;
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    //! Suspend until notified, then consume the listener.
    //! Completes without suspending if a notification was fired after this listener was created.
    //! \throws std::logic_error if the listener is consumed, moved-from or already waiting
    //! \throws boost::system::system_error with errc::operation_canceled if the wait gets cancelled
    Task<void> wait();

    //! Check if a notification has been fired since this listener was created
    bool is_notified() const;

    //! kNotified from the moment a notification is fired until the wait returns
    State state() const;

    uint64_t id() const { return id_; }

  private:
    friend class Event;

    Listener(std::shared_ptr<Event> event, uint64_t id, uint64_t generation);

    void unregister();

    std::shared_ptr<Event> event_;
    uint64_t id_{0};
    uint64_t generation_{0};
    State state_{State::kCreated};
};

/**
 * Broadcast wakeup primitive: any number of tasks wait on their \ref Listener, any number of threads notify.
 * Every listener created before notify_all() is woken by that call exactly once, listeners created after are not.
 * Always owned through std::shared_ptr, use \ref make() to create one.
 */
class Event : public std::enable_shared_from_this<Event> {
  public:
    static std::shared_ptr<Event> make();

    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;

    //! Create a new listener for the next notification. Never blocks.
    Listener listen();

    //! Wake up all the listeners created before this call
    //! \return the number of suspended listeners woken
    size_t notify_all();

    //! The number of listeners currently suspended
    size_t num_waiters() const;

    //! The number of notify_all calls so far
    uint64_t generation() const { return generation_.load(); }

  private:
    friend class Listener;

    //! Wake slot of one suspended listener, bound to the executor of the waiting task
    using WakeChannel = boost::asio::experimental::concurrent_channel<void(boost::system::error_code)>;

    struct Waiter {
        uint64_t generation;
        std::shared_ptr<WakeChannel> channel;
    };

    Event() = default;

    //! \return false if a notification was fired after the given generation, i.e. there is nothing to wait for
    bool add_waiter(uint64_t listener_id, uint64_t generation, std::shared_ptr<WakeChannel> channel);
    void remove_waiter(uint64_t listener_id);

    mutable std::mutex mutex_;
    std::map<uint64_t, Waiter> waiters_;

    std::atomic_uint64_t generation_{0};

    //! Set while the waiter set may be non-empty: notify_all skips the lock when clear
    std::atomic_bool has_waiters_{false};

    std::atomic_uint64_t next_listener_id_{0};
};

}  // namespace herald::concurrency
