// Copyright 2025 The Herald Authors
// SPDX-License-Identifier: Apache-2.0

#include "event.hpp"

#include <string>
#include <utility>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

#include <herald/infra/common/assert.hpp>
#include <herald/infra/common/ensure.hpp>
#include <herald/infra/common/log.hpp>

namespace herald::concurrency {

Listener::Listener(std::shared_ptr<Event> event, uint64_t id, uint64_t generation)
    : event_{std::move(event)}, id_{id}, generation_{generation} {}

Listener::Listener(Listener&& other) noexcept
    : event_{std::move(other.event_)}, id_{other.id_}, generation_{other.generation_}, state_{other.state_} {
    HERALD_ASSERT(state_ != State::kRegistered);
    other.state_ = State::kConsumed;
}

Listener& Listener::operator=(Listener&& other) noexcept {
    if (this != &other) {
        HERALD_ASSERT(other.state_ != State::kRegistered);
        unregister();
        event_ = std::move(other.event_);
        id_ = other.id_;
        generation_ = other.generation_;
        state_ = other.state_;
        other.state_ = State::kConsumed;
    }
    return *this;
}

Listener::~Listener() {
    unregister();
}

void Listener::unregister() {
    if (state_ == State::kRegistered && event_) {
        event_->remove_waiter(id_);
        state_ = State::kCreated;
    }
}

Task<void> Listener::wait() {
    ensure(event_ != nullptr, "Listener::wait: moved-from listener");
    ensure(state_ != State::kConsumed, [&]() { return "Listener::wait: listener " + std::to_string(id_) + " already consumed"; });
    ensure(state_ != State::kRegistered, [&]() { return "Listener::wait: listener " + std::to_string(id_) + " already waiting"; });

    const auto executor = co_await boost::asio::this_coro::executor;
    auto channel = std::make_shared<Event::WakeChannel>(executor, 1);
    if (!event_->add_waiter(id_, generation_, channel)) {
        state_ = State::kConsumed;
        co_return;
    }
    state_ = State::kRegistered;

    // Leaves the waiter set on every exit: wake, cancellation or destruction of the suspended frame at executor shutdown
    struct Registration {
        std::shared_ptr<Event> event;
        uint64_t listener_id;
        ~Registration() { event->remove_waiter(listener_id); }
    };
    Registration registration{event_, id_};

    try {
        co_await channel->async_receive(boost::asio::use_awaitable);
    } catch (const boost::system::system_error& se) {
        state_ = State::kCreated;
        if (se.code() == boost::asio::experimental::error::channel_cancelled ||
            se.code() == boost::asio::error::operation_aborted) {
            throw boost::system::system_error(make_error_code(boost::system::errc::operation_canceled));
        }
        throw;
    }
    HERALD_TRACE << "Listener::wait listener=" << id_ << " woken";
    state_ = State::kConsumed;
}

bool Listener::is_notified() const {
    if (state_ == State::kConsumed) {
        return true;
    }
    return event_ && event_->generation() != generation_;
}

Listener::State Listener::state() const {
    if (state_ != State::kConsumed && is_notified()) {
        return State::kNotified;
    }
    return state_;
}

std::shared_ptr<Event> Event::make() {
    return std::shared_ptr<Event>{new Event};
}

Listener Event::listen() {
    return Listener{shared_from_this(), next_listener_id_.fetch_add(1), generation_.load()};
}

size_t Event::notify_all() {
    const uint64_t generation = generation_.fetch_add(1);
    if (!has_waiters_.load()) {
        return 0;
    }

    std::vector<std::shared_ptr<WakeChannel>> woken;
    {
        std::scoped_lock lock{mutex_};
        for (auto it = waiters_.begin(); it != waiters_.end();) {
            if (it->second.generation <= generation) {
                woken.push_back(std::move(it->second.channel));
                it = waiters_.erase(it);
            } else {
                ++it;
            }
        }
        has_waiters_.store(!waiters_.empty());
    }

    HERALD_TRACE << "Event::notify_all generation=" << generation + 1 << " woken=" << woken.size();
    for (const auto& channel : woken) {
        // Each wake slot gets exactly one send and has room for it
        const bool sent = channel->try_send(boost::system::error_code{});
        HERALD_ASSERT(sent);
    }
    return woken.size();
}

size_t Event::num_waiters() const {
    std::scoped_lock lock{mutex_};
    return waiters_.size();
}

bool Event::add_waiter(uint64_t listener_id, uint64_t generation, std::shared_ptr<WakeChannel> channel) {
    std::scoped_lock lock{mutex_};
    // The flag must be published before the generation is read, notify_all does the opposite
    has_waiters_.store(true);
    if (generation_.load() != generation) {
        has_waiters_.store(!waiters_.empty());
        HERALD_TRACE << "Event::add_waiter listener=" << listener_id << " already notified";
        return false;
    }

    const auto [_, inserted] = waiters_.try_emplace(listener_id, Waiter{generation, std::move(channel)});
    ensure_invariant(inserted, "listener registered twice");
    return true;
}

void Event::remove_waiter(uint64_t listener_id) {
    decltype(waiters_)::node_type node;
    {
        std::scoped_lock lock{mutex_};
        node = waiters_.extract(listener_id);
        has_waiters_.store(!waiters_.empty());
    }
    if (node) {
        HERALD_TRACE << "Event::remove_waiter listener=" << listener_id;
    }
}

}  // namespace herald::concurrency
