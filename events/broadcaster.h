#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <chrono>

#include "thread_queue.h"
#include "run/protocol.h"

/// @brief One live event-stream connection for a run
/// The broadcaster pushes SSE frames; the HTTP transport drains them with
/// next() and calls disconnect() when a socket write fails.
class EventSubscription {
public:
    explicit EventSubscription(const std::string& run_id);

    const std::string& run_id() const { return run_id_; }

    /// @brief Wait up to timeout for the next frame; nullopt on timeout or close
    std::optional<std::string> next(std::chrono::milliseconds timeout);

    /// @brief Mark the peer gone; the entry is dropped on the next publish
    void disconnect();

    /// @brief True until disconnect() or close()
    bool connected() const { return connected_; }

    /// @brief True once replaced by a newer subscriber or shut down
    bool closed() const { return queue_.is_closed(); }

private:
    friend class EventBroadcaster;

    void deliver(const std::string& frame) { queue_.push(frame); }
    void close();

    std::string run_id_;
    ThreadQueue<std::string> queue_;
    std::atomic<bool> connected_{true};
};

/// @brief Fans out run events to at most one subscriber per run
/// Nothing is queued for runs without a subscriber: a late subscriber misses
/// earlier events. Frames for one run are delivered in publish order.
class EventBroadcaster {
public:
    EventBroadcaster() = default;
    ~EventBroadcaster();

    EventBroadcaster(const EventBroadcaster&) = delete;
    EventBroadcaster& operator=(const EventBroadcaster&) = delete;

    /// @brief Attach a subscriber, closing any previous one for the run
    std::shared_ptr<EventSubscription> subscribe(const std::string& run_id);

    /// @brief Detach sub if it is still the run's current subscriber
    void unsubscribe(const std::shared_ptr<EventSubscription>& sub);

    /// @brief Send message to the run's subscriber, if any
    /// @return true if the message was handed to a live subscriber
    bool publish(const std::string& run_id, const BroadcastMessage& message);

    bool has_subscriber(const std::string& run_id) const;
    size_t subscriber_count() const;

    /// @brief Close every subscription (server shutdown)
    void close_all();

    /// @brief SSE wire form of a message: "data: {...}\n\n"
    static std::string format_frame(const BroadcastMessage& message);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<EventSubscription>> subscribers_;
};
