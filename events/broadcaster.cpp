#include "dirgen.h"
#include "events/broadcaster.h"

EventSubscription::EventSubscription(const std::string& run_id)
    : run_id_(run_id) {
}

std::optional<std::string> EventSubscription::next(std::chrono::milliseconds timeout) {
    return queue_.wait_for_and_pop(timeout);
}

void EventSubscription::disconnect() {
    connected_ = false;
    queue_.close();
}

void EventSubscription::close() {
    queue_.close();
}

EventBroadcaster::~EventBroadcaster() {
    close_all();
}

std::string EventBroadcaster::format_frame(const BroadcastMessage& message) {
    return "data: " + message.to_json().dump() + "\n\n";
}

std::shared_ptr<EventSubscription> EventBroadcaster::subscribe(const std::string& run_id) {
    auto sub = std::make_shared<EventSubscription>(run_id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(run_id);
    if (it != subscribers_.end()) {
        LOG_INFO("Replacing event subscriber for run " + run_id);
        it->second->close();
        it->second = sub;
    } else {
        subscribers_[run_id] = sub;
    }
    LOG_DEBUG("Event subscriber attached for run " + run_id);
    return sub;
}

void EventBroadcaster::unsubscribe(const std::shared_ptr<EventSubscription>& sub) {
    if (!sub) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(sub->run_id());
    if (it != subscribers_.end() && it->second == sub) {
        subscribers_.erase(it);
        LOG_DEBUG("Event subscriber detached for run " + sub->run_id());
    }
}

bool EventBroadcaster::publish(const std::string& run_id, const BroadcastMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = subscribers_.find(run_id);
    if (it == subscribers_.end()) {
        dprintf(3, "No subscriber for run %s, dropping %s", run_id.c_str(), message.type.c_str());
        return false;
    }

    // Disconnect is only noticed here, on the next publish after it happened
    if (!it->second->connected()) {
        LOG_DEBUG("Event subscriber for run " + run_id + " disconnected, removing");
        subscribers_.erase(it);
        return false;
    }

    it->second->deliver(format_frame(message));
    return true;
}

bool EventBroadcaster::has_subscriber(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.count(run_id) > 0;
}

size_t EventBroadcaster::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

void EventBroadcaster::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [run_id, sub] : subscribers_) {
        sub->close();
    }
    subscribers_.clear();
}
