#include "monitoring/StatusBoard.hpp"

#include <spdlog/spdlog.h>

namespace connmon::monitoring {

void StatusBoard::publish(const core::StatusValue& value) {
    std::optional<core::StatusValue> previous;
    std::vector<StatusCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = values_.find(value.entityId);
        if (it != values_.end()) {
            previous = it->second;
            it->second = value;
        } else {
            values_.emplace(value.entityId, value);
        }
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, callback] : subscribers_) {
            callbacks.push_back(callback);
        }
    }

    if (!previous || previous->state != value.state) {
        spdlog::debug("{} is now {}", value.entityId, value.state);
    }

    for (const auto& callback : callbacks) {
        try {
            callback(previous, value);
        } catch (const std::exception& e) {
            spdlog::error("Status subscriber failed for {}: {}", value.entityId, e.what());
        }
    }
}

std::optional<core::StatusValue> StatusBoard::get(const std::string& entityId) const {
    std::lock_guard lock(mutex_);
    auto it = values_.find(entityId);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<core::StatusValue> StatusBoard::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<core::StatusValue> result;
    result.reserve(values_.size());
    for (const auto& [id, value] : values_) {
        result.push_back(value);
    }
    return result;
}

void StatusBoard::remove(const std::string& entityId) {
    std::lock_guard lock(mutex_);
    values_.erase(entityId);
}

void StatusBoard::clear() {
    std::lock_guard lock(mutex_);
    values_.clear();
}

int StatusBoard::subscribe(StatusCallback callback) {
    std::lock_guard lock(mutex_);
    int id = nextSubscriptionId_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void StatusBoard::unsubscribe(int subscriptionId) {
    std::lock_guard lock(mutex_);
    subscribers_.erase(subscriptionId);
}

size_t StatusBoard::size() const {
    std::lock_guard lock(mutex_);
    return values_.size();
}

} // namespace connmon::monitoring
