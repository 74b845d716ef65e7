/**
 * @file StatusBoard.hpp
 * @brief In-memory implementation of the status board.
 */

#pragma once

#include "core/services/IStatusBoard.hpp"

#include <map>
#include <mutex>

namespace connmon::monitoring {

/**
 * @brief Thread-safe key-value store of the latest status of every entity.
 *
 * Subscribers are called on the publishing thread after the lock has been
 * released, so a callback may read from or publish to the board again.
 */
class StatusBoard : public core::IStatusBoard {
public:
    StatusBoard() = default;

    void publish(const core::StatusValue& value) override;
    std::optional<core::StatusValue> get(const std::string& entityId) const override;
    std::vector<core::StatusValue> snapshot() const override;
    void remove(const std::string& entityId) override;
    void clear() override;
    int subscribe(StatusCallback callback) override;
    void unsubscribe(int subscriptionId) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, core::StatusValue> values_;
    std::map<int, StatusCallback> subscribers_;
    int nextSubscriptionId_{1};
};

} // namespace connmon::monitoring
