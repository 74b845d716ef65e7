/**
 * @file IStatusBoard.hpp
 * @brief Interface for the key-value status bus.
 *
 * The status board stores the latest named status value of every entity
 * (targets and host aggregates) and notifies subscribers on every write.
 */

#pragma once

#include "core/types/Status.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace connmon::core {

class IStatusBoard {
public:
    /**
     * @brief Callback invoked on every write.
     * @param previous Value before the write, nullopt for a new entity.
     * @param current Value that was written.
     */
    using StatusCallback =
        std::function<void(const std::optional<StatusValue>& previous, const StatusValue& current)>;

    virtual ~IStatusBoard() = default;

    /**
     * @brief Writes a status value and notifies subscribers.
     */
    virtual void publish(const StatusValue& value) = 0;

    /**
     * @brief Reads the current value of an entity.
     */
    virtual std::optional<StatusValue> get(const std::string& entityId) const = 0;

    /**
     * @brief Returns all current values ordered by entity id.
     */
    virtual std::vector<StatusValue> snapshot() const = 0;

    /**
     * @brief Removes an entity from the board.
     */
    virtual void remove(const std::string& entityId) = 0;

    /**
     * @brief Removes every entity from the board.
     */
    virtual void clear() = 0;

    /**
     * @brief Subscribes to status writes.
     * @return Subscription id usable with unsubscribe().
     */
    virtual int subscribe(StatusCallback callback) = 0;

    /**
     * @brief Removes a subscription.
     */
    virtual void unsubscribe(int subscriptionId) = 0;
};

} // namespace connmon::core
