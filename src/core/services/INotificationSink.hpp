/**
 * @file INotificationSink.hpp
 * @brief Interface for delivering alert messages to a notify group.
 */

#pragma once

#include <string>

namespace connmon::core {

/**
 * @brief Fire-and-forget message delivery to a named group.
 *
 * Delivery is best effort. Failures are logged by the implementation and
 * never retried.
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    /**
     * @brief Sends a text message to a notify group.
     * @param group Name of the notify group.
     * @param message Text to deliver.
     * @return True if the message was accepted for delivery.
     */
    virtual bool send(const std::string& group, const std::string& message) = 0;
};

} // namespace connmon::core
