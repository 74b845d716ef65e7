/**
 * @file Notification.hpp
 * @brief Notify group configuration used by the notification sink.
 */

#pragma once

#include <string>

namespace connmon::core {

/**
 * @brief Supported webhook payload formats.
 */
enum class WebhookProvider : int {
    Slack = 0,   ///< Slack incoming webhook
    Discord = 1, ///< Discord webhook
    Generic = 2  ///< Plain JSON document
};

/**
 * @brief A named delivery channel that alerts can be routed to.
 *
 * Targets reference a group by name through their alert_group setting.
 */
struct NotifyGroup {
    std::string name;                                ///< Group name referenced by targets
    WebhookProvider provider{WebhookProvider::Generic}; ///< Payload format
    std::string url;                                 ///< Webhook endpoint
    int timeoutMs{5000};                             ///< HTTP request timeout
    bool enabled{true};                              ///< Whether delivery is active

    /**
     * @brief Converts the provider to its configuration string.
     * @return "slack", "discord" or "generic".
     */
    [[nodiscard]] std::string providerToString() const;

    /**
     * @brief Parses a provider name, defaulting to Generic.
     */
    static WebhookProvider providerFromString(const std::string& str);

    bool operator==(const NotifyGroup& other) const = default;
};

} // namespace connmon::core
