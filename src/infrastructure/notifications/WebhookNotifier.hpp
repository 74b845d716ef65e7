#pragma once

#include "core/services/INotificationSink.hpp"
#include "core/types/Notification.hpp"
#include "infrastructure/notifications/HttpClient.hpp"

#include <QObject>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace connmon::infra {

/**
 * @brief Delivers alert messages to notify groups through webhooks.
 *
 * send() may be called from any thread. The payload is built immediately and
 * the HTTP request is queued to the thread owning this object, which must
 * run a Qt event loop. Failed deliveries are logged and never retried.
 */
class WebhookNotifier : public QObject, public core::INotificationSink {
    Q_OBJECT

public:
    explicit WebhookNotifier(std::vector<core::NotifyGroup> groups, QObject* parent = nullptr);
    ~WebhookNotifier() override;

    /**
     * @brief Queues a message for the named group.
     * @return False if the group is unknown, disabled or has no URL.
     */
    bool send(const std::string& group, const std::string& message) override;

    /**
     * @brief Replaces the notify groups, e.g. after a config reload.
     */
    void setGroups(std::vector<core::NotifyGroup> groups);

    std::optional<core::NotifyGroup> findGroup(const std::string& name) const;

    /**
     * @brief Builds the provider-specific JSON body for a message.
     */
    static std::string buildPayload(const core::NotifyGroup& group, const std::string& message,
                                    std::chrono::system_clock::time_point timestamp);

signals:
    void delivered(const QString& group);
    void deliveryFailed(const QString& group, const QString& error);

private:
    void post(const core::NotifyGroup& group, const std::string& payload);

    std::unique_ptr<HttpClient> httpClient_;
    std::vector<core::NotifyGroup> groups_;
    mutable std::mutex mutex_;
};

} // namespace connmon::infra
