#include "infrastructure/notifications/WebhookNotifier.hpp"

#include <QMetaObject>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace connmon::infra {

namespace {

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace

WebhookNotifier::WebhookNotifier(std::vector<core::NotifyGroup> groups, QObject* parent)
    : QObject(parent), httpClient_(std::make_unique<HttpClient>()), groups_(std::move(groups)) {}

WebhookNotifier::~WebhookNotifier() = default;

void WebhookNotifier::setGroups(std::vector<core::NotifyGroup> groups) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_ = std::move(groups);
    spdlog::debug("Notify groups updated ({} configured)", groups_.size());
}

std::optional<core::NotifyGroup> WebhookNotifier::findGroup(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(groups_.begin(), groups_.end(),
                           [&name](const core::NotifyGroup& g) { return g.name == name; });
    if (it == groups_.end()) {
        return std::nullopt;
    }
    return *it;
}

bool WebhookNotifier::send(const std::string& group, const std::string& message) {
    auto target = findGroup(group);
    if (!target) {
        spdlog::error("Cannot deliver notification: unknown notify group '{}'", group);
        return false;
    }
    if (!target->enabled) {
        spdlog::error("Cannot deliver notification: notify group '{}' is disabled", group);
        return false;
    }
    if (target->url.empty()) {
        spdlog::error("Cannot deliver notification: notify group '{}' has no URL", group);
        return false;
    }

    auto payload = buildPayload(*target, message, std::chrono::system_clock::now());
    spdlog::info("Sending notification to group '{}' ({})", group, target->providerToString());

    QMetaObject::invokeMethod(
        this, [this, target = *target, payload]() { post(target, payload); },
        Qt::QueuedConnection);
    return true;
}

void WebhookNotifier::post(const core::NotifyGroup& group, const std::string& payload) {
    std::map<std::string, std::string> headers{{"Content-Type", "application/json"},
                                               {"User-Agent", "ConnMon"}};

    httpClient_->postAsync(
        group.url, QByteArray::fromStdString(payload), headers, group.timeoutMs,
        [this, name = group.name](const HttpResponse& response) {
            if (response.success) {
                spdlog::info("Notification delivered to group '{}' (status: {})", name,
                             response.statusCode);
                emit delivered(QString::fromStdString(name));
            } else {
                spdlog::error("Notification delivery to group '{}' failed: {}", name,
                              response.errorMessage);
                emit deliveryFailed(QString::fromStdString(name),
                                    QString::fromStdString(response.errorMessage));
            }
        });
}

std::string WebhookNotifier::buildPayload(const core::NotifyGroup& group,
                                          const std::string& message,
                                          std::chrono::system_clock::time_point timestamp) {
    nlohmann::json payload;

    switch (group.provider) {
    case core::WebhookProvider::Slack:
        payload["text"] = message;
        break;
    case core::WebhookProvider::Discord:
        payload["username"] = "ConnMon";
        payload["content"] = message;
        break;
    case core::WebhookProvider::Generic:
        payload["group"] = group.name;
        payload["message"] = message;
        payload["timestamp"] = formatTimestamp(timestamp);
        payload["source"] = "connmon";
        break;
    }

    return payload.dump();
}

} // namespace connmon::infra
