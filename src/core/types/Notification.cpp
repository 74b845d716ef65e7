#include "core/types/Notification.hpp"

namespace connmon::core {

std::string NotifyGroup::providerToString() const {
    switch (provider) {
    case WebhookProvider::Slack:
        return "slack";
    case WebhookProvider::Discord:
        return "discord";
    case WebhookProvider::Generic:
        return "generic";
    }
    return "generic";
}

WebhookProvider NotifyGroup::providerFromString(const std::string& str) {
    if (str == "slack")
        return WebhookProvider::Slack;
    if (str == "discord")
        return WebhookProvider::Discord;
    return WebhookProvider::Generic;
}

} // namespace connmon::core
