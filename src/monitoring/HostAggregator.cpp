#include "monitoring/HostAggregator.hpp"

#include <algorithm>

namespace connmon::monitoring {

namespace {

nlohmann::json latencyJson(const std::optional<double>& latency) {
    return latency ? nlohmann::json(*latency) : nlohmann::json(nullptr);
}

nlohmann::json serviceEntry(const TargetCoordinator& coordinator) {
    const auto& target = coordinator.target();
    auto result = coordinator.latest();

    nlohmann::json entry;
    entry["entity_id"] = coordinator.entityId();
    entry["name"] = target.displayName();
    entry["protocol"] = target.protocolLabel();
    if (target.port) {
        entry["port"] = *target.port;
    }
    if (target.memberOf && target.port) {
        entry["service"] = core::CompositePorts::serviceName(*target.memberOf, *target.port);
    }
    entry["status"] = core::targetStateToString(coordinator.state());
    entry["latency_ms"] = latencyJson(result ? result->latencyMs : std::nullopt);
    return entry;
}

} // namespace

core::AggregateStatus aggregateStatus(const std::vector<bool>& connected) {
    if (connected.empty()) {
        return core::AggregateStatus::Unknown;
    }
    auto up = std::count(connected.begin(), connected.end(), true);
    if (up == static_cast<std::ptrdiff_t>(connected.size())) {
        return core::AggregateStatus::Connected;
    }
    if (up == 0) {
        return core::AggregateStatus::Disconnected;
    }
    return core::AggregateStatus::PartiallyConnected;
}

core::AggregateStatus aggregateStatus(
    const std::vector<std::shared_ptr<TargetCoordinator>>& coordinators) {
    std::vector<bool> connected;
    connected.reserve(coordinators.size());
    for (const auto& coordinator : coordinators) {
        auto result = coordinator->latest();
        connected.push_back(result && result->connected);
    }
    return aggregateStatus(connected);
}

HostAggregator::HostAggregator(HostGroup group,
                               std::vector<std::shared_ptr<TargetCoordinator>> coordinators)
    : group_(std::move(group)), coordinators_(std::move(coordinators)) {}

std::vector<std::shared_ptr<TargetCoordinator>> HostAggregator::coordinatorsFor(
    const std::vector<std::string>& keys) const {
    std::vector<std::shared_ptr<TargetCoordinator>> result;
    for (const auto& key : keys) {
        auto it = std::find_if(coordinators_.begin(), coordinators_.end(),
                               [&key](const auto& c) { return c->entityId() == key; });
        if (it != coordinators_.end()) {
            result.push_back(*it);
        }
    }
    return result;
}

bool HostAggregator::contains(const std::string& targetKey) const {
    return std::find(group_.targetKeys.begin(), group_.targetKeys.end(), targetKey) !=
           group_.targetKeys.end();
}

core::StatusValue HostAggregator::overallStatus() const {
    auto coordinators = coordinatorsFor(group_.targetKeys);

    core::StatusValue value;
    value.entityId = group_.overallEntityId();
    value.kind = core::EntityKind::Overall;
    value.state = core::aggregateStatusToString(aggregateStatus(coordinators));
    value.updatedAt = std::chrono::system_clock::now();

    auto services = nlohmann::json::array();
    int connected = 0;
    for (const auto& coordinator : coordinators) {
        services.push_back(serviceEntry(*coordinator));
        if (coordinator->state() == core::TargetState::Connected) {
            ++connected;
        }
    }

    value.attributes["host"] = group_.host;
    value.attributes["device_name"] = group_.representative.deviceName;
    value.attributes["monitored_services"] = services;
    value.attributes["connected_count"] = connected;
    value.attributes["total_count"] = coordinators.size();
    return value;
}

std::optional<core::StatusValue> HostAggregator::compositeStatus(core::CompositeKind kind) const {
    auto keys = group_.compositeKeys.find(kind);
    if (keys == group_.compositeKeys.end()) {
        return std::nullopt;
    }
    auto coordinators = coordinatorsFor(keys->second);

    // An unexpanded composite is one coordinator; aggregate its per-port breakdown.
    std::vector<bool> connected;
    auto services = nlohmann::json::array();
    for (const auto& coordinator : coordinators) {
        auto result = coordinator->latest();
        if (coordinator->target().protocol == core::Protocol::Composite) {
            for (const auto& [port, service] : coordinator->target().compositePorts) {
                std::optional<core::PortProbeResult> outcome;
                if (result && result->perPort && result->perPort->contains(port)) {
                    outcome = result->perPort->at(port);
                }
                bool up = outcome && outcome->connected;
                connected.push_back(up);

                nlohmann::json entry;
                entry["name"] = "TCP " + std::to_string(port);
                entry["protocol"] = "TCP";
                entry["port"] = port;
                entry["service"] = service;
                entry["status"] = !result ? core::targetStateToString(core::TargetState::NotConnected)
                                  : up    ? core::targetStateToString(core::TargetState::Connected)
                                          : core::targetStateToString(core::TargetState::Disconnected);
                entry["latency_ms"] = latencyJson(outcome ? outcome->latencyMs : std::nullopt);
                services.push_back(entry);
            }
        } else {
            connected.push_back(result && result->connected);
            services.push_back(serviceEntry(*coordinator));
        }
    }

    core::StatusValue value;
    value.entityId = group_.compositeEntityId(kind);
    value.kind = core::EntityKind::Composite;
    value.state = core::aggregateStatusToString(aggregateStatus(connected));
    value.updatedAt = std::chrono::system_clock::now();

    value.attributes["host"] = group_.host;
    value.attributes["device_name"] = group_.representative.deviceName;
    value.attributes["composite_kind"] = core::compositeKindToString(kind);
    value.attributes["monitored_services"] = services;
    value.attributes["connected_count"] = std::count(connected.begin(), connected.end(), true);
    value.attributes["total_count"] = connected.size();
    return value;
}

std::vector<core::StatusValue> HostAggregator::statusValues() const {
    std::vector<core::StatusValue> values{overallStatus()};
    for (const auto& [kind, keys] : group_.compositeKeys) {
        if (auto composite = compositeStatus(kind)) {
            values.push_back(*composite);
        }
    }
    return values;
}

void HostAggregator::publish(core::IStatusBoard& board) {
    {
        std::lock_guard lock(publishMutex_);
        republish_ = true;
        if (publishing_) {
            return;
        }
        publishing_ = true;
    }

    for (;;) {
        {
            std::lock_guard lock(publishMutex_);
            if (!republish_) {
                publishing_ = false;
                return;
            }
            republish_ = false;
        }

        try {
            for (const auto& value : statusValues()) {
                board.publish(value);
            }
        } catch (...) {
            std::lock_guard lock(publishMutex_);
            publishing_ = false;
            throw;
        }
    }
}

std::vector<std::string> HostAggregator::entityIds() const {
    std::vector<std::string> ids{group_.overallEntityId()};
    for (const auto& [kind, keys] : group_.compositeKeys) {
        ids.push_back(group_.compositeEntityId(kind));
    }
    return ids;
}

core::AlertSettings HostAggregator::alertSettings() const {
    const auto& rep = group_.representative;
    return core::AlertSettings{rep.deviceName, rep.alertGroup, rep.alertDelayMinutes};
}

} // namespace connmon::monitoring
