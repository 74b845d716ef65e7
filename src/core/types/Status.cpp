#include "core/types/Status.hpp"

namespace connmon::core {

namespace {

constexpr const char* kConnected = "Connected";
constexpr const char* kDisconnected = "Disconnected";
constexpr const char* kNotConnected = "Not Connected";
constexpr const char* kPartiallyConnected = "Partially Connected";

} // namespace

std::string targetStateToString(TargetState state) {
    switch (state) {
    case TargetState::NotConnected:
        return kNotConnected;
    case TargetState::Connected:
        return kConnected;
    case TargetState::Disconnected:
        return kDisconnected;
    }
    return kNotConnected;
}

std::string aggregateStatusToString(AggregateStatus status) {
    switch (status) {
    case AggregateStatus::Unknown:
        return "Unknown";
    case AggregateStatus::Connected:
        return kConnected;
    case AggregateStatus::PartiallyConnected:
        return kPartiallyConnected;
    case AggregateStatus::Disconnected:
        return kDisconnected;
    }
    return "Unknown";
}

std::string entityKindToString(EntityKind kind) {
    switch (kind) {
    case EntityKind::Target:
        return "target";
    case EntityKind::Overall:
        return "overall";
    case EntityKind::Composite:
        return "composite";
    }
    return "target";
}

bool isProblemState(const std::string& state) {
    return state == kDisconnected || state == kNotConnected || state == kPartiallyConnected;
}

bool isConnectedState(const std::string& state) {
    return state == kConnected;
}

} // namespace connmon::core
