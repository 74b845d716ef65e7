/**
 * @file Status.hpp
 * @brief Status values published for targets and host aggregates.
 *
 * Defines the per-target and per-host status enumerations and the named
 * status value (state string + attribute bag) exposed on the status board.
 */

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace connmon::core {

/**
 * @brief Status of a single concrete target.
 */
enum class TargetState : int {
    NotConnected = 0, ///< No completed probe yet
    Connected = 1,    ///< Last probe succeeded
    Disconnected = 2  ///< Last probe failed
};

/**
 * @brief Derived status over a set of targets.
 */
enum class AggregateStatus : int {
    Unknown = 0,            ///< Empty set, nothing to aggregate
    Connected = 1,          ///< Every target connected
    PartiallyConnected = 2, ///< Some but not all targets connected
    Disconnected = 3        ///< No target connected
};

/**
 * @brief What a status-board entity describes.
 */
enum class EntityKind : int {
    Target = 0,   ///< One concrete probe
    Overall = 1,  ///< A host's overall aggregate
    Composite = 2 ///< A host's composite-service aggregate
};

/**
 * @brief A named status value with its attribute bag.
 */
struct StatusValue {
    std::string entityId;             ///< Unique entity name on the board
    EntityKind kind{EntityKind::Target};
    std::string state;                ///< Status string, e.g. "Connected"
    nlohmann::json attributes = nlohmann::json::object(); ///< Structured details
    std::chrono::system_clock::time_point updatedAt;

    bool operator==(const StatusValue& other) const = default;
};

std::string targetStateToString(TargetState state);
std::string aggregateStatusToString(AggregateStatus status);
std::string entityKindToString(EntityKind kind);

/**
 * @brief Checks whether a status string is a problem state for alerting.
 *
 * Problem states are "Disconnected", "Not Connected" and "Partially Connected".
 * "Connected" and "Unknown" are not.
 */
bool isProblemState(const std::string& state);

/**
 * @brief Checks whether a status string means fully connected.
 */
bool isConnectedState(const std::string& state);

} // namespace connmon::core
