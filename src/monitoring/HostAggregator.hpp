/**
 * @file HostAggregator.hpp
 * @brief Derived per-host statuses over a host's coordinators.
 */

#pragma once

#include "core/services/IStatusBoard.hpp"
#include "core/types/Alert.hpp"
#include "core/types/Status.hpp"
#include "monitoring/TargetCoordinator.hpp"
#include "monitoring/TargetRegistry.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace connmon::monitoring {

/**
 * @brief Aggregates connected flags into one status.
 *
 * Empty input is Unknown; all true is Connected; none true is Disconnected;
 * any mix is PartiallyConnected.
 */
core::AggregateStatus aggregateStatus(const std::vector<bool>& connected);

/**
 * @brief Aggregates coordinators; one without a result counts as not connected.
 */
core::AggregateStatus aggregateStatus(
    const std::vector<std::shared_ptr<TargetCoordinator>>& coordinators);

/**
 * @brief Computes the "overall" and "composite" status values of one host.
 *
 * Values are recomputed from the coordinators' latest results on every call
 * and never cached.
 */
class HostAggregator {
public:
    HostAggregator(HostGroup group, std::vector<std::shared_ptr<TargetCoordinator>> coordinators);

    const HostGroup& group() const { return group_; }

    core::StatusValue overallStatus() const;

    /**
     * @brief Status over the coordinators of one composite kind.
     * @return nullopt if the host has no target of that kind.
     */
    std::optional<core::StatusValue> compositeStatus(core::CompositeKind kind) const;

    /**
     * @brief Overall value followed by every composite value.
     */
    std::vector<core::StatusValue> statusValues() const;

    /**
     * @brief Recomputes statusValues() and writes them to the board.
     *
     * Publishing is serialized per host. A call made while another publish
     * of this host is in progress (on any thread, or re-entrantly from a
     * board subscriber) returns immediately and the running publisher
     * recomputes once more, so the last values written always reflect the
     * latest coordinator results.
     */
    void publish(core::IStatusBoard& board);

    /**
     * @brief Entity ids of the values produced by statusValues().
     */
    std::vector<std::string> entityIds() const;

    /**
     * @brief Checks whether a target identity key belongs to this host.
     */
    bool contains(const std::string& targetKey) const;

    /**
     * @brief Alert settings taken from the host's representative target.
     */
    core::AlertSettings alertSettings() const;

private:
    std::vector<std::shared_ptr<TargetCoordinator>> coordinatorsFor(
        const std::vector<std::string>& keys) const;

    HostGroup group_;
    std::vector<std::shared_ptr<TargetCoordinator>> coordinators_;

    std::mutex publishMutex_;
    bool publishing_{false};
    bool republish_{false};
};

} // namespace connmon::monitoring
