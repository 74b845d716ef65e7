/**
 * @file TargetRegistry.hpp
 * @brief Expansion of configured target entries into concrete probes.
 */

#pragma once

#include "core/types/Target.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <map>
#include <string>
#include <vector>

namespace connmon::monitoring {

/**
 * @brief A target entry that could not be materialized.
 */
struct ConfigurationError {
    size_t index{0};     ///< Position of the entry in the configured list.
    std::string host;    ///< Host as written, may be empty.
    std::string message; ///< What is wrong with the entry.
};

/**
 * @brief All concrete targets of one host.
 *
 * The representative is the host's first target in input order; it supplies
 * device name, alert group and alert delay of the host aggregates.
 */
struct HostGroup {
    std::string host;
    core::Target representative;
    std::vector<std::string> targetKeys; ///< Identity keys in input order.
    std::map<core::CompositeKind, std::vector<std::string>> compositeKeys;

    std::string overallEntityId() const { return host + "_overall"; }
    std::string compositeEntityId(core::CompositeKind kind) const {
        return host + "_" + core::compositeKindToString(kind);
    }
};

/**
 * @brief Result of materializing a configuration.
 */
struct MaterializedTargets {
    std::vector<core::Target> targets; ///< Concrete targets, deduplicated, input order.
    std::vector<HostGroup> hosts;      ///< Hosts in order of first appearance.
    std::vector<ConfigurationError> errors;

    const HostGroup* findHost(const std::string& host) const;
};

/**
 * @brief Validates and expands configured targets.
 *
 * Composite entries (AD_DC, RPC) expand into one TCP target per port unless
 * they set expand to false. A malformed entry is reported as a
 * ConfigurationError and skipped, the other entries are unaffected.
 */
class TargetRegistry {
public:
    static MaterializedTargets materialize(const std::vector<infra::TargetConfig>& entries,
                                           int defaultDelayMinutes = 15);

    /**
     * @brief Converts one entry to its concrete targets.
     * @param error Receives a description if the entry is invalid.
     * @return The targets, empty if the entry is invalid.
     */
    static std::vector<core::Target> expand(const infra::TargetConfig& entry,
                                            int defaultDelayMinutes, std::string& error);
};

} // namespace connmon::monitoring
