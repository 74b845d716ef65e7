/**
 * @file Monitor.hpp
 * @brief Wiring of coordinators, aggregators, status board and alert engine.
 */

#pragma once

#include "core/services/IMacLookup.hpp"
#include "core/services/INotificationSink.hpp"
#include "core/services/IProber.hpp"
#include "core/services/IResolver.hpp"
#include "core/services/IStatusBoard.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "monitoring/AlertEngine.hpp"
#include "monitoring/HostAggregator.hpp"
#include "monitoring/TargetCoordinator.hpp"
#include "monitoring/TargetRegistry.hpp"

#include <asio.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace connmon::monitoring {

/**
 * @brief Network services used by the coordinators.
 *
 * A null macLookup disables MAC address lookups.
 */
struct MonitorServices {
    std::shared_ptr<core::IResolver> resolver;
    std::shared_ptr<core::IProber> prober;
    std::shared_ptr<core::IMacLookup> macLookup;
};

/**
 * @brief Runs one monitoring configuration.
 *
 * configure() materializes the targets, creates one coordinator per target
 * and one aggregator per host, publishes their initial values and registers
 * the host aggregates with a fresh alert engine. Every completed tick
 * publishes the target's value followed by its host's aggregate values.
 *
 * @note The io_context's threads must be stopped before the Monitor is
 *       destroyed, since coordinators call back into it from those threads.
 */
class Monitor {
public:
    Monitor(asio::io_context& io, std::shared_ptr<core::IStatusBoard> board,
            std::shared_ptr<core::INotificationSink> sink,
            AlertEngine::Clock clock = [] { return std::chrono::system_clock::now(); });
    ~Monitor();

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    /**
     * @brief Uses the given services instead of the ones built from config.
     */
    void setServices(MonitorServices services);

    /**
     * @brief Builds every component from a configuration.
     * @return False if the configuration yielded no valid target.
     */
    bool configure(const infra::AppConfig& config);

    /**
     * @brief Starts every coordinator and the alert sweep.
     */
    void start();

    /**
     * @brief Stops every coordinator and detaches the alert engine.
     */
    void stop();

    /**
     * @brief Replaces every component with ones built from a new configuration.
     */
    bool reconfigure(const infra::AppConfig& config);

    bool isRunning() const { return running_.load(); }

    std::vector<ConfigurationError> configurationErrors() const;
    std::vector<core::Target> targets() const;
    std::shared_ptr<TargetCoordinator> coordinator(const std::string& entityId) const;
    std::vector<std::shared_ptr<TargetCoordinator>> coordinators() const;
    std::shared_ptr<HostAggregator> aggregator(const std::string& host) const;
    std::shared_ptr<AlertEngine> alertEngine() const;

    /**
     * @brief Builds the production resolver, prober and MAC lookup.
     */
    static MonitorServices defaultServices(const infra::MonitoringSettings& settings);

private:
    void onResult(uint64_t generation, const core::Target& target, const core::ProbeResult& result);
    void publishHost(HostAggregator& aggregator);

    asio::io_context& io_;
    std::shared_ptr<core::IStatusBoard> board_;
    std::shared_ptr<core::INotificationSink> sink_;
    AlertEngine::Clock clock_;
    std::optional<MonitorServices> serviceOverrides_;

    mutable std::mutex mutex_;
    uint64_t generation_{0};
    MaterializedTargets materialized_;
    std::map<std::string, std::shared_ptr<TargetCoordinator>> coordinators_;
    std::map<std::string, std::shared_ptr<HostAggregator>> aggregators_;
    std::shared_ptr<AlertEngine> alertEngine_;
    std::chrono::seconds sweepInterval_{60};
    std::atomic<bool> running_{false};
};

} // namespace connmon::monitoring
