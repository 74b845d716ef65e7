/**
 * @file TargetCoordinator.hpp
 * @brief Periodic resolve-probe loop of one concrete target.
 */

#pragma once

#include "core/services/IMacLookup.hpp"
#include "core/services/IProber.hpp"
#include "core/services/IResolver.hpp"
#include "core/types/ProbeResult.hpp"
#include "core/types/Status.hpp"
#include "core/types/Target.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace connmon::monitoring {

/**
 * @brief Owns one target, its cached address and its latest probe result.
 *
 * On each tick the coordinator resolves the host if it has no cached IP yet,
 * probes the cached IP and, once, looks up the MAC address. A failed
 * resolution is retried on the next tick only. Ticks of one coordinator never
 * overlap: the timer is armed again after a tick has finished.
 *
 * @note Must be owned by a shared_ptr; timer handlers keep it alive.
 */
class TargetCoordinator : public std::enable_shared_from_this<TargetCoordinator> {
public:
    /**
     * @brief Called after every completed tick with the fresh result.
     */
    using ResultCallback =
        std::function<void(const core::Target& target, const core::ProbeResult& result)>;

    TargetCoordinator(asio::io_context& io, core::Target target,
                      std::shared_ptr<core::IResolver> resolver,
                      std::shared_ptr<core::IProber> prober,
                      std::shared_ptr<core::IMacLookup> macLookup,
                      std::chrono::seconds interval, std::string dnsServer);

    ~TargetCoordinator();

    TargetCoordinator(const TargetCoordinator&) = delete;
    TargetCoordinator& operator=(const TargetCoordinator&) = delete;

    /**
     * @brief Runs the first tick as soon as a worker is free, then one tick
     * per interval.
     */
    void start();

    /**
     * @brief Cancels the timer. A tick already in progress still completes.
     */
    void stop();

    /**
     * @brief Runs one tick on the calling thread.
     * @return False if a tick is already running for this target.
     */
    bool refresh();

    void setResultCallback(ResultCallback callback);

    const core::Target& target() const { return target_; }
    std::string entityId() const { return target_.identityKey(); }

    std::optional<core::ProbeResult> latest() const;
    core::TargetState state() const;

    /**
     * @brief Builds the named status value with its attribute bag.
     */
    core::StatusValue statusValue() const;

    bool isActive() const { return active_.load(); }
    bool isResolved() const;
    std::optional<std::string> cachedIp() const;
    std::optional<std::string> cachedMac() const;
    uint64_t tickCount() const { return ticks_.load(); }

private:
    void scheduleNextTick(std::chrono::steady_clock::duration delay);
    core::ProbeResult runTick();

    core::Target target_;
    std::shared_ptr<core::IResolver> resolver_;
    std::shared_ptr<core::IProber> prober_;
    std::shared_ptr<core::IMacLookup> macLookup_;
    std::chrono::seconds interval_;
    std::string dnsServer_;

    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;
    std::atomic<bool> active_{false};
    std::atomic<bool> ticking_{false};
    std::atomic<uint64_t> ticks_{0};

    mutable std::mutex mutex_;
    std::optional<std::string> resolvedIp_;
    std::optional<std::string> macAddress_;
    bool macAttempted_{false};
    std::optional<core::ProbeResult> latest_;
    ResultCallback callback_;
};

} // namespace connmon::monitoring
