/**
 * @file AlertEngine.hpp
 * @brief Debounced problem and recovery notifications for host aggregates.
 */

#pragma once

#include "core/services/INotificationSink.hpp"
#include "core/services/IStatusBoard.hpp"
#include "core/types/Alert.hpp"

#include <asio.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace connmon::monitoring {

/**
 * @brief Watches aggregate entities and sends debounced alerts.
 *
 * An entity entering a problem state (Disconnected, Not Connected, Partially
 * Connected) starts a debounce window. Once the entity has stayed in a
 * problem state for its alert delay, one problem message is sent to its
 * notify group. Returning to Connected ends the window and sends a recovery
 * message if the problem message had gone out.
 *
 * Evaluation is driven by status board writes and by a periodic sweep, so an
 * alert fires on time even if no further status change arrives. Both paths
 * take the same mutex for the whole evaluation of an entity. Decided alerts
 * are queued under that mutex and sent after it has been released, one at a
 * time and in the order they were decided, whichever thread ends up sending.
 *
 * @note Must be owned by a shared_ptr.
 */
class AlertEngine : public std::enable_shared_from_this<AlertEngine> {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using AlertCallback = std::function<void(const core::Alert&)>;

    /**
     * @param board Status board whose writes drive evaluation.
     * @param sink Destination of alert messages.
     * @param clock Time source, replaceable in tests.
     */
    AlertEngine(std::shared_ptr<core::IStatusBoard> board,
                std::shared_ptr<core::INotificationSink> sink,
                Clock clock = [] { return std::chrono::system_clock::now(); });

    ~AlertEngine();

    AlertEngine(const AlertEngine&) = delete;
    AlertEngine& operator=(const AlertEngine&) = delete;

    /**
     * @brief Subscribes to the status board.
     */
    void attach();

    /**
     * @brief Unsubscribes from the status board and stops the sweep.
     */
    void detach();

    /**
     * @brief Starts watching an entity.
     *
     * If the entity's current board value is already a problem state it is
     * treated as a fresh transition into that state. Entities without an
     * alert group are registered but never tracked.
     */
    void watch(const std::string& entityId, core::AlertSettings settings);

    void unwatch(const std::string& entityId);

    /**
     * @brief Forgets every watched entity and tracking record.
     */
    void reset();

    /**
     * @brief Evaluates a new status of a watched entity.
     */
    void handleStatus(const std::string& entityId, const std::string& status);

    /**
     * @brief Re-evaluates the delay of every tracked, not yet notified entity.
     */
    void sweep();

    /**
     * @brief Runs sweep() every period on the given context.
     */
    void startSweep(asio::io_context& io, std::chrono::seconds period);

    void stopSweep();

    std::optional<core::AlertRecord> record(const std::string& entityId) const;
    std::vector<core::Alert> recentAlerts(size_t limit = 100) const;
    size_t watchedCount() const;

    /**
     * @brief Registers a callback for every alert the engine emits.
     */
    void subscribe(AlertCallback callback);

private:
    struct Watch {
        core::AlertSettings settings;
        core::AlertRecord record;
    };

    std::optional<core::Alert> checkDelay(const std::string& entityId, Watch& watch,
                                          std::chrono::system_clock::time_point now);
    void deliverPending();
    void scheduleSweep();

    std::shared_ptr<core::IStatusBoard> board_;
    std::shared_ptr<core::INotificationSink> sink_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, Watch> watches_;
    std::deque<core::Alert> history_;
    std::deque<core::Alert> outbox_;
    bool delivering_{false};
    std::vector<AlertCallback> subscribers_;
    std::optional<int> subscriptionId_;

    std::mutex timerMutex_;
    std::optional<asio::strand<asio::io_context::executor_type>> sweepStrand_;
    std::unique_ptr<asio::steady_timer> sweepTimer_;
    std::chrono::seconds sweepPeriod_{60};
    bool sweeping_{false};
};

} // namespace connmon::monitoring
