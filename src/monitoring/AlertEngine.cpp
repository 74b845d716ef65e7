#include "monitoring/AlertEngine.hpp"

#include "core/types/Status.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace connmon::monitoring {

namespace {

constexpr size_t MAX_HISTORY = 100;

} // namespace

AlertEngine::AlertEngine(std::shared_ptr<core::IStatusBoard> board,
                         std::shared_ptr<core::INotificationSink> sink, Clock clock)
    : board_(std::move(board)), sink_(std::move(sink)), clock_(std::move(clock)) {}

AlertEngine::~AlertEngine() {
    if (subscriptionId_ && board_) {
        board_->unsubscribe(*subscriptionId_);
    }
}

void AlertEngine::attach() {
    std::weak_ptr<AlertEngine> weak = weak_from_this();
    auto id = board_->subscribe(
        [weak](const std::optional<core::StatusValue>& /*previous*/,
               const core::StatusValue& current) {
            if (auto self = weak.lock()) {
                self->handleStatus(current.entityId, current.state);
            }
        });

    std::lock_guard lock(mutex_);
    subscriptionId_ = id;
}

void AlertEngine::detach() {
    stopSweep();

    std::optional<int> id;
    {
        std::lock_guard lock(mutex_);
        id.swap(subscriptionId_);
    }
    if (id) {
        board_->unsubscribe(*id);
    }
}

void AlertEngine::watch(const std::string& entityId, core::AlertSettings settings) {
    {
        std::lock_guard lock(mutex_);
        if (!settings.alertsEnabled()) {
            spdlog::debug("Alerts disabled for {}: no alert group", entityId);
        }
        watches_[entityId] = Watch{std::move(settings), {}};
    }

    if (auto current = board_->get(entityId); current && core::isProblemState(current->state)) {
        handleStatus(entityId, current->state);
    }
}

void AlertEngine::unwatch(const std::string& entityId) {
    std::lock_guard lock(mutex_);
    watches_.erase(entityId);
}

void AlertEngine::reset() {
    std::lock_guard lock(mutex_);
    watches_.clear();
}

void AlertEngine::handleStatus(const std::string& entityId, const std::string& status) {
    {
        std::lock_guard lock(mutex_);
        auto it = watches_.find(entityId);
        if (it == watches_.end() || !it->second.settings.alertsEnabled()) {
            return;
        }

        auto& watch = it->second;
        auto& record = watch.record;
        auto now = clock_();

        if (core::isProblemState(status)) {
            if (!record.tracking()) {
                record.disconnectSince = now;
                record.notified = false;
                spdlog::info("{} entered {}, alerting in {} min unless it recovers", entityId,
                             status, watch.settings.alertDelayMinutes);
            }
            record.lastStatus = status;
            if (auto alert = checkDelay(entityId, watch, now)) {
                outbox_.push_back(std::move(*alert));
            }
        } else if (core::isConnectedState(status)) {
            if (record.tracking()) {
                if (record.notified) {
                    core::Alert alert;
                    alert.entityId = entityId;
                    alert.type = core::AlertType::Recovered;
                    alert.group = *watch.settings.alertGroup;
                    alert.status = status;
                    alert.message = core::formatRecoveryMessage(watch.settings.deviceName);
                    alert.timestamp = now;
                    outbox_.push_back(std::move(alert));
                } else {
                    spdlog::info("{} recovered before its alert delay elapsed", entityId);
                }
                record.disconnectSince.reset();
                record.notified = false;
            }
            record.lastStatus = status;
        } else {
            record.lastStatus = status;
        }
    }

    deliverPending();
}

std::optional<core::Alert> AlertEngine::checkDelay(const std::string& entityId, Watch& watch,
                                                   std::chrono::system_clock::time_point now) {
    auto& record = watch.record;
    if (!record.tracking() || record.notified || !core::isProblemState(record.lastStatus)) {
        return std::nullopt;
    }

    auto delay = std::chrono::minutes(watch.settings.alertDelayMinutes);
    if (now - *record.disconnectSince < delay) {
        return std::nullopt;
    }

    record.notified = true;

    core::Alert alert;
    alert.entityId = entityId;
    alert.type = core::AlertType::Problem;
    alert.group = *watch.settings.alertGroup;
    alert.status = record.lastStatus;
    alert.message = core::formatProblemMessage(watch.settings.deviceName, record.lastStatus,
                                               watch.settings.alertDelayMinutes);
    alert.timestamp = now;
    return alert;
}

void AlertEngine::sweep() {
    {
        std::lock_guard lock(mutex_);
        auto now = clock_();
        for (auto& [entityId, watch] : watches_) {
            if (!watch.settings.alertsEnabled()) {
                continue;
            }
            if (auto alert = checkDelay(entityId, watch, now)) {
                outbox_.push_back(std::move(*alert));
            }
        }
    }

    deliverPending();
}

void AlertEngine::deliverPending() {
    {
        std::lock_guard lock(mutex_);
        if (delivering_) {
            return;
        }
        delivering_ = true;
    }

    try {
        for (;;) {
            core::Alert alert;
            {
                std::lock_guard lock(mutex_);
                if (outbox_.empty()) {
                    delivering_ = false;
                    return;
                }
                alert = std::move(outbox_.front());
                outbox_.pop_front();
            }

            spdlog::info("{} alert for {} to group '{}': {}", alert.typeToString(), alert.entityId,
                         alert.group, alert.message);

            try {
                alert.delivered = sink_ && sink_->send(alert.group, alert.message);
            } catch (const std::exception& e) {
                spdlog::error("Notification sink raised for {}: {}", alert.entityId, e.what());
                alert.delivered = false;
            }
            if (!alert.delivered) {
                spdlog::error("Failed to deliver {} alert for {} to group '{}'",
                              alert.typeToString(), alert.entityId, alert.group);
            }

            std::vector<AlertCallback> callbacks;
            {
                std::lock_guard lock(mutex_);
                history_.push_front(alert);
                if (history_.size() > MAX_HISTORY) {
                    history_.pop_back();
                }
                callbacks = subscribers_;
            }
            for (const auto& callback : callbacks) {
                callback(alert);
            }
        }
    } catch (...) {
        std::lock_guard lock(mutex_);
        delivering_ = false;
        throw;
    }
}

void AlertEngine::startSweep(asio::io_context& io, std::chrono::seconds period) {
    std::lock_guard lock(timerMutex_);
    if (sweeping_) {
        return;
    }
    if (!sweepStrand_) {
        sweepStrand_.emplace(asio::make_strand(io));
        sweepTimer_ = std::make_unique<asio::steady_timer>(*sweepStrand_);
    }
    sweepPeriod_ = period;
    sweeping_ = true;

    asio::post(*sweepStrand_, [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
            self->scheduleSweep();
        }
    });
    spdlog::debug("Alert sweep every {}s", period.count());
}

void AlertEngine::stopSweep() {
    std::lock_guard lock(timerMutex_);
    if (!sweeping_) {
        return;
    }
    sweeping_ = false;
    asio::post(*sweepStrand_, [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
            self->sweepTimer_->cancel();
        }
    });
}

void AlertEngine::scheduleSweep() {
    std::chrono::seconds period;
    {
        std::lock_guard lock(timerMutex_);
        if (!sweeping_) {
            return;
        }
        period = sweepPeriod_;
    }

    sweepTimer_->expires_after(period);
    sweepTimer_->async_wait([weak = weak_from_this()](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto self = weak.lock()) {
            self->sweep();
            self->scheduleSweep();
        }
    });
}

std::optional<core::AlertRecord> AlertEngine::record(const std::string& entityId) const {
    std::lock_guard lock(mutex_);
    auto it = watches_.find(entityId);
    if (it == watches_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<core::Alert> AlertEngine::recentAlerts(size_t limit) const {
    std::lock_guard lock(mutex_);
    auto count = std::min(limit, history_.size());
    return {history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(count)};
}

size_t AlertEngine::watchedCount() const {
    std::lock_guard lock(mutex_);
    return watches_.size();
}

void AlertEngine::subscribe(AlertCallback callback) {
    std::lock_guard lock(mutex_);
    subscribers_.push_back(std::move(callback));
}

} // namespace connmon::monitoring
