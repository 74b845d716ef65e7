#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace connmon::core {

enum class AlertType : int { Problem = 0, Recovered = 1 };

/**
 * @brief Alert configuration of a watched entity, taken from its host's
 * representative target.
 */
struct AlertSettings {
    std::string deviceName;
    std::optional<std::string> alertGroup;
    int alertDelayMinutes{15};

    [[nodiscard]] bool alertsEnabled() const { return alertGroup && !alertGroup->empty(); }
};

/**
 * @brief Debounce tracking state of one watched entity.
 *
 * disconnectSince is armed on entry into a problem state and only cleared on
 * return to Connected. notified is only set once the delay elapsed.
 */
struct AlertRecord {
    std::optional<std::chrono::system_clock::time_point> disconnectSince;
    bool notified{false};
    std::string lastStatus;

    [[nodiscard]] bool tracking() const { return disconnectSince.has_value(); }

    bool operator==(const AlertRecord& other) const = default;
};

/**
 * @brief A notification emitted by the alert engine.
 */
struct Alert {
    std::string entityId;
    AlertType type{AlertType::Problem};
    std::string group;
    std::string status;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    bool delivered{false};

    [[nodiscard]] std::string typeToString() const;

    bool operator==(const Alert& other) const = default;
};

/**
 * @brief Builds "<device> has been <status> for <N> minutes".
 */
std::string formatProblemMessage(const std::string& deviceName, const std::string& status,
                                 int minutes);

/**
 * @brief Builds "<device> has recovered".
 */
std::string formatRecoveryMessage(const std::string& deviceName);

} // namespace connmon::core
