#pragma once

#include "core/types/Notification.hpp"
#include "infrastructure/crypto/SecureStorage.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace connmon::infra {

/**
 * @brief Polling and probe settings.
 */
struct MonitoringSettings {
    int updateIntervalSeconds{300};  ///< Tick interval of every coordinator (5-300).
    std::string dnsServer{"1.1.1.1"}; ///< Upstream DNS server, IPv4 literal.
    int workerThreads{4};            ///< Size of the probe worker pool.
    int connectTimeoutMs{5000};      ///< TCP/UDP connect timeout.
    int pingTimeoutMs{2000};         ///< ICMP echo timeout.
    int dnsTimeoutMs{2000};          ///< Timeout of one DNS query.
    int dnsLifetimeMs{4000};         ///< Total DNS budget including retries.
    bool macLookup{true};            ///< Whether to look up MAC addresses.
};

/**
 * @brief Alert engine settings.
 */
struct AlertSettingsConfig {
    int sweepIntervalSeconds{60};  ///< Period of the debounce sweep.
    int defaultDelayMinutes{15};   ///< Delay used by targets without alert_delay.
};

/**
 * @brief One user-specified target entry, as written in the config file.
 *
 * Entries are validated and expanded by the target registry, not here, so a
 * malformed entry only affects itself.
 */
struct TargetConfig {
    std::string host;
    std::string protocol{"TCP"};        ///< TCP, UDP, ICMP, AD_DC or RPC.
    std::optional<int> port;
    std::string deviceName;
    std::optional<std::string> alertGroup;
    std::optional<int> alertDelayMinutes;
    std::vector<int> ports;             ///< Composite port override.
    bool expand{true};                  ///< Composite: one coordinator per port.

    bool operator==(const TargetConfig& other) const = default;
};

/**
 * @brief Read-only status API settings.
 */
struct ApiSettings {
    bool enabled{false};
    std::string bindAddress{"127.0.0.1"};
    uint16_t port{8089};
};

/**
 * @brief Log levels and the rotating log file switch.
 */
struct LoggingSettings {
    std::string level{"info"};      ///< Console level.
    std::string fileLevel{"debug"}; ///< Rotating file level.
    bool file{true};                ///< Whether to write connmon.log.
};

/**
 * @brief Complete application configuration.
 */
struct AppConfig {
    MonitoringSettings monitoring;
    AlertSettingsConfig alerts;
    std::vector<TargetConfig> targets;
    std::vector<core::NotifyGroup> notifyGroups;
    ApiSettings api;
    LoggingSettings logging;
};

/**
 * @brief Manages the JSON configuration file.
 *
 * Handles loading and saving of `config.json` in the config directory and
 * keeps encrypted secrets in its "secure" section.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Directory holding config.json and the secret key.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults if absent.
     * @return True if loaded successfully, false on IO or parse errors.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Encrypts and stores a secret, then saves the file.
     * @return True if the value was stored and saved.
     */
    bool setSecureValue(const std::string& key, const std::string& value);

    /**
     * @brief Retrieves and decrypts a secret.
     * @return Decrypted value if found, nullopt otherwise.
     */
    std::optional<std::string> getSecureValue(const std::string& key) const;

    /**
     * @brief Returns the notify groups with empty URLs filled in from the
     * secure value "notify.<name>.url".
     */
    std::vector<core::NotifyGroup> resolvedNotifyGroups() const;

    /**
     * @brief Returns a copy of the config with resolved notify group URLs.
     */
    AppConfig resolvedConfig() const;

    std::filesystem::path configPath() const { return configPath_; }
    std::filesystem::path logPath() const { return configDir_ / "connmon.log"; }
    std::string configDir() const { return configDir_.string(); }

    /**
     * @brief Parses a configuration document, clamping out-of-range values.
     * @throws nlohmann::json::exception on type mismatches.
     */
    static AppConfig parse(const nlohmann::json& j);

    /**
     * @brief Serializes a configuration document.
     */
    static nlohmann::json serialize(const AppConfig& config);

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
    std::unique_ptr<SecureStorage> secureStorage_;
    nlohmann::json secureValues_ = nlohmann::json::object();
};

} // namespace connmon::infra
