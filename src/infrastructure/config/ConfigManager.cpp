#include "infrastructure/config/ConfigManager.hpp"

#include <asio/ip/address.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace connmon::infra {

namespace {

constexpr int MIN_UPDATE_INTERVAL = 5;
constexpr int MAX_UPDATE_INTERVAL = 300;
constexpr int MIN_ALERT_DELAY = 1;
constexpr int MAX_ALERT_DELAY = 60;

int clampSetting(const char* name, int value, int low, int high) {
    int clamped = std::clamp(value, low, high);
    if (clamped != value) {
        spdlog::warn("{} {} out of range [{}, {}], using {}", name, value, low, high, clamped);
    }
    return clamped;
}

int positiveSetting(const char* name, int value, int fallback) {
    if (value > 0) {
        return value;
    }
    spdlog::warn("{} must be positive, using {}", name, fallback);
    return fallback;
}

std::string secureUrlKey(const std::string& group) {
    return "notify." + group + ".url";
}

TargetConfig targetFromJson(const nlohmann::json& t) {
    TargetConfig target;
    target.host = t.value("host", "");
    target.protocol = t.value("protocol", "TCP");
    if (t.contains("port") && !t["port"].is_null()) {
        // Non-integer ports become 0 so the registry rejects the entry.
        target.port = t["port"].is_number_integer() ? t["port"].get<int>() : 0;
    }
    target.deviceName = t.value("device_name", "");
    if (t.contains("alert_group") && t["alert_group"].is_string()) {
        target.alertGroup = t["alert_group"].get<std::string>();
    }
    if (t.contains("alert_delay") && t["alert_delay"].is_number_integer()) {
        target.alertDelayMinutes = t["alert_delay"].get<int>();
    }
    if (t.contains("ports") && t["ports"].is_array()) {
        for (const auto& p : t["ports"]) {
            target.ports.push_back(p.is_number_integer() ? p.get<int>() : 0);
        }
    }
    target.expand = t.value("expand", true);
    return target;
}

nlohmann::json targetToJson(const TargetConfig& target) {
    nlohmann::json t;
    t["host"] = target.host;
    t["protocol"] = target.protocol;
    if (target.port) {
        t["port"] = *target.port;
    }
    if (!target.deviceName.empty()) {
        t["device_name"] = target.deviceName;
    }
    if (target.alertGroup) {
        t["alert_group"] = *target.alertGroup;
    }
    if (target.alertDelayMinutes) {
        t["alert_delay"] = *target.alertDelayMinutes;
    }
    if (!target.ports.empty()) {
        t["ports"] = target.ports;
    }
    if (!target.expand) {
        t["expand"] = false;
    }
    return t;
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    std::error_code ec;
    std::filesystem::create_directories(configDir_, ec);
    if (ec) {
        spdlog::error("Failed to create config directory {}: {}", configDir_.string(),
                      ec.message());
    }

    configPath_ = configDir_ / "config.json";
    secureStorage_ = std::make_unique<SecureStorage>(configDir_ / ".key");
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, writing defaults to {}", configPath_.string());
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        config_ = parse(j);
        secureValues_ = j.contains("secure") && j["secure"].is_object() ? j["secure"]
                                                                        : nlohmann::json::object();

        spdlog::info("Loaded configuration from {} ({} targets, {} notify groups)",
                     configPath_.string(), config_.targets.size(), config_.notifyGroups.size());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = serialize(config_);
        if (!secureValues_.empty()) {
            j["secure"] = secureValues_;
        }

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

AppConfig ConfigManager::parse(const nlohmann::json& j) {
    AppConfig config;

    if (j.contains("monitoring")) {
        const auto& m = j["monitoring"];
        auto& mon = config.monitoring;
        mon.updateIntervalSeconds =
            clampSetting("update_interval_seconds", m.value("update_interval_seconds", 300),
                         MIN_UPDATE_INTERVAL, MAX_UPDATE_INTERVAL);
        mon.dnsServer = m.value("dns_server", "1.1.1.1");
        asio::error_code ec;
        auto dns = asio::ip::make_address(mon.dnsServer, ec);
        if (ec || !dns.is_v4()) {
            spdlog::warn("dns_server '{}' is not an IPv4 address, using 1.1.1.1", mon.dnsServer);
            mon.dnsServer = "1.1.1.1";
        }
        mon.workerThreads = positiveSetting("worker_threads", m.value("worker_threads", 4), 4);
        mon.connectTimeoutMs =
            positiveSetting("connect_timeout_ms", m.value("connect_timeout_ms", 5000), 5000);
        mon.pingTimeoutMs =
            positiveSetting("ping_timeout_ms", m.value("ping_timeout_ms", 2000), 2000);
        mon.dnsTimeoutMs = positiveSetting("dns_timeout_ms", m.value("dns_timeout_ms", 2000), 2000);
        mon.dnsLifetimeMs =
            positiveSetting("dns_lifetime_ms", m.value("dns_lifetime_ms", 4000), 4000);
        mon.macLookup = m.value("mac_lookup", true);
    }

    if (j.contains("alerts")) {
        const auto& a = j["alerts"];
        config.alerts.sweepIntervalSeconds =
            positiveSetting("sweep_interval_seconds", a.value("sweep_interval_seconds", 60), 60);
        config.alerts.defaultDelayMinutes =
            clampSetting("default_delay_minutes", a.value("default_delay_minutes", 15),
                         MIN_ALERT_DELAY, MAX_ALERT_DELAY);
    }

    if (j.contains("targets")) {
        for (const auto& t : j["targets"]) {
            config.targets.push_back(targetFromJson(t));
        }
    }

    if (j.contains("notify_groups")) {
        for (const auto& g : j["notify_groups"]) {
            core::NotifyGroup group;
            group.name = g.value("name", "");
            group.provider = core::NotifyGroup::providerFromString(g.value("provider", "generic"));
            group.url = g.value("url", "");
            group.timeoutMs = positiveSetting("timeout_ms", g.value("timeout_ms", 5000), 5000);
            group.enabled = g.value("enabled", true);
            if (group.name.empty()) {
                spdlog::error("Ignoring notify group without a name");
                continue;
            }
            config.notifyGroups.push_back(group);
        }
    }

    if (j.contains("api")) {
        const auto& a = j["api"];
        config.api.enabled = a.value("enabled", false);
        config.api.bindAddress = a.value("bind_address", "127.0.0.1");
        config.api.port = a.value("port", static_cast<uint16_t>(8089));
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logging.level = l.value("level", "info");
        config.logging.fileLevel = l.value("file_level", "debug");
        config.logging.file = l.value("file", true);
    }

    return config;
}

nlohmann::json ConfigManager::serialize(const AppConfig& config) {
    nlohmann::json j;

    const auto& mon = config.monitoring;
    j["monitoring"]["update_interval_seconds"] = mon.updateIntervalSeconds;
    j["monitoring"]["dns_server"] = mon.dnsServer;
    j["monitoring"]["worker_threads"] = mon.workerThreads;
    j["monitoring"]["connect_timeout_ms"] = mon.connectTimeoutMs;
    j["monitoring"]["ping_timeout_ms"] = mon.pingTimeoutMs;
    j["monitoring"]["dns_timeout_ms"] = mon.dnsTimeoutMs;
    j["monitoring"]["dns_lifetime_ms"] = mon.dnsLifetimeMs;
    j["monitoring"]["mac_lookup"] = mon.macLookup;

    j["alerts"]["sweep_interval_seconds"] = config.alerts.sweepIntervalSeconds;
    j["alerts"]["default_delay_minutes"] = config.alerts.defaultDelayMinutes;

    j["targets"] = nlohmann::json::array();
    for (const auto& target : config.targets) {
        j["targets"].push_back(targetToJson(target));
    }

    j["notify_groups"] = nlohmann::json::array();
    for (const auto& group : config.notifyGroups) {
        j["notify_groups"].push_back({{"name", group.name},
                                      {"provider", group.providerToString()},
                                      {"url", group.url},
                                      {"timeout_ms", group.timeoutMs},
                                      {"enabled", group.enabled}});
    }

    j["api"]["enabled"] = config.api.enabled;
    j["api"]["bind_address"] = config.api.bindAddress;
    j["api"]["port"] = config.api.port;

    j["logging"]["level"] = config.logging.level;
    j["logging"]["file_level"] = config.logging.fileLevel;
    j["logging"]["file"] = config.logging.file;

    return j;
}

bool ConfigManager::setSecureValue(const std::string& key, const std::string& value) {
    auto encrypted = secureStorage_->encrypt(value);
    if (!encrypted) {
        return false;
    }
    secureValues_[key] = *encrypted;
    return save();
}

std::optional<std::string> ConfigManager::getSecureValue(const std::string& key) const {
    if (!secureValues_.contains(key) || !secureValues_[key].is_string()) {
        return std::nullopt;
    }
    return secureStorage_->decrypt(secureValues_[key].get<std::string>());
}

std::vector<core::NotifyGroup> ConfigManager::resolvedNotifyGroups() const {
    auto groups = config_.notifyGroups;
    for (auto& group : groups) {
        if (!group.url.empty()) {
            continue;
        }
        if (auto url = getSecureValue(secureUrlKey(group.name))) {
            group.url = *url;
        } else {
            spdlog::warn("Notify group '{}' has no URL configured", group.name);
        }
    }
    return groups;
}

AppConfig ConfigManager::resolvedConfig() const {
    auto config = config_;
    config.notifyGroups = resolvedNotifyGroups();
    return config;
}

} // namespace connmon::infra
