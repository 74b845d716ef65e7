#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

using namespace connmon::infra;
using namespace connmon::core;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() /
                     ("connmon_config_test_" + std::to_string(std::random_device{}()))) {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void write(const std::string& content) const {
        std::ofstream file(configDir_ / "config.json");
        file << content;
    }

private:
    void cleanup() {
        std::error_code ec;
        std::filesystem::remove_all(configDir_, ec);
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        TestConfigDir parent;
        auto nested = parent.path() / "nested" / "connmon";
        REQUIRE_FALSE(std::filesystem::exists(nested));

        ConfigManager manager(nested);

        REQUIRE(std::filesystem::is_directory(nested));
    }

    SECTION("Sets config and log paths") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        CHECK(manager.configPath() == testDir.path() / "config.json");
        CHECK(manager.logPath() == testDir.path() / "connmon.log");
        CHECK(manager.configDir() == testDir.path().string());
    }
}

TEST_CASE("ConfigManager defaults", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());

    SECTION("Missing file writes defaults") {
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));

        const auto& config = manager.config();
        CHECK(config.monitoring.updateIntervalSeconds == 300);
        CHECK(config.monitoring.dnsServer == "1.1.1.1");
        CHECK(config.monitoring.workerThreads == 4);
        CHECK(config.alerts.defaultDelayMinutes == 15);
        CHECK(config.alerts.sweepIntervalSeconds == 60);
        CHECK(config.targets.empty());
        CHECK_FALSE(config.api.enabled);
        CHECK(config.api.port == 8089);
        CHECK(config.logging.level == "info");
    }
}

TEST_CASE("ConfigManager parses configuration", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Targets and notify groups") {
        testDir.write(R"({
            "monitoring": {"update_interval_seconds": 30, "dns_server": "9.9.9.9"},
            "alerts": {"default_delay_minutes": 5},
            "targets": [
                {"host": "10.0.0.5", "protocol": "TCP", "port": 22, "alert_group": "ops",
                 "alert_delay": 1},
                {"host": "dc01", "protocol": "AD_DC", "ports": [88, 389], "expand": false,
                 "device_name": "Domain Controller"}
            ],
            "notify_groups": [
                {"name": "ops", "provider": "slack", "url": "https://hooks.example/ops"}
            ],
            "api": {"enabled": true, "port": 9000}
        })");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        const auto& config = manager.config();

        CHECK(config.monitoring.updateIntervalSeconds == 30);
        CHECK(config.monitoring.dnsServer == "9.9.9.9");
        CHECK(config.alerts.defaultDelayMinutes == 5);

        REQUIRE(config.targets.size() == 2);
        CHECK(config.targets[0].host == "10.0.0.5");
        CHECK(config.targets[0].port == 22);
        CHECK(config.targets[0].alertGroup == "ops");
        CHECK(config.targets[0].alertDelayMinutes == 1);
        CHECK(config.targets[1].protocol == "AD_DC");
        CHECK(config.targets[1].ports == std::vector<int>{88, 389});
        CHECK_FALSE(config.targets[1].expand);
        CHECK(config.targets[1].deviceName == "Domain Controller");

        REQUIRE(config.notifyGroups.size() == 1);
        CHECK(config.notifyGroups[0].provider == WebhookProvider::Slack);
        CHECK(config.notifyGroups[0].url == "https://hooks.example/ops");

        CHECK(config.api.enabled);
        CHECK(config.api.port == 9000);
    }

    SECTION("Out of range values are clamped") {
        auto config = ConfigManager::parse(nlohmann::json::parse(R"({
            "monitoring": {"update_interval_seconds": 1, "worker_threads": 0},
            "alerts": {"default_delay_minutes": 120, "sweep_interval_seconds": -5}
        })"));

        CHECK(config.monitoring.updateIntervalSeconds == 5);
        CHECK(config.monitoring.workerThreads == 4);
        CHECK(config.alerts.defaultDelayMinutes == 60);
        CHECK(config.alerts.sweepIntervalSeconds == 60);

        config = ConfigManager::parse(
            nlohmann::json::parse(R"({"monitoring": {"update_interval_seconds": 3600}})"));
        CHECK(config.monitoring.updateIntervalSeconds == 300);
    }

    SECTION("Non-IPv4 DNS server falls back") {
        auto config = ConfigManager::parse(
            nlohmann::json::parse(R"({"monitoring": {"dns_server": "dns.example.com"}})"));
        CHECK(config.monitoring.dnsServer == "1.1.1.1");

        config = ConfigManager::parse(
            nlohmann::json::parse(R"({"monitoring": {"dns_server": "2606:4700::1111"}})"));
        CHECK(config.monitoring.dnsServer == "1.1.1.1");
    }

    SECTION("Non-integer port becomes zero") {
        auto config = ConfigManager::parse(nlohmann::json::parse(
            R"({"targets": [{"host": "h", "protocol": "TCP", "port": "ssh"}]})"));
        REQUIRE(config.targets.size() == 1);
        CHECK(config.targets[0].port == 0);
    }

    SECTION("Notify group without a name is skipped") {
        auto config = ConfigManager::parse(nlohmann::json::parse(
            R"({"notify_groups": [{"url": "https://x"}, {"name": "ops"}]})"));
        REQUIRE(config.notifyGroups.size() == 1);
        CHECK(config.notifyGroups[0].name == "ops");
        CHECK(config.notifyGroups[0].provider == WebhookProvider::Generic);
    }

    SECTION("Invalid JSON fails to load") {
        testDir.write("{ not json");
        ConfigManager manager(testDir.path());
        CHECK_FALSE(manager.load());
    }
}

TEST_CASE("ConfigManager save and reload", "[ConfigManager]") {
    TestConfigDir testDir;

    TargetConfig target;
    target.host = "web01";
    target.protocol = "ICMP";
    target.alertGroup = "ops";

    {
        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        manager.config().monitoring.updateIntervalSeconds = 60;
        manager.config().targets.push_back(target);
        manager.config().notifyGroups.push_back(
            NotifyGroup{"ops", WebhookProvider::Discord, "https://discord.example", 3000, true});
        REQUIRE(manager.save());
    }

    ConfigManager reloaded(testDir.path());
    REQUIRE(reloaded.load());

    CHECK(reloaded.config().monitoring.updateIntervalSeconds == 60);
    REQUIRE(reloaded.config().targets.size() == 1);
    CHECK(reloaded.config().targets[0] == target);
    REQUIRE(reloaded.config().notifyGroups.size() == 1);
    CHECK(reloaded.config().notifyGroups[0].provider == WebhookProvider::Discord);
    CHECK(reloaded.config().notifyGroups[0].timeoutMs == 3000);
}

TEST_CASE("ConfigManager secure values", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Secure value survives a reload and is not stored in plain text") {
        {
            ConfigManager manager(testDir.path());
            REQUIRE(manager.load());
            REQUIRE(manager.setSecureValue("notify.ops.url", "https://hooks.example/secret"));
        }

        std::ifstream file(testDir.path() / "config.json");
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        CHECK(content.find("https://hooks.example/secret") == std::string::npos);

        ConfigManager reloaded(testDir.path());
        REQUIRE(reloaded.load());
        CHECK(reloaded.getSecureValue("notify.ops.url") == "https://hooks.example/secret");
    }

    SECTION("Missing secure value") {
        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        CHECK_FALSE(manager.getSecureValue("notify.none.url").has_value());
    }

    SECTION("Notify group without URL uses the secure value") {
        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        manager.config().notifyGroups.push_back(NotifyGroup{"ops", WebhookProvider::Slack, "", 5000, true});
        manager.config().notifyGroups.push_back(NotifyGroup{"dev", WebhookProvider::Slack, "", 5000, true});
        REQUIRE(manager.setSecureValue("notify.ops.url", "https://hooks.example/ops"));

        auto groups = manager.resolvedNotifyGroups();
        REQUIRE(groups.size() == 2);
        CHECK(groups[0].url == "https://hooks.example/ops");
        CHECK(groups[1].url.empty());

        CHECK(manager.config().notifyGroups[0].url.empty());
        CHECK(manager.resolvedConfig().notifyGroups[0].url == "https://hooks.example/ops");
    }
}
