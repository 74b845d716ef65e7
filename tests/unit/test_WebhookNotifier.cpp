#include <catch2/catch_test_macros.hpp>

#include "infrastructure/notifications/WebhookNotifier.hpp"

#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>
#include <asio.hpp>
#include <nlohmann/json.hpp>

using namespace connmon::core;
using namespace connmon::infra;

namespace {

static int argc = 1;
static char appName[] = "connmon_tests";
static char* argv[] = {appName, nullptr};

NotifyGroup group(const std::string& name, WebhookProvider provider,
                  const std::string& url = "https://hooks.example/ops") {
    NotifyGroup g;
    g.name = name;
    g.provider = provider;
    g.url = url;
    g.timeoutMs = 2000;
    return g;
}

uint16_t closedPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, {asio::ip::make_address("127.0.0.1"), 0});
    return acceptor.local_endpoint().port();
}

} // namespace

TEST_CASE("WebhookNotifier payloads", "[WebhookNotifier]") {
    auto timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

    SECTION("Slack") {
        auto payload = nlohmann::json::parse(WebhookNotifier::buildPayload(
            group("ops", WebhookProvider::Slack), "web01 has recovered", timestamp));

        CHECK(payload == nlohmann::json{{"text", "web01 has recovered"}});
    }

    SECTION("Discord") {
        auto payload = nlohmann::json::parse(WebhookNotifier::buildPayload(
            group("ops", WebhookProvider::Discord), "web01 has recovered", timestamp));

        CHECK(payload["username"] == "ConnMon");
        CHECK(payload["content"] == "web01 has recovered");
    }

    SECTION("Generic") {
        auto payload = nlohmann::json::parse(WebhookNotifier::buildPayload(
            group("ops", WebhookProvider::Generic), "web01 has recovered", timestamp));

        CHECK(payload["group"] == "ops");
        CHECK(payload["message"] == "web01 has recovered");
        CHECK(payload["timestamp"] == "2023-11-14T22:13:20Z");
        CHECK(payload["source"] == "connmon");
    }
}

TEST_CASE("WebhookNotifier group selection", "[WebhookNotifier]") {
    QCoreApplication app(argc, argv);

    auto disabled = group("quiet", WebhookProvider::Slack);
    disabled.enabled = false;
    WebhookNotifier notifier({group("ops", WebhookProvider::Slack), disabled,
                              group("nourl", WebhookProvider::Generic, "")});

    SECTION("Unknown group is rejected") {
        CHECK_FALSE(notifier.send("missing", "hello"));
    }

    SECTION("Disabled group is rejected") {
        CHECK_FALSE(notifier.send("quiet", "hello"));
    }

    SECTION("Group without URL is rejected") {
        CHECK_FALSE(notifier.send("nourl", "hello"));
    }

    SECTION("Groups can be replaced") {
        REQUIRE(notifier.findGroup("ops").has_value());
        notifier.setGroups({group("dev", WebhookProvider::Discord)});
        CHECK_FALSE(notifier.findGroup("ops").has_value());
        CHECK(notifier.findGroup("dev")->provider == WebhookProvider::Discord);
    }
}

TEST_CASE("WebhookNotifier reports failed delivery", "[WebhookNotifier]") {
    QCoreApplication app(argc, argv);

    auto url = "http://127.0.0.1:" + std::to_string(closedPort()) + "/hook";
    WebhookNotifier notifier({group("ops", WebhookProvider::Generic, url)});

    QEventLoop loop;
    QString failedGroup;
    QObject::connect(&notifier, &WebhookNotifier::deliveryFailed,
                     [&](const QString& name, const QString&) {
                         failedGroup = name;
                         loop.quit();
                     });
    QObject::connect(&notifier, &WebhookNotifier::delivered, [&](const QString&) { loop.quit(); });
    QTimer::singleShot(5000, &loop, &QEventLoop::quit);

    REQUIRE(notifier.send("ops", "web01 has been Disconnected for 15 minutes"));
    loop.exec();

    CHECK(failedGroup == QStringLiteral("ops"));
}
