#include <catch2/catch_test_macros.hpp>

#include "helpers/TestDoubles.hpp"
#include "monitoring/TargetCoordinator.hpp"

using namespace connmon::monitoring;
using namespace connmon::core;
using connmon::test::FakeResolver;
using connmon::test::FixedMacLookup;
using connmon::test::ScriptedProber;

namespace {

Target tcpTarget(const std::string& host, uint16_t port) {
    Target target;
    target.host = host;
    target.protocol = Protocol::Tcp;
    target.port = port;
    target.deviceName = host;
    return target;
}

struct CoordinatorFixture {
    explicit CoordinatorFixture(Target target,
                                std::shared_ptr<IMacLookup> mac = nullptr) {
        coordinator = std::make_shared<TargetCoordinator>(io, std::move(target), resolver, prober,
                                                          std::move(mac),
                                                          std::chrono::seconds(30), "1.1.1.1");
    }

    asio::io_context io;
    std::shared_ptr<FakeResolver> resolver = std::make_shared<FakeResolver>();
    std::shared_ptr<ScriptedProber> prober = std::make_shared<ScriptedProber>();
    std::shared_ptr<TargetCoordinator> coordinator;
};

} // namespace

TEST_CASE("TargetCoordinator initial state", "[TargetCoordinator]") {
    CoordinatorFixture f(tcpTarget("10.0.0.5", 22));

    CHECK(f.coordinator->state() == TargetState::NotConnected);
    CHECK_FALSE(f.coordinator->latest().has_value());
    CHECK(f.coordinator->entityId() == "10.0.0.5_TCP_22");
    CHECK(f.coordinator->tickCount() == 0);

    auto value = f.coordinator->statusValue();
    CHECK(value.state == "Not Connected");
    CHECK(value.kind == EntityKind::Target);
    CHECK(value.attributes["latency_ms"].is_null());
    CHECK(value.attributes["resolved_ip"].is_null());
    CHECK(value.attributes["mac_address"].is_null());
    CHECK(value.attributes["dns_server"] == "1.1.1.1");
}

TEST_CASE("TargetCoordinator tick", "[TargetCoordinator]") {
    SECTION("Successful probe publishes Connected with latency") {
        CoordinatorFixture f(tcpTarget("10.0.0.5", 22));
        f.prober->setUp("10.0.0.5_TCP_22", 1.23);

        REQUIRE(f.coordinator->refresh());

        CHECK(f.coordinator->state() == TargetState::Connected);
        auto value = f.coordinator->statusValue();
        CHECK(value.state == "Connected");
        CHECK(value.attributes["latency_ms"] == 1.23);
        CHECK(value.attributes["resolved_ip"] == "10.0.0.5");
        CHECK(value.attributes["name"] == "TCP 22");
        CHECK(value.attributes["port"] == 22);
        CHECK_FALSE(value.attributes.contains("error"));
        CHECK(f.coordinator->tickCount() == 1);
    }

    SECTION("Failed probe publishes Disconnected with null latency") {
        CoordinatorFixture f(tcpTarget("10.0.0.5", 22));

        f.coordinator->refresh();

        CHECK(f.coordinator->state() == TargetState::Disconnected);
        auto value = f.coordinator->statusValue();
        CHECK(value.attributes["latency_ms"].is_null());
        CHECK(value.attributes["error"] == "unreachable");
    }

    SECTION("Result callback receives every tick") {
        CoordinatorFixture f(tcpTarget("10.0.0.5", 22));
        std::vector<bool> outcomes;
        f.coordinator->setResultCallback(
            [&outcomes](const Target&, const ProbeResult& result) {
                outcomes.push_back(result.connected);
            });

        f.coordinator->refresh();
        f.prober->setUp("10.0.0.5_TCP_22", 2.0);
        f.coordinator->refresh();

        CHECK(outcomes == std::vector<bool>{false, true});
    }
}

TEST_CASE("TargetCoordinator name resolution", "[TargetCoordinator]") {
    SECTION("Resolved address is cached") {
        CoordinatorFixture f(tcpTarget("web01.example.com", 443));
        f.resolver->setAnswer("web01.example.com", "192.0.2.10");

        f.coordinator->refresh();
        f.coordinator->refresh();
        f.coordinator->refresh();

        CHECK(f.resolver->lookups() == 1);
        CHECK(f.coordinator->cachedIp() == "192.0.2.10");
        CHECK(f.prober->probedIps() ==
              std::vector<std::string>{"192.0.2.10", "192.0.2.10", "192.0.2.10"});
    }

    SECTION("Resolution failure skips the probe and retries next tick") {
        CoordinatorFixture f(tcpTarget("missing.example.com", 443));

        f.coordinator->refresh();

        CHECK(f.prober->calls() == 0);
        CHECK_FALSE(f.coordinator->isResolved());
        CHECK(f.coordinator->state() == TargetState::Disconnected);
        auto value = f.coordinator->statusValue();
        CHECK(value.attributes["resolved_ip"].is_null());
        CHECK(value.attributes["error"] == "resolution failed");

        f.resolver->setAnswer("missing.example.com", "192.0.2.20");
        f.coordinator->refresh();

        CHECK(f.prober->calls() == 1);
        CHECK(f.coordinator->isResolved());
        CHECK(f.resolver->lookups() == 2);
    }

    SECTION("IP literal is used without a lookup") {
        CoordinatorFixture f(tcpTarget("10.0.0.5", 22));
        f.coordinator->refresh();
        CHECK(f.resolver->lookups() == 0);
        CHECK(f.prober->probedIps() == std::vector<std::string>{"10.0.0.5"});
    }
}

TEST_CASE("TargetCoordinator MAC lookup", "[TargetCoordinator]") {
    auto mac = std::make_shared<FixedMacLookup>("52:54:00:12:34:56");
    CoordinatorFixture f(tcpTarget("10.0.0.5", 22), mac);

    f.coordinator->refresh();
    f.coordinator->refresh();

    CHECK(mac->calls == 1);
    CHECK(f.coordinator->cachedMac() == "52:54:00:12:34:56");
    CHECK(f.coordinator->statusValue().attributes["mac_address"] == "52:54:00:12:34:56");
    REQUIRE(f.coordinator->latest().has_value());
    CHECK(f.coordinator->latest()->macAddress == "52:54:00:12:34:56");
}

TEST_CASE("TargetCoordinator attributes", "[TargetCoordinator]") {
    SECTION("Composite member carries its kind and service") {
        auto target = tcpTarget("dc01", 389);
        target.memberOf = CompositeKind::AdDc;
        CoordinatorFixture f(target);

        auto value = f.coordinator->statusValue();
        CHECK(value.attributes["member_of"] == "AD_DC");
        CHECK(value.attributes["service"] == "LDAP");
    }

    SECTION("UDP target carries a note") {
        auto target = tcpTarget("10.0.0.5", 161);
        target.protocol = Protocol::Udp;
        CoordinatorFixture f(target);

        CHECK(f.coordinator->statusValue().attributes.contains("note"));
    }

    SECTION("Unexpanded composite reports per-port results") {
        Target target;
        target.host = "10.0.0.9";
        target.protocol = Protocol::Composite;
        target.compositeKind = CompositeKind::Rpc;
        target.compositePorts = {{111, "rpcbind"}, {135, "MS-RPC"}};
        CoordinatorFixture f(target);

        f.prober->setHandler([](const std::string&, const Target&) {
            ProbeResult result;
            result.connected = false;
            result.latencyMs = 0.5;
            result.perPort = std::map<uint16_t, PortProbeResult>{
                {111, {"rpcbind", true, 0.5}},
                {135, {"MS-RPC", false, std::nullopt}},
            };
            return result;
        });
        f.coordinator->refresh();

        auto ports = f.coordinator->statusValue().attributes["per_port"];
        REQUIRE(ports.size() == 2);
        CHECK(ports[0]["port"] == 111);
        CHECK(ports[0]["connected"] == true);
        CHECK(ports[1]["service"] == "MS-RPC");
        CHECK(ports[1]["latency_ms"].is_null());
    }
}

TEST_CASE("TargetCoordinator start and stop", "[TargetCoordinator]") {
    CoordinatorFixture f(tcpTarget("10.0.0.5", 22));
    f.prober->setUp("10.0.0.5_TCP_22", 1.0);

    f.coordinator->start();
    CHECK(f.coordinator->isActive());

    // First tick runs without waiting for the interval.
    f.io.run_for(std::chrono::milliseconds(500));
    CHECK(f.coordinator->tickCount() == 1);
    CHECK(f.coordinator->state() == TargetState::Connected);

    f.coordinator->stop();
    CHECK_FALSE(f.coordinator->isActive());
    f.io.restart();
    f.io.run_for(std::chrono::milliseconds(100));
    CHECK(f.coordinator->tickCount() == 1);
}
