#include <catch2/catch_test_macros.hpp>

#include "core/types/Alert.hpp"
#include "core/types/Status.hpp"
#include "core/types/Target.hpp"

using namespace connmon::core;

TEST_CASE("Target identity key", "[Target]") {
    SECTION("TCP target uses host, protocol and port") {
        Target target;
        target.host = "10.0.0.5";
        target.protocol = Protocol::Tcp;
        target.port = 22;

        REQUIRE(target.identityKey() == "10.0.0.5_TCP_22");
    }

    SECTION("ICMP target uses ping suffix") {
        Target target;
        target.host = "gw.example.com";
        target.protocol = Protocol::Icmp;

        REQUIRE(target.identityKey() == "gw.example.com_ICMP_ping");
    }

    SECTION("Unexpanded composite uses its kind as label") {
        Target target;
        target.host = "dc01";
        target.protocol = Protocol::Composite;
        target.compositeKind = CompositeKind::AdDc;

        REQUIRE(target.identityKey() == "dc01_AD_DC_ping");
    }

    SECTION("Same host and port with different protocols are distinct") {
        Target tcp;
        tcp.host = "h";
        tcp.protocol = Protocol::Tcp;
        tcp.port = 53;

        Target udp = tcp;
        udp.protocol = Protocol::Udp;

        REQUIRE(tcp.identityKey() != udp.identityKey());
    }
}

TEST_CASE("Target display name", "[Target]") {
    Target target;
    target.host = "h";

    target.protocol = Protocol::Tcp;
    target.port = 443;
    CHECK(target.displayName() == "TCP 443");

    target.protocol = Protocol::Udp;
    target.port = 161;
    CHECK(target.displayName() == "UDP 161");

    target.protocol = Protocol::Icmp;
    target.port.reset();
    CHECK(target.displayName() == "ICMP (Ping)");

    target.protocol = Protocol::Composite;
    target.compositeKind = CompositeKind::Rpc;
    CHECK(target.displayName() == "RPC");
}

TEST_CASE("Target validation", "[Target]") {
    Target target;
    target.host = "10.0.0.5";
    target.protocol = Protocol::Tcp;
    target.port = 22;

    SECTION("Valid TCP target") {
        REQUIRE(target.validate().empty());
    }

    SECTION("Empty host is rejected") {
        target.host.clear();
        REQUIRE_FALSE(target.validate().empty());
    }

    SECTION("TCP without port is rejected") {
        target.port.reset();
        REQUIRE_FALSE(target.validate().empty());
    }

    SECTION("Port zero is rejected") {
        target.port = 0;
        REQUIRE_FALSE(target.validate().empty());
    }

    SECTION("ICMP with port is rejected") {
        target.protocol = Protocol::Icmp;
        REQUIRE_FALSE(target.validate().empty());
    }

    SECTION("Composite requires a kind") {
        target.protocol = Protocol::Composite;
        target.port.reset();
        REQUIRE_FALSE(target.validate().empty());

        target.compositeKind = CompositeKind::AdDc;
        REQUIRE(target.validate().empty());
    }

    SECTION("Alert delay must be between 1 and 60") {
        target.alertDelayMinutes = 0;
        REQUIRE_FALSE(target.validate().empty());

        target.alertDelayMinutes = 61;
        REQUIRE_FALSE(target.validate().empty());

        target.alertDelayMinutes = 60;
        REQUIRE(target.validate().empty());
    }
}

TEST_CASE("Composite port tables", "[Target]") {
    SECTION("AD_DC default ports") {
        const auto& ports = CompositePorts::forKind(CompositeKind::AdDc);
        REQUIRE(ports.size() == 8);
        CHECK(ports.at(88) == "Kerberos");
        CHECK(ports.at(389) == "LDAP");
        CHECK(ports.at(445) == "SMB");
        CHECK(ports.at(3269) == "Global Catalog SSL");
    }

    SECTION("RPC default ports") {
        const auto& ports = CompositePorts::forKind(CompositeKind::Rpc);
        REQUIRE(ports.size() == 4);
        CHECK(ports.count(111) == 1);
        CHECK(ports.count(135) == 1);
    }

    SECTION("Unknown port gets a generic service name") {
        CHECK(CompositePorts::serviceName(CompositeKind::AdDc, 9999) == "TCP 9999");
    }

    SECTION("Kind names round trip") {
        CHECK(compositeKindFromString("AD_DC") == CompositeKind::AdDc);
        CHECK(compositeKindFromString("RPC") == CompositeKind::Rpc);
        CHECK_FALSE(compositeKindFromString("SMTP").has_value());
    }
}

TEST_CASE("Status classification", "[Status]") {
    CHECK(isProblemState("Disconnected"));
    CHECK(isProblemState("Not Connected"));
    CHECK(isProblemState("Partially Connected"));
    CHECK_FALSE(isProblemState("Connected"));
    CHECK_FALSE(isProblemState("Unknown"));

    CHECK(isConnectedState("Connected"));
    CHECK_FALSE(isConnectedState("Partially Connected"));

    CHECK(aggregateStatusToString(AggregateStatus::PartiallyConnected) == "Partially Connected");
    CHECK(targetStateToString(TargetState::NotConnected) == "Not Connected");
}

TEST_CASE("Alert message formatting", "[Alert]") {
    CHECK(formatProblemMessage("web01", "Disconnected", 15) ==
          "web01 has been Disconnected for 15 minutes");
    CHECK(formatRecoveryMessage("web01") == "web01 has recovered");
}
