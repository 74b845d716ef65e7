#include "core/types/Target.hpp"

namespace connmon::core {

std::string Target::validate() const {
    if (host.empty()) {
        return "host must not be empty";
    }

    switch (protocol) {
    case Protocol::Tcp:
    case Protocol::Udp:
        if (!port) {
            return protocolToString(protocol) + " target requires a port";
        }
        if (*port == 0) {
            return "port must be between 1 and 65535";
        }
        break;
    case Protocol::Icmp:
        if (port) {
            return "ICMP target must not carry a port";
        }
        break;
    case Protocol::Composite:
        if (!compositeKind) {
            return "composite target requires a composite kind";
        }
        if (port) {
            return "composite target must not carry a port";
        }
        break;
    }

    if (alertDelayMinutes < 1 || alertDelayMinutes > 60) {
        return "alert delay must be between 1 and 60 minutes";
    }
    return {};
}

std::string Target::identityKey() const {
    return host + "_" + protocolLabel() + "_" + (port ? std::to_string(*port) : "ping");
}

std::string Target::displayName() const {
    if (protocol == Protocol::Icmp) {
        return "ICMP (Ping)";
    }
    if (port) {
        return protocolLabel() + " " + std::to_string(*port);
    }
    return protocolLabel();
}

std::string Target::protocolLabel() const {
    if (protocol == Protocol::Composite && compositeKind) {
        return compositeKindToString(*compositeKind);
    }
    return protocolToString(protocol);
}

std::string protocolToString(Protocol protocol) {
    switch (protocol) {
    case Protocol::Tcp:
        return "TCP";
    case Protocol::Udp:
        return "UDP";
    case Protocol::Icmp:
        return "ICMP";
    case Protocol::Composite:
        return "COMPOSITE";
    }
    return "TCP";
}

std::string compositeKindToString(CompositeKind kind) {
    switch (kind) {
    case CompositeKind::AdDc:
        return "AD_DC";
    case CompositeKind::Rpc:
        return "RPC";
    }
    return "AD_DC";
}

std::optional<CompositeKind> compositeKindFromString(const std::string& str) {
    if (str == "AD_DC")
        return CompositeKind::AdDc;
    if (str == "RPC")
        return CompositeKind::Rpc;
    return std::nullopt;
}

const PortServiceMap& CompositePorts::forKind(CompositeKind kind) {
    static const PortServiceMap adDc = {
        {88, "Kerberos"},          {139, "NetBIOS"},
        {389, "LDAP"},             {445, "SMB"},
        {464, "Kerberos Password Change"},
        {636, "LDAPS"},            {3268, "Global Catalog"},
        {3269, "Global Catalog SSL"},
    };
    static const PortServiceMap rpc = {
        {111, "rpcbind"},
        {135, "MS-RPC"},
        {139, "NetBIOS"},
        {445, "SMB"},
    };

    return kind == CompositeKind::Rpc ? rpc : adDc;
}

std::string CompositePorts::serviceName(CompositeKind kind, uint16_t port) {
    const auto& services = forKind(kind);
    auto it = services.find(port);
    if (it != services.end()) {
        return it->second;
    }
    return "TCP " + std::to_string(port);
}

} // namespace connmon::core
