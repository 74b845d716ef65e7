#include "monitoring/TargetRegistry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>

namespace connmon::monitoring {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

bool validPort(int port) {
    return port >= 1 && port <= 65535;
}

} // namespace

const HostGroup* MaterializedTargets::findHost(const std::string& host) const {
    auto it = std::find_if(hosts.begin(), hosts.end(),
                           [&host](const HostGroup& group) { return group.host == host; });
    return it == hosts.end() ? nullptr : &*it;
}

std::vector<core::Target> TargetRegistry::expand(const infra::TargetConfig& entry,
                                                 int defaultDelayMinutes, std::string& error) {
    core::Target base;
    base.host = trim(entry.host);
    if (base.host.empty()) {
        error = "host must not be empty";
        return {};
    }

    base.deviceName = trim(entry.deviceName);
    if (base.deviceName.empty()) {
        base.deviceName = base.host;
    }

    if (entry.alertGroup && !trim(*entry.alertGroup).empty()) {
        base.alertGroup = trim(*entry.alertGroup);
    }

    int delay = entry.alertDelayMinutes.value_or(defaultDelayMinutes);
    base.alertDelayMinutes = std::clamp(delay, 1, 60);
    if (base.alertDelayMinutes != delay) {
        spdlog::warn("alert_delay {} of {} out of range [1, 60], using {}", delay, base.host,
                     base.alertDelayMinutes);
    }

    auto protocol = toUpper(trim(entry.protocol));
    std::vector<core::Target> targets;

    if (protocol == "TCP" || protocol == "UDP") {
        base.protocol = protocol == "TCP" ? core::Protocol::Tcp : core::Protocol::Udp;
        if (!entry.port) {
            error = protocol + " target requires a port";
            return {};
        }
        if (!validPort(*entry.port)) {
            error = "port " + std::to_string(*entry.port) + " is not between 1 and 65535";
            return {};
        }
        base.port = static_cast<uint16_t>(*entry.port);
        targets.push_back(base);
    } else if (protocol == "ICMP") {
        base.protocol = core::Protocol::Icmp;
        if (entry.port) {
            spdlog::warn("Ignoring port {} of ICMP target {}", *entry.port, base.host);
        }
        targets.push_back(base);
    } else if (auto kind = core::compositeKindFromString(protocol)) {
        if (entry.port) {
            spdlog::warn("Ignoring port {} of {} target {}", *entry.port, protocol, base.host);
        }

        core::PortServiceMap ports;
        if (entry.ports.empty()) {
            ports = core::CompositePorts::forKind(*kind);
        } else {
            for (int port : entry.ports) {
                if (!validPort(port)) {
                    error = "composite port " + std::to_string(port) +
                            " is not between 1 and 65535";
                    return {};
                }
                auto p = static_cast<uint16_t>(port);
                ports[p] = core::CompositePorts::serviceName(*kind, p);
            }
        }

        if (entry.expand) {
            for (const auto& [port, service] : ports) {
                core::Target member = base;
                member.protocol = core::Protocol::Tcp;
                member.port = port;
                member.memberOf = *kind;
                targets.push_back(member);
            }
        } else {
            base.protocol = core::Protocol::Composite;
            base.compositeKind = *kind;
            base.compositePorts = ports;
            targets.push_back(base);
        }
    } else {
        error = "unknown protocol '" + entry.protocol + "'";
        return {};
    }

    for (const auto& target : targets) {
        auto problem = target.validate();
        if (!problem.empty()) {
            error = problem;
            return {};
        }
    }
    return targets;
}

MaterializedTargets TargetRegistry::materialize(const std::vector<infra::TargetConfig>& entries,
                                                int defaultDelayMinutes) {
    MaterializedTargets result;
    std::set<std::string> seen;

    for (size_t i = 0; i < entries.size(); ++i) {
        std::string error;
        auto targets = expand(entries[i], defaultDelayMinutes, error);
        if (!error.empty()) {
            spdlog::error("Invalid target #{} ({}): {}", i + 1, entries[i].host, error);
            result.errors.push_back({i, entries[i].host, error});
            continue;
        }

        for (auto& target : targets) {
            auto key = target.identityKey();
            bool duplicate = !seen.insert(key).second;

            auto hostIt = std::find_if(result.hosts.begin(), result.hosts.end(),
                                       [&target](const HostGroup& g) { return g.host == target.host; });
            if (hostIt == result.hosts.end()) {
                result.hosts.push_back(HostGroup{target.host, target, {}, {}});
                hostIt = std::prev(result.hosts.end());
            }

            // A duplicate still counts towards its composite; the coordinator is shared.
            auto kind = target.memberOf ? target.memberOf : target.compositeKind;
            if (kind) {
                auto& members = hostIt->compositeKeys[*kind];
                if (std::find(members.begin(), members.end(), key) == members.end()) {
                    members.push_back(key);
                }
            }

            if (duplicate) {
                spdlog::warn("Duplicate target {} skipped", key);
                continue;
            }

            hostIt->targetKeys.push_back(key);
            result.targets.push_back(std::move(target));
        }
    }

    spdlog::info("Materialized {} targets on {} hosts ({} invalid entries)",
                 result.targets.size(), result.hosts.size(), result.errors.size());
    return result;
}

} // namespace connmon::monitoring
