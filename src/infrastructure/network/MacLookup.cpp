#include "infrastructure/network/MacLookup.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <regex>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace connmon::infra {

namespace {

const std::regex& macPattern() {
    static const std::regex pattern(
        "([0-9A-Fa-f]{1,2}[:-][0-9A-Fa-f]{1,2}[:-][0-9A-Fa-f]{1,2}[:-]"
        "[0-9A-Fa-f]{1,2}[:-][0-9A-Fa-f]{1,2}[:-][0-9A-Fa-f]{1,2})");
    return pattern;
}

} // namespace

MacLookup::MacLookup(std::chrono::milliseconds pokeTimeout) : pokeTimeout_(pokeTimeout) {}

std::optional<std::string> MacLookup::lookup(const std::string& ip) {
    auto address = canonicalAddress(ip);
    if (!address) {
        spdlog::debug("MAC lookup skipped for invalid address '{}'", ip);
        return std::nullopt;
    }

    if (auto mac = readNeighbourTable(*address)) {
        return mac;
    }

    poke(*address);

    if (auto mac = readNeighbourTable(*address)) {
        return mac;
    }

    spdlog::debug("No MAC address found for {}", *address);
    return std::nullopt;
}

std::optional<std::string> MacLookup::canonicalAddress(const std::string& ip) {
    if (ip.find('%') != std::string::npos) {
        return std::nullopt;
    }

    asio::error_code ec;
    auto address = asio::ip::make_address(ip, ec);
    if (ec) {
        return std::nullopt;
    }
    if (address.is_v6()) {
        return asio::ip::address_v6(address.to_v6().to_bytes()).to_string();
    }
    return address.to_string();
}

std::optional<std::string> MacLookup::readNeighbourTable(const std::string& ip) {
    std::ifstream arp("/proc/net/arp");
    if (arp) {
        std::stringstream buffer;
        buffer << arp.rdbuf();
        if (auto mac = parseProcArp(buffer.str(), ip)) {
            return mac;
        }
    }

    if (auto output = runCommand({"ip", "neigh", "show", ip})) {
        if (auto mac = parseCommandOutput(*output)) {
            return mac;
        }
    }
    if (auto output = runCommand({"arp", "-n", ip})) {
        if (auto mac = parseCommandOutput(*output)) {
            return mac;
        }
    }
    return std::nullopt;
}

std::optional<std::string> MacLookup::runCommand(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe(fds) != 0) {
        spdlog::debug("Failed to create pipe for '{}'", args.front());
        return std::nullopt;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        spdlog::debug("Failed to fork for '{}'", args.front());
        ::close(fds[0]);
        ::close(fds[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        // Child: stdout into the pipe, stderr discarded, no shell involved.
        ::dup2(fds[1], STDOUT_FILENO);
        int devNull = ::open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDERR_FILENO);
        }
        ::close(fds[0]);
        ::close(fds[1]);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(fds[1]);
    std::string output;
    std::array<char, 256> chunk{};
    for (;;) {
        ssize_t n = ::read(fds[0], chunk.data(), chunk.size());
        if (n > 0) {
            output.append(chunk.data(), static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    ::close(fds[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) == 127) {
        spdlog::debug("'{}' is not available", args.front());
        return std::nullopt;
    }
    return output;
}

void MacLookup::poke(const std::string& ip) {
    asio::error_code ec;
    auto address = asio::ip::make_address(ip, ec);
    if (ec) {
        return;
    }

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.async_connect(asio::ip::tcp::endpoint(address, 80), [](const asio::error_code&) {});
    io.run_for(pokeTimeout_);
    if (!io.stopped()) {
        asio::error_code ignored;
        socket.close(ignored);
        io.run();
    }
}

std::optional<std::string> MacLookup::parseProcArp(const std::string& content,
                                                   const std::string& ip) {
    std::istringstream lines(content);
    std::string line;
    std::getline(lines, line); // header

    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string address, hwType, flags, mac;
        if (!(fields >> address >> hwType >> flags >> mac)) {
            continue;
        }
        if (address == ip) {
            return normalize(mac);
        }
    }
    return std::nullopt;
}

std::optional<std::string> MacLookup::parseCommandOutput(const std::string& output) {
    std::smatch match;
    if (std::regex_search(output, match, macPattern())) {
        return normalize(match[1].str());
    }
    return std::nullopt;
}

std::optional<std::string> MacLookup::normalize(const std::string& mac) {
    std::vector<std::string> octets;
    std::string current;
    for (char c : mac) {
        if (c == ':' || c == '-') {
            octets.push_back(current);
            current.clear();
        } else if (std::isxdigit(static_cast<unsigned char>(c))) {
            current += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        } else {
            return std::nullopt;
        }
    }
    octets.push_back(current);

    if (octets.size() != 6) {
        return std::nullopt;
    }

    std::string result;
    bool allZero = true;
    for (auto& octet : octets) {
        if (octet.empty() || octet.size() > 2) {
            return std::nullopt;
        }
        if (octet.size() == 1) {
            octet.insert(octet.begin(), '0');
        }
        if (octet != "00") {
            allZero = false;
        }
        if (!result.empty()) {
            result += ':';
        }
        result += octet;
    }

    if (allZero) {
        return std::nullopt;
    }
    return result;
}

} // namespace connmon::infra
