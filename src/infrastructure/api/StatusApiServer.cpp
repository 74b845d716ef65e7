#include "infrastructure/api/StatusApiServer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

namespace connmon::infra {

namespace {

constexpr size_t MAX_REQUEST_BYTES = 16 * 1024;

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

nlohmann::json statusToJson(const core::StatusValue& value) {
    nlohmann::json j;
    j["entity_id"] = value.entityId;
    j["kind"] = core::entityKindToString(value.kind);
    j["state"] = value.state;
    j["attributes"] = value.attributes;
    j["updated_at"] = std::chrono::duration_cast<std::chrono::seconds>(
                          value.updatedAt.time_since_epoch())
                          .count();
    return j;
}

} // namespace

void ApiResponse::setJson(const nlohmann::json& json) {
    body = json.dump();
    headers["Content-Type"] = "application/json";
}

void ApiResponse::setError(int code, const std::string& message) {
    statusCode = code;
    switch (code) {
    case 400:
        statusText = "Bad Request";
        break;
    case 404:
        statusText = "Not Found";
        break;
    case 405:
        statusText = "Method Not Allowed";
        break;
    case 500:
        statusText = "Internal Server Error";
        break;
    default:
        statusText = "Error";
    }
    setJson({{"error", message}, {"status", code}});
}

std::string ApiResponse::toString() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << statusCode << " " << statusText << "\r\n";
    for (const auto& [key, value] : headers) {
        ss << key << ": " << value << "\r\n";
    }
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;
    return ss.str();
}

StatusApiServer::StatusApiServer(AsioContext& asioContext,
                                 std::shared_ptr<core::IStatusBoard> board,
                                 std::string bindAddress, uint16_t port)
    : asioContext_(asioContext), board_(std::move(board)), bindAddress_(std::move(bindAddress)),
      port_(port) {
    registerRoutes();
}

StatusApiServer::~StatusApiServer() {
    stop();
}

void StatusApiServer::registerRoutes() {
    routes_.push_back({"/api/health", [this](auto& req, auto& res) { handleHealth(req, res); }});
    routes_.push_back(
        {"/api/status", [this](auto& req, auto& res) { handleStatusList(req, res); }});
    routes_.push_back(
        {"/api/status/:entity", [this](auto& req, auto& res) { handleStatusEntity(req, res); }});
    routes_.push_back({"/api/hosts", [this](auto& req, auto& res) { handleHosts(req, res); }});
}

bool StatusApiServer::start() {
    if (running_.load()) {
        return true;
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(bindAddress_), port_);
        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(asioContext_.getContext(), endpoint);
        port_ = acceptor_->local_endpoint().port();

        running_ = true;
        startAccept();
        spdlog::info("Status API listening on {}:{}", bindAddress_, port_);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start status API on {}:{}: {}", bindAddress_, port_, e.what());
        acceptor_.reset();
        return false;
    }
}

void StatusApiServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (acceptor_) {
        asio::error_code ec;
        acceptor_->close(ec);
    }
    spdlog::info("Status API stopped");
}

void StatusApiServer::startAccept() {
    if (!running_.load()) {
        return;
    }

    auto socket = std::make_shared<asio::ip::tcp::socket>(asioContext_.getContext());
    auto self = shared_from_this();

    acceptor_->async_accept(*socket, [this, self, socket](const asio::error_code& ec) {
        if (!ec && running_.load()) {
            readRequest(socket);
        }
        if (running_.load()) {
            startAccept();
        }
    });
}

void StatusApiServer::readRequest(std::shared_ptr<asio::ip::tcp::socket> socket) {
    auto buffer = std::make_shared<asio::streambuf>(MAX_REQUEST_BYTES);
    auto self = shared_from_this();

    asio::async_read_until(
        *socket, *buffer, "\r\n\r\n",
        [this, self, socket, buffer](const asio::error_code& ec, std::size_t /*bytes*/) {
            if (ec) {
                if (ec == asio::error::not_found) {
                    ApiResponse response;
                    response.setError(400, "Request header too large");
                    sendResponse(socket, response);
                }
                return;
            }

            std::string raw((std::istreambuf_iterator<char>(&*buffer)),
                            std::istreambuf_iterator<char>());
            auto request = parseRequest(raw);
            spdlog::debug("Status API request: {}", request.path);
            sendResponse(socket, dispatch(std::move(request)));
        });
}

ApiResponse StatusApiServer::dispatch(ApiRequest request) const {
    ApiResponse response;

    if (request.method != HttpMethod::GET) {
        response.setError(405, "Only GET is supported");
        response.headers["Allow"] = "GET";
        return response;
    }

    for (const auto& route : routes_) {
        if (matchRoute(route.pattern, request.path, request.pathParams)) {
            try {
                route.handler(request, response);
            } catch (const std::exception& e) {
                spdlog::error("Status API error on {}: {}", request.path, e.what());
                response = ApiResponse{};
                response.setError(500, "Internal server error");
            }
            return response;
        }
    }

    response.setError(404, "Endpoint not found");
    return response;
}

void StatusApiServer::sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket,
                                   const ApiResponse& response) {
    auto payload = std::make_shared<std::string>(response.toString());

    asio::async_write(*socket, asio::buffer(*payload),
                      [socket, payload](const asio::error_code& /*ec*/, std::size_t /*bytes*/) {
                          asio::error_code shutdownEc;
                          socket->shutdown(asio::ip::tcp::socket::shutdown_both, shutdownEc);
                      });
}

ApiRequest StatusApiServer::parseRequest(const std::string& rawRequest) {
    ApiRequest request;
    std::istringstream iss(rawRequest);
    std::string line;

    if (std::getline(iss, line)) {
        std::istringstream lineStream(trim(line));
        std::string method, path, version;
        lineStream >> method >> path >> version;

        request.method = parseMethod(method);
        auto queryPos = path.find('?');
        request.path = queryPos == std::string::npos ? path : path.substr(0, queryPos);
    }

    while (std::getline(iss, line) && line != "\r" && !line.empty()) {
        auto colonPos = line.find(':');
        if (colonPos != std::string::npos) {
            std::string key = trim(line.substr(0, colonPos));
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            request.headers[key] = trim(line.substr(colonPos + 1));
        }
    }

    return request;
}

HttpMethod StatusApiServer::parseMethod(const std::string& method) {
    if (method == "GET")
        return HttpMethod::GET;
    if (method == "POST")
        return HttpMethod::POST;
    if (method == "PUT")
        return HttpMethod::PUT;
    if (method == "DELETE")
        return HttpMethod::DELETE;
    if (method == "OPTIONS")
        return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

bool StatusApiServer::matchRoute(const std::string& pattern, const std::string& path,
                                 std::map<std::string, std::string>& pathParams) {
    pathParams.clear();

    std::vector<std::string> patternParts, pathParts;
    std::istringstream patternStream(pattern), pathStream(path);
    std::string part;

    while (std::getline(patternStream, part, '/')) {
        if (!part.empty())
            patternParts.push_back(part);
    }
    while (std::getline(pathStream, part, '/')) {
        if (!part.empty())
            pathParts.push_back(part);
    }

    if (patternParts.size() != pathParts.size()) {
        return false;
    }

    for (size_t i = 0; i < patternParts.size(); ++i) {
        if (patternParts[i].front() == ':') {
            pathParams[patternParts[i].substr(1)] = pathParts[i];
        } else if (patternParts[i] != pathParts[i]) {
            pathParams.clear();
            return false;
        }
    }

    return true;
}

void StatusApiServer::handleHealth(const ApiRequest& /*req*/, ApiResponse& res) const {
    int targets = 0;
    int hosts = 0;
    for (const auto& value : board_->snapshot()) {
        if (value.kind == core::EntityKind::Target) {
            ++targets;
        } else if (value.kind == core::EntityKind::Overall) {
            ++hosts;
        }
    }

    nlohmann::json health;
    health["status"] = "ok";
    health["targets"] = targets;
    health["hosts"] = hosts;
    health["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(
                              std::chrono::system_clock::now().time_since_epoch())
                              .count();
    res.setJson(health);
}

void StatusApiServer::handleStatusList(const ApiRequest& /*req*/, ApiResponse& res) const {
    auto values = nlohmann::json::array();
    for (const auto& value : board_->snapshot()) {
        values.push_back(statusToJson(value));
    }
    res.setJson(values);
}

void StatusApiServer::handleStatusEntity(const ApiRequest& req, ApiResponse& res) const {
    const auto& entity = req.pathParams.at("entity");
    auto value = board_->get(entity);
    if (!value) {
        res.setError(404, "Unknown entity: " + entity);
        return;
    }
    res.setJson(statusToJson(*value));
}

void StatusApiServer::handleHosts(const ApiRequest& /*req*/, ApiResponse& res) const {
    auto values = nlohmann::json::array();
    for (const auto& value : board_->snapshot()) {
        if (value.kind != core::EntityKind::Target) {
            values.push_back(statusToJson(value));
        }
    }
    res.setJson(values);
}

} // namespace connmon::infra
