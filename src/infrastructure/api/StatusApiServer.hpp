#pragma once

#include "core/services/IStatusBoard.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace connmon::infra {

enum class HttpMethod { GET, POST, PUT, DELETE, OPTIONS, UNKNOWN };

/**
 * @brief Represents an incoming API request.
 */
struct ApiRequest {
    HttpMethod method{HttpMethod::UNKNOWN};
    std::string path;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> pathParams; ///< Filled by route matching.
};

/**
 * @brief Represents an API response to send.
 */
struct ApiResponse {
    int statusCode{200};
    std::string statusText{"OK"};
    std::string body;
    std::map<std::string, std::string> headers;

    void setJson(const nlohmann::json& json);

    /**
     * @brief Sets an error status with a {"error", "status"} JSON body.
     */
    void setError(int code, const std::string& message);

    /**
     * @brief Serializes status line, headers and body.
     */
    std::string toString() const;
};

using RouteHandler = std::function<void(const ApiRequest&, ApiResponse&)>;

struct Route {
    std::string pattern; ///< Path pattern, ":name" segments become path params.
    RouteHandler handler;
};

/**
 * @brief Read-only HTTP view of the status board.
 *
 * Serves GET /api/health, /api/status, /api/status/:entity and /api/hosts.
 * Any other method is answered with 405, unknown paths with 404. One request
 * is served per connection.
 *
 * @note This class is non-copyable and must be owned by a shared_ptr.
 */
class StatusApiServer : public std::enable_shared_from_this<StatusApiServer> {
public:
    /**
     * @param asioContext Worker pool the acceptor runs on.
     * @param board Status board to serve.
     * @param bindAddress Listen address, e.g. "127.0.0.1".
     * @param port Listen port, 0 picks an ephemeral port.
     */
    StatusApiServer(AsioContext& asioContext, std::shared_ptr<core::IStatusBoard> board,
                    std::string bindAddress, uint16_t port);
    ~StatusApiServer();

    StatusApiServer(const StatusApiServer&) = delete;
    StatusApiServer& operator=(const StatusApiServer&) = delete;

    /**
     * @brief Binds and starts accepting connections.
     * @return False if the address could not be bound.
     */
    bool start();

    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Returns the bound port once started, else the configured one.
     */
    uint16_t port() const { return port_; }

    static HttpMethod parseMethod(const std::string& method);
    static ApiRequest parseRequest(const std::string& rawRequest);
    static bool matchRoute(const std::string& pattern, const std::string& path,
                           std::map<std::string, std::string>& pathParams);

    /**
     * @brief Routes a parsed request to its handler.
     */
    ApiResponse dispatch(ApiRequest request) const;

private:
    void registerRoutes();
    void startAccept();
    void readRequest(std::shared_ptr<asio::ip::tcp::socket> socket);
    void sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket, const ApiResponse& response);

    void handleHealth(const ApiRequest& req, ApiResponse& res) const;
    void handleStatusList(const ApiRequest& req, ApiResponse& res) const;
    void handleStatusEntity(const ApiRequest& req, ApiResponse& res) const;
    void handleHosts(const ApiRequest& req, ApiResponse& res) const;

    AsioContext& asioContext_;
    std::shared_ptr<core::IStatusBoard> board_;
    std::string bindAddress_;
    uint16_t port_;
    std::atomic<bool> running_{false};

    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<Route> routes_;
};

} // namespace connmon::infra
