#include <catch2/catch_test_macros.hpp>

#include "infrastructure/api/StatusApiServer.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "monitoring/StatusBoard.hpp"

#include <array>

using namespace connmon::infra;
using namespace connmon::core;
using connmon::monitoring::StatusBoard;

namespace {

StatusValue value(const std::string& id, EntityKind kind, const std::string& state) {
    StatusValue v;
    v.entityId = id;
    v.kind = kind;
    v.state = state;
    v.updatedAt = std::chrono::system_clock::now();
    v.attributes["host"] = "web01";
    return v;
}

ApiRequest get(const std::string& path) {
    ApiRequest request;
    request.method = HttpMethod::GET;
    request.path = path;
    return request;
}

std::string httpGet(uint16_t port, const std::string& path) {
    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect({asio::ip::make_address("127.0.0.1"), port});

    std::string request = "GET " + path + " HTTP/1.1\r\nHost: localhost\r\n\r\n";
    asio::write(socket, asio::buffer(request));

    std::string response;
    asio::error_code ec;
    std::array<char, 1024> chunk{};
    for (;;) {
        auto n = socket.read_some(asio::buffer(chunk), ec);
        response.append(chunk.data(), n);
        if (ec) {
            break;
        }
    }
    return response;
}

} // namespace

TEST_CASE("StatusApiServer request parsing", "[StatusApiServer]") {
    SECTION("Request line and headers") {
        auto request = StatusApiServer::parseRequest(
            "GET /api/status?verbose=1 HTTP/1.1\r\nHost: localhost\r\nAccept: */*\r\n\r\n");

        CHECK(request.method == HttpMethod::GET);
        CHECK(request.path == "/api/status");
        CHECK(request.headers["host"] == "localhost");
        CHECK(request.headers["accept"] == "*/*");
    }

    SECTION("Methods") {
        CHECK(StatusApiServer::parseMethod("POST") == HttpMethod::POST);
        CHECK(StatusApiServer::parseMethod("BREW") == HttpMethod::UNKNOWN);
    }

    SECTION("Route matching with parameters") {
        std::map<std::string, std::string> params;
        REQUIRE(StatusApiServer::matchRoute("/api/status/:entity", "/api/status/web01_overall",
                                            params));
        CHECK(params["entity"] == "web01_overall");

        CHECK_FALSE(StatusApiServer::matchRoute("/api/status/:entity", "/api/status", params));
        CHECK_FALSE(StatusApiServer::matchRoute("/api/hosts", "/api/health", params));
        CHECK(params.empty());
    }
}

TEST_CASE("StatusApiServer dispatch", "[StatusApiServer]") {
    AsioContext context(1);
    auto board = std::make_shared<StatusBoard>();
    board->publish(value("web01_TCP_443", EntityKind::Target, "Connected"));
    board->publish(value("web01_overall", EntityKind::Overall, "Connected"));
    auto server = std::make_shared<StatusApiServer>(context, board, "127.0.0.1", 0);

    SECTION("Health reports counts") {
        auto response = server->dispatch(get("/api/health"));

        REQUIRE(response.statusCode == 200);
        auto body = nlohmann::json::parse(response.body);
        CHECK(body["status"] == "ok");
        CHECK(body["targets"] == 1);
        CHECK(body["hosts"] == 1);
        CHECK(response.headers["Content-Type"] == "application/json");
    }

    SECTION("Status list returns every entity") {
        auto response = server->dispatch(get("/api/status"));

        auto body = nlohmann::json::parse(response.body);
        REQUIRE(body.is_array());
        REQUIRE(body.size() == 2);
        CHECK(body[0]["entity_id"] == "web01_TCP_443");
        CHECK(body[0]["kind"] == "target");
        CHECK(body[0]["attributes"]["host"] == "web01");
    }

    SECTION("Single entity") {
        auto response = server->dispatch(get("/api/status/web01_overall"));

        REQUIRE(response.statusCode == 200);
        auto body = nlohmann::json::parse(response.body);
        CHECK(body["state"] == "Connected");
        CHECK(body["kind"] == "overall");
    }

    SECTION("Unknown entity is 404") {
        auto response = server->dispatch(get("/api/status/nope"));
        CHECK(response.statusCode == 404);
    }

    SECTION("Hosts excludes target entities") {
        auto body = nlohmann::json::parse(server->dispatch(get("/api/hosts")).body);
        REQUIRE(body.size() == 1);
        CHECK(body[0]["entity_id"] == "web01_overall");
    }

    SECTION("Unknown path is 404") {
        CHECK(server->dispatch(get("/api/alerts")).statusCode == 404);
    }

    SECTION("Only GET is allowed") {
        auto request = get("/api/status");
        request.method = HttpMethod::POST;

        auto response = server->dispatch(request);

        CHECK(response.statusCode == 405);
        CHECK(response.headers["Allow"] == "GET");
    }
}

TEST_CASE("ApiResponse serialization", "[StatusApiServer]") {
    ApiResponse response;
    response.setJson({{"status", "ok"}});

    auto text = response.toString();

    CHECK(text.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(text.find("Content-Type: application/json\r\n") != std::string::npos);
    CHECK(text.find("Content-Length: " + std::to_string(response.body.size())) !=
          std::string::npos);
    CHECK(text.find("\r\n\r\n{\"status\":\"ok\"}") != std::string::npos);
}

TEST_CASE("StatusApiServer serves over loopback", "[StatusApiServer]") {
    AsioContext context(2);
    context.start();

    auto board = std::make_shared<StatusBoard>();
    board->publish(value("web01_overall", EntityKind::Overall, "Partially Connected"));

    auto server = std::make_shared<StatusApiServer>(context, board, "127.0.0.1", 0);
    REQUIRE(server->start());
    REQUIRE(server->isRunning());
    REQUIRE(server->port() != 0);

    auto response = httpGet(server->port(), "/api/status/web01_overall");

    CHECK(response.rfind("HTTP/1.1 200 OK", 0) == 0);
    CHECK(response.find("Partially Connected") != std::string::npos);

    auto missing = httpGet(server->port(), "/api/missing");
    CHECK(missing.rfind("HTTP/1.1 404", 0) == 0);

    server->stop();
    CHECK_FALSE(server->isRunning());
    context.stop();
}
