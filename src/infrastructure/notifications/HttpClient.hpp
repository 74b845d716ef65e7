#pragma once

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QObject>

#include <functional>
#include <map>
#include <string>

namespace connmon::infra {

/**
 * @brief Outcome of one HTTP request.
 */
struct HttpResponse {
    int statusCode{0};        ///< HTTP status code, 0 if no response arrived.
    std::string body;         ///< Response body.
    std::string errorMessage; ///< Network or HTTP error description.
    bool success{false};      ///< True for a 2xx response.
};

using HttpCallback = std::function<void(const HttpResponse&)>;

/**
 * @brief Asynchronous HTTP POST client on Qt's network stack.
 *
 * Must be used from the thread that owns it; callbacks run on that thread
 * once the reply finished or its transfer timeout expired.
 */
class HttpClient : public QObject {
    Q_OBJECT

public:
    explicit HttpClient(QObject* parent = nullptr);
    ~HttpClient() override = default;

    /**
     * @brief Posts a body to a URL.
     * @param url Target URL.
     * @param payload Request body.
     * @param headers Extra request headers.
     * @param timeoutMs Transfer timeout in milliseconds.
     * @param callback Invoked exactly once with the outcome.
     */
    void postAsync(const std::string& url, const QByteArray& payload,
                   const std::map<std::string, std::string>& headers, int timeoutMs,
                   HttpCallback callback);

    int pendingRequests() const { return pending_; }

private:
    QNetworkAccessManager manager_;
    int pending_{0};
};

} // namespace connmon::infra
