#include "infrastructure/notifications/HttpClient.hpp"

#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>
#include <spdlog/spdlog.h>

namespace connmon::infra {

HttpClient::HttpClient(QObject* parent) : QObject(parent) {}

void HttpClient::postAsync(const std::string& url, const QByteArray& payload,
                           const std::map<std::string, std::string>& headers, int timeoutMs,
                           HttpCallback callback) {
    QUrl target(QString::fromStdString(url));
    if (!target.isValid() || target.scheme().isEmpty()) {
        HttpResponse response;
        response.errorMessage = "Invalid URL";
        callback(response);
        return;
    }

    QNetworkRequest request(target);
    for (const auto& [key, value] : headers) {
        request.setRawHeader(QByteArray::fromStdString(key), QByteArray::fromStdString(value));
    }
    request.setTransferTimeout(timeoutMs);

    QNetworkReply* reply = manager_.post(request, payload);
    if (!reply) {
        HttpResponse response;
        response.errorMessage = "Failed to create network request";
        callback(response);
        return;
    }

    ++pending_;
    spdlog::debug("HTTP POST sent to {} ({} bytes)", target.host().toStdString(), payload.size());

    connect(reply, &QNetworkReply::finished, this, [this, reply, callback = std::move(callback)]() {
        --pending_;

        HttpResponse response;
        response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        response.body = reply->readAll().toStdString();

        if (reply->error() == QNetworkReply::NoError) {
            response.success = response.statusCode >= 200 && response.statusCode < 300;
            if (!response.success) {
                response.errorMessage = "HTTP error: " + std::to_string(response.statusCode);
            }
        } else {
            response.errorMessage = reply->errorString().toStdString();
        }

        reply->deleteLater();
        callback(response);
    });
}

} // namespace connmon::infra
