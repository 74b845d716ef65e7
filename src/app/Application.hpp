#pragma once

#include "infrastructure/api/StatusApiServer.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/notifications/WebhookNotifier.hpp"
#include "monitoring/Monitor.hpp"
#include "monitoring/StatusBoard.hpp"

#include <QCoreApplication>
#include <asio.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace connmon::app {

/**
 * @brief Command line options.
 */
struct Options {
    std::filesystem::path configDir;
    std::optional<std::string> secretKey;   ///< --set-secret key
    std::optional<std::string> secretValue; ///< value following the key
    bool checkConfig{false};
};

/**
 * @brief Headless process: owns the Qt event loop, the worker pool and the
 * monitor, and handles SIGHUP reloads and SIGINT/SIGTERM shutdown.
 */
class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    int run();

    const Options& options() const { return options_; }

private:
    void parseArguments();
    void initializeLogging(const infra::LoggingSettings& settings);
    void initializeComponents();
    void watchSignals();
    void reload();
    void shutdown();

    int storeSecret();
    int checkConfig();

    std::unique_ptr<QCoreApplication> qtApp_;
    Options options_;

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::shared_ptr<monitoring::StatusBoard> board_;
    std::shared_ptr<infra::WebhookNotifier> notifier_;
    std::unique_ptr<monitoring::Monitor> monitor_;
    std::shared_ptr<infra::StatusApiServer> apiServer_;
    std::unique_ptr<asio::signal_set> signals_;
};

} // namespace connmon::app
