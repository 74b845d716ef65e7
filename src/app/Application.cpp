#include "app/Application.hpp"

#include "monitoring/TargetRegistry.hpp"

#include <QCommandLineParser>
#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>

namespace connmon::app {

namespace {

spdlog::level::level_enum parseLevel(const std::string& name, spdlog::level::level_enum fallback) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}'", name);
        return fallback;
    }
    return level;
}

} // namespace

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("ConnMon");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("ConnMon");

    parseArguments();
}

Application::~Application() {
    spdlog::info("ConnMon shutting down...");
    shutdown();
}

void Application::parseArguments() {
    QCommandLineParser parser;
    parser.setApplicationDescription("Headless connectivity monitor with debounced alerts");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configDirOption(
        "config-dir", "Directory holding config.json and the secret key.", "dir");
    QCommandLineOption setSecretOption(
        "set-secret", "Encrypt <value> and store it under <key>, then exit.", "key");
    QCommandLineOption checkConfigOption(
        "check-config", "Validate the configured targets and exit.");
    parser.addOption(configDirOption);
    parser.addOption(setSecretOption);
    parser.addOption(checkConfigOption);
    parser.addPositionalArgument("value", "Secret value for --set-secret.", "[value]");

    parser.process(*qtApp_);

    if (parser.isSet(configDirOption)) {
        options_.configDir = parser.value(configDirOption).toStdString();
    } else {
        options_.configDir =
            QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation).toStdString();
    }

    if (parser.isSet(setSecretOption)) {
        options_.secretKey = parser.value(setSecretOption).toStdString();
        const auto positional = parser.positionalArguments();
        if (!positional.isEmpty()) {
            options_.secretValue = positional.first().toStdString();
        }
    }
    options_.checkConfig = parser.isSet(checkConfigOption);
}

void Application::initializeLogging(const infra::LoggingSettings& settings) {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(parseLevel(settings.level, spdlog::level::info));

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    if (settings.file) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config_->logPath().string(), 5 * 1024 * 1024, 3);
            fileSink->set_level(parseLevel(settings.fileLevel, spdlog::level::debug));
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", config_->logPath().string(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("connmon", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("ConnMon {} starting...", qtApp_->applicationVersion().toStdString());
    if (settings.file) {
        spdlog::info("Log file: {}", config_->logPath().string());
    }
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    asioContext_ = std::make_unique<infra::AsioContext>(static_cast<size_t>(cfg.monitoring.workerThreads));
    asioContext_->start();

    board_ = std::make_shared<monitoring::StatusBoard>();
    notifier_ = std::make_shared<infra::WebhookNotifier>(config_->resolvedNotifyGroups());

    monitor_ = std::make_unique<monitoring::Monitor>(asioContext_->getContext(), board_, notifier_);
    if (!monitor_->configure(config_->resolvedConfig())) {
        spdlog::warn("No valid targets configured in {}", config_->configPath().string());
    }

    if (cfg.api.enabled) {
        apiServer_ = std::make_shared<infra::StatusApiServer>(*asioContext_, board_,
                                                              cfg.api.bindAddress, cfg.api.port);
        if (!apiServer_->start()) {
            apiServer_.reset();
        }
    }

    watchSignals();
    spdlog::info("Application components initialized");
}

void Application::watchSignals() {
    if (!signals_) {
        signals_ = std::make_unique<asio::signal_set>(asioContext_->getContext(), SIGINT, SIGTERM);
        signals_->add(SIGHUP);
    }

    signals_->async_wait([this](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }

        if (signal == SIGHUP) {
            spdlog::info("SIGHUP received, reloading configuration");
            QMetaObject::invokeMethod(qtApp_.get(), [this]() { reload(); }, Qt::QueuedConnection);
            watchSignals();
        } else {
            spdlog::info("Signal {} received, stopping", signal);
            QMetaObject::invokeMethod(qtApp_.get(), []() { QCoreApplication::quit(); },
                                      Qt::QueuedConnection);
        }
    });
}

void Application::reload() {
    if (!config_->load()) {
        spdlog::error("Configuration reload failed, keeping the current configuration");
        return;
    }

    notifier_->setGroups(config_->resolvedNotifyGroups());
    monitor_->reconfigure(config_->resolvedConfig());
}

void Application::shutdown() {
    if (signals_) {
        asio::error_code ec;
        signals_->cancel(ec);
    }
    if (apiServer_) {
        apiServer_->stop();
    }
    if (monitor_) {
        monitor_->stop();
    }
    if (asioContext_) {
        asioContext_->stop();
    }

    signals_.reset();
    apiServer_.reset();
    monitor_.reset();
    notifier_.reset();
}

int Application::storeSecret() {
    if (!options_.secretValue) {
        spdlog::error("--set-secret requires a value");
        return 2;
    }
    if (!config_->setSecureValue(*options_.secretKey, *options_.secretValue)) {
        spdlog::error("Failed to store secret '{}'", *options_.secretKey);
        return 1;
    }
    spdlog::info("Stored secret '{}' in {}", *options_.secretKey, config_->configPath().string());
    return 0;
}

int Application::checkConfig() {
    const auto& cfg = config_->config();
    auto materialized =
        monitoring::TargetRegistry::materialize(cfg.targets, cfg.alerts.defaultDelayMinutes);

    for (const auto& target : materialized.targets) {
        spdlog::info("  {} ({}, {})", target.identityKey(), target.deviceName,
                     target.alertGroup ? "alerts to " + *target.alertGroup : "no alerts");
    }
    for (const auto& group : config_->resolvedNotifyGroups()) {
        if (group.url.empty()) {
            spdlog::warn("Notify group '{}' has no URL", group.name);
        }
    }

    if (!materialized.errors.empty()) {
        spdlog::error("{} invalid target entries", materialized.errors.size());
        return 1;
    }
    spdlog::info("Configuration OK: {} targets on {} hosts", materialized.targets.size(),
                 materialized.hosts.size());
    return 0;
}

int Application::run() {
    config_ = std::make_unique<infra::ConfigManager>(options_.configDir);

    if (!config_->load()) {
        spdlog::critical("Cannot load configuration from {}", config_->configPath().string());
        return 1;
    }

    if (options_.secretKey) {
        return storeSecret();
    }

    if (options_.checkConfig) {
        return checkConfig();
    }

    initializeLogging(config_->config().logging);
    initializeComponents();
    monitor_->start();

    int code = qtApp_->exec();
    shutdown();
    return code;
}

} // namespace connmon::app
