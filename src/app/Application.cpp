#include "app/Application.hpp"

#include <QCommandLineParser>
#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace vikabh::app {

namespace {

spdlog::level::level_enum parseLevel(const std::string& name, spdlog::level::level_enum fallback) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}'", name);
        return fallback;
    }
    return level;
}

} // namespace

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("VikabhMonitor");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("Vikabh");

    options_ = parseArguments();

    auto configDir = options_.configDir.value_or(std::filesystem::path(
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation).toStdString()));
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (monitorViewModel_) {
        monitorViewModel_->stopMonitoring();
    }

    if (asioContext_) {
        asioContext_->stop();
    }
}

LaunchOptions Application::parseArguments() {
    QCommandLineParser parser;
    parser.setApplicationDescription("Background reachability monitor for network devices");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configDirOption(QStringList{"c", "config-dir"},
                                       "Directory holding config.json, the database and logs.",
                                       "dir");
    QCommandLineOption intervalOption(QStringList{"i", "interval"},
                                      "Poll interval in seconds.", "seconds");
    parser.addOption(configDirOption);
    parser.addOption(intervalOption);
    parser.process(*qtApp_);

    LaunchOptions options;
    if (parser.isSet(configDirOption)) {
        options.configDir = parser.value(configDirOption).toStdString();
    }
    if (parser.isSet(intervalOption)) {
        bool ok = false;
        int seconds = parser.value(intervalOption).toInt(&ok);
        if (!ok) {
            throw std::invalid_argument("--interval expects a whole number of seconds");
        }
        options.pollIntervalSeconds = seconds;
    }
    return options;
}

void Application::initializeLogging() {
    const auto& logging = config_->config().logging;
    auto logPath = config_->logPath();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(parseLevel(logging.consoleLevel, spdlog::level::info));

    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        logPath.string(), static_cast<size_t>(logging.fileMaxSizeMb) * 1024 * 1024,
        static_cast<size_t>(logging.fileCount));
    fileSink->set_level(parseLevel(logging.level, spdlog::level::debug));

    auto logger =
        std::make_shared<spdlog::logger>("vikabh", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    spdlog::info("Vikabh Monitor {} starting...", qtApp_->applicationVersion().toStdString());
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Registry
    database_ = std::make_shared<infra::Database>(config_->databasePath().string(),
                                                  std::chrono::milliseconds(cfg.busyTimeoutMs));
    database_->runMigrations();
    registry_ = std::make_shared<infra::DeviceRegistry>(database_);

    // Probing
    asioContext_ = std::make_unique<infra::AsioContext>(static_cast<size_t>(cfg.workerThreads));
    prober_ = std::make_unique<infra::Prober>(
        infra::ProberOptions{.auxiliaryPort = cfg.auxiliaryPort,
                             .defaultTcpPort = cfg.defaultTcpPort});

    // Monitoring
    statusCache_ = std::make_shared<infra::StatusCache>();
    notifier_ = std::make_shared<infra::ChangeNotifier>();

    infra::MonitorEngineOptions engineOptions;
    engineOptions.bounds = cfg.intervalBounds();
    engineOptions.pollInterval = std::chrono::seconds(cfg.defaultPollIntervalSeconds);
    engineOptions.probeTimeout = std::chrono::milliseconds(cfg.probeTimeoutMs);
    engine_ = std::make_shared<infra::MonitorEngine>(*registry_, *prober_, *asioContext_,
                                                     *statusCache_, *notifier_, engineOptions);

    // ViewModels
    monitorViewModel_ = std::make_unique<viewmodels::MonitorViewModel>(
        registry_, engine_, statusCache_, notifier_, engineOptions.bounds, cfg.auxiliaryPort);
    deviceManagerViewModel_ = std::make_unique<viewmodels::DeviceManagerViewModel>(registry_);

    QObject::connect(monitorViewModel_.get(), &viewmodels::MonitorViewModel::statusesChanged,
                     [this]() { logSummary(); });
    QObject::connect(monitorViewModel_.get(), &viewmodels::MonitorViewModel::engineStateChanged,
                     [this](core::EngineState state) {
                         if (state == core::EngineState::Stopped && engine_->lastFatalError()) {
                             spdlog::critical("Monitoring stopped: {}", *engine_->lastFatalError());
                             qtApp_->exit(2);
                         }
                     });
    QObject::connect(qtApp_.get(), &QCoreApplication::aboutToQuit,
                     [this]() { monitorViewModel_->stopMonitoring(); });

    spdlog::info("Application components initialized ({} devices, {} teams)",
                 registry_->devices().count(), registry_->teams().count());
}

void Application::logSummary() {
    auto summary = monitorViewModel_->summary();
    spdlog::info("Status: {} online, {} offline, {} error, {} unknown{}", summary.online,
                 summary.offline, summary.error, summary.unknown,
                 summary.stale > 0 ? fmt::format(", {} not saved", summary.stale) : "");
}

int Application::run() {
    if (!monitorViewModel_->startMonitoring()) {
        return 2;
    }

    if (options_.pollIntervalSeconds) {
        monitorViewModel_->setPollInterval(std::chrono::seconds(*options_.pollIntervalSeconds));
    }

    return qtApp_->exec();
}

} // namespace vikabh::app
