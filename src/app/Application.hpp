#pragma once

#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DeviceRegistry.hpp"
#include "infrastructure/monitoring/ChangeNotifier.hpp"
#include "infrastructure/monitoring/MonitorEngine.hpp"
#include "infrastructure/monitoring/StatusCache.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/Prober.hpp"
#include "viewmodels/DeviceManagerViewModel.hpp"
#include "viewmodels/MonitorViewModel.hpp"

#include <QCoreApplication>
#include <filesystem>
#include <memory>
#include <optional>

namespace vikabh::app {

/**
 * @brief Options taken from the command line.
 */
struct LaunchOptions {
    std::optional<std::filesystem::path> configDir; ///< Overrides the platform data directory.
    std::optional<int> pollIntervalSeconds;         ///< Applied and saved once the engine starts.
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::Database& database() { return *database_; }
    infra::DeviceRegistry& registry() { return *registry_; }
    infra::AsioContext& asioContext() { return *asioContext_; }
    infra::MonitorEngine& engine() { return *engine_; }

    viewmodels::MonitorViewModel& monitorViewModel() { return *monitorViewModel_; }
    viewmodels::DeviceManagerViewModel& deviceManagerViewModel() {
        return *deviceManagerViewModel_;
    }

private:
    LaunchOptions parseArguments();
    void initializeLogging();
    void initializeComponents();
    void logSummary();

    std::unique_ptr<QCoreApplication> qtApp_;
    LaunchOptions options_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::Database> database_;
    std::shared_ptr<infra::DeviceRegistry> registry_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<infra::Prober> prober_;
    std::shared_ptr<infra::StatusCache> statusCache_;
    std::shared_ptr<infra::ChangeNotifier> notifier_;
    std::shared_ptr<infra::MonitorEngine> engine_;

    std::unique_ptr<viewmodels::MonitorViewModel> monitorViewModel_;
    std::unique_ptr<viewmodels::DeviceManagerViewModel> deviceManagerViewModel_;
};

} // namespace vikabh::app
