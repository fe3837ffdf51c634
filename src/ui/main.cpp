#include <QApplication>
#include <QCoreApplication>
#include <QIcon>
#include <QSplashScreen>
#include <QSystemTrayIcon>
#include <QTimer>

#include <cstdlib>
#include <memory>

#include "bridge/BridgeCommands.hpp"
#include "bridge/HealthClient.hpp"
#include "common/app_config.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "common/process_utils.hpp"
#include "lifecycle/LifecycleController.hpp"
#include "ui/MainWindow.hpp"
#include "ui/SplashScreen.hpp"
#include <nlohmann/json.hpp>

namespace {

// Closes the splash even if the frontend never finishes loading.
constexpr int kSplashFallbackMs = 20 * 1000;

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setAttribute(Qt::AA_ShareOpenGLContexts);
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("axiestudio-desktop"));
    QCoreApplication::setApplicationVersion(axiestudio::appVersion());
    QCoreApplication::setOrganizationName(QStringLiteral("Axie Studio"));

    const axiestudio::AppConfig config = axiestudio::parseAppConfig(app.arguments());
    axiestudio::logging::initLogging(QStringLiteral("axiestudio-desktop"),
                                     config.traceLogging);

    const bool trayAvailable = QSystemTrayIcon::isSystemTrayAvailable();
    ALOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("app_start"),
              QStringLiteral("user_start"),
              QStringLiteral("qt_app"),
              axiestudio::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"version", axiestudio::appVersion().toStdString()},
                              {"debugBuild", axiestudio::isDebugBuild()},
                              {"trayAvailable", trayAvailable},
                              {"closeToTray", config.closeToTray},
                              {"splash", config.showSplash}}));

    const QString iconPath = axiestudio::appIconPath();
    if (!iconPath.isEmpty()) {
        app.setWindowIcon(QIcon(iconPath));
    }

    axiestudio::LifecycleController::Options options;
    options.closeToTray = config.closeToTray && trayAvailable;
    options.openInspector = config.openInspector;
    axiestudio::LifecycleController controller(options);
    if (options.closeToTray) {
        controller.installTray();
    }
    // With close-to-tray the only way out is the tray's Quit item.
    app.setQuitOnLastWindowClosed(!controller.trayModeActive());

    axiestudio::HealthClient healthClient(config.healthUrl(), config.healthTimeoutMs);
    axiestudio::BridgeCommands bridge(config, controller, healthClient);

    axiestudio::MainWindow mainWindow(config, bridge);
    if (!controller.attachWindow(axiestudio::kMainWindowLabel, &mainWindow)) {
        return EXIT_FAILURE;
    }
    QObject::connect(&controller, &axiestudio::LifecycleController::inspectorRequested,
                     &mainWindow, &axiestudio::MainWindow::openDevTools);

    std::unique_ptr<QSplashScreen> splash;
    if (config.showSplash) {
        splash = axiestudio::createSplashScreen(iconPath);
        if (!controller.attachWindow(axiestudio::kSplashWindowLabel, splash.get())) {
            return EXIT_FAILURE;
        }
        splash->show();

        const auto requestSplashClose = [&controller]() {
            if (!controller.registry().contains(axiestudio::kSplashWindowLabel)) {
                return;
            }
            axiestudio::LifecycleEvent event;
            event.kind = axiestudio::LifecycleEventKind::SplashCloseRequested;
            controller.handleEvent(event);
        };
        QObject::connect(&mainWindow, &axiestudio::MainWindow::frontendLoaded,
                         &controller, requestSplashClose);
        QTimer::singleShot(kSplashFallbackMs, &controller, requestSplashClose);
    }

    mainWindow.loadFrontend();

    axiestudio::LifecycleEvent setupEvent;
    setupEvent.kind = axiestudio::LifecycleEventKind::SetupComplete;
    controller.handleEvent(setupEvent);

    return app.exec();
}
