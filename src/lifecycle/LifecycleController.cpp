#include "lifecycle/LifecycleController.hpp"

#include <QCoreApplication>
#include <QEvent>
#include <QMetaObject>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "tray/AppTray.hpp"

namespace axiestudio {

LifecycleController::LifecycleController(Options options,
                                         ExitHandler exitHandler,
                                         QObject *parent)
    : QObject(parent)
    , m_options(options)
    , m_exitHandler(std::move(exitHandler))
{
    if (!m_exitHandler) {
        m_exitHandler = [](int code) { QCoreApplication::exit(code); };
    }
}

LifecycleController::~LifecycleController() = default;

WindowRegistry &LifecycleController::registry()
{
    return m_registry;
}

const WindowRegistry &LifecycleController::registry() const
{
    return m_registry;
}

bool LifecycleController::attachWindow(const QString &label, QWidget *window)
{
    if (!m_registry.registerWindow(label, window)) {
        return false;
    }
    if (label == kMainWindowLabel) {
        window->installEventFilter(this);
    }
    return true;
}

AppTray *LifecycleController::installTray()
{
    if (m_tray) {
        ALOG_DEBUG(QStringLiteral("LifecycleController"),
                   QStringLiteral("installTray"),
                   QStringLiteral("tray_already_installed"),
                   QStringLiteral("host_setup"),
                   QStringLiteral("qt_tray"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return m_tray.get();
    }

    m_tray = std::make_unique<AppTray>();
    connect(m_tray.get(), &AppTray::leftClicked, this, [this]() {
        LifecycleEvent event;
        event.kind = LifecycleEventKind::TrayLeftClick;
        handleEvent(event);
    });
    connect(m_tray.get(), &AppTray::menuItemTriggered, this, [this](const QString &itemId) {
        LifecycleEvent event;
        event.kind = LifecycleEventKind::TrayMenuClick;
        event.menuItemId = itemId;
        handleEvent(event);
    });
    return m_tray.get();
}

AppTray *LifecycleController::tray() const
{
    return m_tray.get();
}

bool LifecycleController::trayModeActive() const
{
    return m_options.closeToTray && m_tray != nullptr;
}

void LifecycleController::handleEvent(const LifecycleEvent &event)
{
    ALOG_DEBUG(QStringLiteral("LifecycleController"),
               QStringLiteral("handleEvent"),
               QStringLiteral("lifecycle_event"),
               QStringLiteral("host_event"),
               QStringLiteral("event_loop"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"kind", toEventKindString(event.kind)},
                               {"window", event.windowLabel.toStdString()},
                               {"item", event.menuItemId.toStdString()}}));

    switch (event.kind) {
    case LifecycleEventKind::SetupComplete:
        onSetupComplete();
        break;
    case LifecycleEventKind::SplashCloseRequested:
        onSplashCloseRequested();
        break;
    case LifecycleEventKind::WindowCloseRequested:
        onWindowCloseRequested(event);
        break;
    case LifecycleEventKind::TrayLeftClick:
        showMain(QStringLiteral("tray_left_click"));
        break;
    case LifecycleEventKind::TrayMenuClick:
        onTrayMenuClick(event.menuItemId);
        break;
    }
}

bool LifecycleController::eventFilter(QObject *watched, QEvent *event)
{
    if (event->type() == QEvent::Close
        && watched == m_registry.window(kMainWindowLabel)) {
        LifecycleEvent closeEvent;
        closeEvent.kind = LifecycleEventKind::WindowCloseRequested;
        closeEvent.windowLabel = kMainWindowLabel;
        closeEvent.hostEvent = event;
        handleEvent(closeEvent);
        // A vetoed close must not reach QWidget::closeEvent, which re-accepts it.
        return !event->isAccepted();
    }
    return QObject::eventFilter(watched, event);
}

void LifecycleController::onSetupComplete()
{
    showMain(QStringLiteral("setup_complete"));
    if (m_options.openInspector) {
        ALOG_INFO(QStringLiteral("LifecycleController"),
                  QStringLiteral("onSetupComplete"),
                  QStringLiteral("open_inspector"),
                  QStringLiteral("debug_build"),
                  QStringLiteral("signal"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
        emit inspectorRequested();
    }
}

void LifecycleController::onSplashCloseRequested()
{
    // Fixed order, each step best effort: a splash that is already gone
    // must not keep the main window hidden.
    const bool closed = m_registry.close(kSplashWindowLabel);
    ALOG_INFO(QStringLiteral("LifecycleController"),
              QStringLiteral("onSplashCloseRequested"),
              QStringLiteral("splash_close"),
              QStringLiteral("splash_close_requested"),
              QStringLiteral("registry"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"closed", closed}}));
    showMain(QStringLiteral("splash_closed"));
}

void LifecycleController::onWindowCloseRequested(const LifecycleEvent &event)
{
    if (event.windowLabel != kMainWindowLabel || !trayModeActive()) {
        ALOG_DEBUG(QStringLiteral("LifecycleController"),
                   QStringLiteral("onWindowCloseRequested"),
                   QStringLiteral("close_allowed"),
                   QStringLiteral("window_close_requested"),
                   QStringLiteral("default_close"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"window", event.windowLabel.toStdString()},
                                   {"trayMode", trayModeActive()}}));
        return;
    }

    if (event.hostEvent) {
        event.hostEvent->ignore();
    }

    ALOG_INFO(QStringLiteral("LifecycleController"),
              QStringLiteral("onWindowCloseRequested"),
              QStringLiteral("close_to_tray"),
              QStringLiteral("window_close_requested"),
              QStringLiteral("veto_then_hide"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());

    // Queued so the hide runs after the close event has unwound, in order
    // with any lifecycle work already pending on the event loop.
    QMetaObject::invokeMethod(this, [this]() {
        hideMain(QStringLiteral("close_to_tray"));
    }, Qt::QueuedConnection);
}

void LifecycleController::onTrayMenuClick(const QString &itemId)
{
    if (itemId == kTrayItemShow) {
        showMain(QStringLiteral("tray_menu_show"));
    } else if (itemId == kTrayItemHide) {
        hideMain(QStringLiteral("tray_menu_hide"));
    } else if (itemId == kTrayItemQuit) {
        quit();
    } else {
        ALOG_WARN(QStringLiteral("LifecycleController"),
                  QStringLiteral("onTrayMenuClick"),
                  QStringLiteral("unknown_menu_item"),
                  QStringLiteral("tray_menu_click"),
                  QStringLiteral("qt_tray"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"item", itemId.toStdString()}}));
    }
}

void LifecycleController::showMain(const QString &why)
{
    if (!m_registry.show(kMainWindowLabel)) {
        return;
    }
    ALOG_INFO(QStringLiteral("LifecycleController"),
              QStringLiteral("showMain"),
              QStringLiteral("main_shown"),
              why,
              QStringLiteral("registry"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());
}

void LifecycleController::hideMain(const QString &why)
{
    if (!m_registry.hide(kMainWindowLabel)) {
        return;
    }
    ALOG_INFO(QStringLiteral("LifecycleController"),
              QStringLiteral("hideMain"),
              QStringLiteral("main_hidden"),
              why,
              QStringLiteral("registry"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());
}

void LifecycleController::quit()
{
    ALOG_INFO(QStringLiteral("LifecycleController"),
              QStringLiteral("quit"),
              QStringLiteral("process_exit"),
              QStringLiteral("tray_menu_quit"),
              QStringLiteral("exit_handler"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    m_exitHandler(0);
}

} // namespace axiestudio
