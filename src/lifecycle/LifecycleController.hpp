#pragma once

#include <functional>
#include <memory>

#include <QObject>
#include <QString>

#include "common/models.hpp"
#include "lifecycle/WindowRegistry.hpp"

class QEvent;

namespace axiestudio {

class AppTray;

/**
 * LifecycleController drives the window/tray state machine of the shell.
 *
 * It owns the window registry and the single tray icon for the lifetime of
 * the application. Host-originated events (setup, splash close request,
 * main window close, tray clicks) arrive through handleEvent() on the GUI
 * thread. Failures to resolve a window are logged and never escalated.
 */
class LifecycleController : public QObject
{
    Q_OBJECT
public:
    using ExitHandler = std::function<void(int)>;

    struct Options {
        bool closeToTray = true;
        bool openInspector = false;
    };

    explicit LifecycleController(Options options,
                                 ExitHandler exitHandler = {},
                                 QObject *parent = nullptr);
    ~LifecycleController() override;

    WindowRegistry &registry();
    const WindowRegistry &registry() const;

    // Registers a host window; the main window also gets the close filter.
    bool attachWindow(const QString &label, QWidget *window);

    // Creates the tray icon once; later calls return the existing tray.
    AppTray *installTray();
    AppTray *tray() const;

    // Close-to-tray applies only with the option on and a tray installed.
    bool trayModeActive() const;

    void handleEvent(const LifecycleEvent &event);

signals:
    // Emitted at setup when the developer inspector should be opened.
    void inspectorRequested();

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    Options m_options;
    ExitHandler m_exitHandler;
    WindowRegistry m_registry;
    std::unique_ptr<AppTray> m_tray;

    void onSetupComplete();
    void onSplashCloseRequested();
    void onWindowCloseRequested(const LifecycleEvent &event);
    void onTrayMenuClick(const QString &itemId);

    void showMain(const QString &why);
    void hideMain(const QString &why);
    void quit();
};

} // namespace axiestudio
