#include "tray/AppTray.hpp"

#include <QAction>
#include <QIcon>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace axiestudio {

namespace {

constexpr int kMessageTimeoutMs = 5000;

QAction *addItem(QMenu &menu, const QString &id, const QString &label)
{
    QAction *action = menu.addAction(label);
    action->setObjectName(id);
    action->setData(id);
    return action;
}

QString reasonToString(QSystemTrayIcon::ActivationReason reason)
{
    switch (reason) {
    case QSystemTrayIcon::Unknown:
        return QStringLiteral("unknown");
    case QSystemTrayIcon::Context:
        return QStringLiteral("context");
    case QSystemTrayIcon::DoubleClick:
        return QStringLiteral("double_click");
    case QSystemTrayIcon::Trigger:
        return QStringLiteral("trigger");
    case QSystemTrayIcon::MiddleClick:
        return QStringLiteral("middle_click");
    }
    return QStringLiteral("unknown");
}

} // namespace

void buildTrayMenu(QMenu &menu)
{
    addItem(menu, kTrayItemShow, QStringLiteral("Show"));
    addItem(menu, kTrayItemHide, QStringLiteral("Hide"));
    menu.addSeparator();
    addItem(menu, kTrayItemQuit, QStringLiteral("Quit"));
}

AppTray::AppTray(QObject *parent)
    : QObject(parent)
{
    buildTrayMenu(m_menu);
    connect(&m_menu, &QMenu::triggered, this, &AppTray::onMenuTriggered);
    setupTrayIcon();

    ALOG_INFO(QStringLiteral("AppTray"),
              QStringLiteral("AppTray"),
              QStringLiteral("tray_created"),
              QStringLiteral("host_setup"),
              QStringLiteral("qt_tray"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"available", QSystemTrayIcon::isSystemTrayAvailable()}}));
}

AppTray::~AppTray() = default;

QMenu *AppTray::menu()
{
    return &m_menu;
}

QSystemTrayIcon *AppTray::trayIcon()
{
    return &m_trayIcon;
}

void AppTray::showMessage(const QString &title, const QString &body)
{
    m_trayIcon.showMessage(title, body, QSystemTrayIcon::Information, kMessageTimeoutMs);
}

void AppTray::setupTrayIcon()
{
    const QString iconPath = appIconPath();
    if (!iconPath.isEmpty()) {
        m_trayIcon.setIcon(QIcon(iconPath));
    } else {
        m_trayIcon.setIcon(QIcon::fromTheme(QStringLiteral("applications-internet")));
    }
    m_trayIcon.setToolTip(QStringLiteral("Axie Studio"));
    m_trayIcon.setContextMenu(&m_menu);

    connect(&m_trayIcon, &QSystemTrayIcon::activated,
            this, &AppTray::onTrayActivated);

    m_trayIcon.show();
}

void AppTray::onTrayActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::Trigger) {
        emit leftClicked();
        return;
    }

    // The context menu is opened by Qt itself; other clicks are not bound.
    ALOG_DEBUG(QStringLiteral("AppTray"),
               QStringLiteral("onTrayActivated"),
               QStringLiteral("tray_activation_ignored"),
               QStringLiteral("tray_click"),
               QStringLiteral("qt_tray"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"reason", reasonToString(reason).toStdString()}}));
}

void AppTray::onMenuTriggered(QAction *action)
{
    if (!action) {
        return;
    }
    emit menuItemTriggered(action->data().toString());
}

} // namespace axiestudio
