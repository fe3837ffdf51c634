#pragma once

#include <QMenu>
#include <QObject>
#include <QString>
#include <QSystemTrayIcon>

namespace axiestudio {

// Populates the fixed tray menu: Show, Hide, separator, Quit. Each action
// carries its item id in data() and objectName().
void buildTrayMenu(QMenu &menu);

// AppTray owns the process tray icon and its static menu. It only translates
// Qt tray activity into item ids; the lifecycle controller decides what they do.
class AppTray : public QObject
{
    Q_OBJECT
public:
    explicit AppTray(QObject *parent = nullptr);
    ~AppTray() override;

    QMenu *menu();
    QSystemTrayIcon *trayIcon();

    void showMessage(const QString &title, const QString &body);

signals:
    void leftClicked();
    void menuItemTriggered(const QString &itemId);

private slots:
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);
    void onMenuTriggered(QAction *action);

private:
    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;

    void setupTrayIcon();
};

} // namespace axiestudio
