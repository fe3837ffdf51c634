#pragma once

#include <functional>

#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/app_config.hpp"
#include "common/models.hpp"

namespace axiestudio {

class HealthClient;
class LifecycleController;

/**
 * BridgeCommands is the native command surface offered to the hosted web
 * content.
 *
 * The typed methods are the C++ API; dispatch() routes a command name and a
 * JSON argument object to them through a handler table, and invoke() is the
 * WebChannel entry point that reports every outcome via commandFinished().
 * Caller-facing failures are returned as CommandResult errors, never thrown.
 */
class BridgeCommands : public QObject
{
    Q_OBJECT
public:
    using ResultCallback = std::function<void(const CommandResult &)>;
    using Handler = std::function<void(const nlohmann::json &, ResultCallback)>;

    BridgeCommands(const AppConfig &config,
                   LifecycleController &controller,
                   HealthClient &healthClient,
                   QObject *parent = nullptr);
    ~BridgeCommands() override;

    QString appVersion() const;
    QString greet(const QString &name) const;
    CommandResult openExternalUrl(const QString &url);
    CommandResult showMainWindow();
    CommandResult hideMainWindow();
    CommandResult closeSplashscreen();
    void checkBackendHealth(ResultCallback callback);
    QString backendUrl() const;
    ApiConfig apiConfig() const;
    CommandResult showNotification(const QString &title, const QString &body);
    PlatformInfo platformInfo() const;

    void setUrlOpener(const QString &opener);

    void dispatch(const QString &command, const nlohmann::json &args, ResultCallback callback);
    QStringList commandNames() const;

    Q_INVOKABLE void invoke(int callId, const QString &command, const QJsonObject &args);

signals:
    void commandFinished(int callId, const QJsonObject &result);

private:
    AppConfig m_config;
    LifecycleController &m_controller;
    HealthClient &m_healthClient;
    QString m_urlOpener;
    QHash<QString, Handler> m_handlers;

    void registerHandlers();
};

} // namespace axiestudio
