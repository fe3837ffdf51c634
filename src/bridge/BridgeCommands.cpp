#include "bridge/BridgeCommands.hpp"

#include <QPointer>
#include <QUrl>
#include <QUuid>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include "bridge/HealthClient.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "lifecycle/LifecycleController.hpp"
#include "tray/AppTray.hpp"

namespace axiestudio {

namespace {

std::optional<QString> stringArg(const nlohmann::json &args, const char *key)
{
    if (!args.is_object()) {
        return std::nullopt;
    }
    const auto it = args.find(key);
    if (it == args.end() || !it->is_string()) {
        return std::nullopt;
    }
    return QString::fromStdString(it->get<std::string>());
}

CommandResult missingArgument(const char *key)
{
    return CommandResult::failure(BridgeErrorKind::InvalidArguments,
                                  std::string("Missing string argument: ") + key);
}

} // namespace

BridgeCommands::BridgeCommands(const AppConfig &config,
                               LifecycleController &controller,
                               HealthClient &healthClient,
                               QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_controller(controller)
    , m_healthClient(healthClient)
    , m_urlOpener(defaultUrlOpener())
{
    registerHandlers();
}

BridgeCommands::~BridgeCommands() = default;

QString BridgeCommands::appVersion() const
{
    return axiestudio::appVersion();
}

QString BridgeCommands::greet(const QString &name) const
{
    return QStringLiteral("Hello, %1! You've been greeted from the desktop shell!").arg(name);
}

CommandResult BridgeCommands::openExternalUrl(const QString &url)
{
    const QUrl parsed(url, QUrl::StrictMode);
    if (url.trimmed().isEmpty() || !parsed.isValid() || parsed.scheme().isEmpty()) {
        return CommandResult::failure(BridgeErrorKind::InvalidArguments,
                                      "Invalid URL: " + url.toStdString());
    }

    QString errorText;
    if (!axiestudio::openExternalUrl(url, &errorText, m_urlOpener)) {
        return CommandResult::failure(BridgeErrorKind::ExternalProcessFailure,
                                      "Failed to open URL: " + errorText.toStdString());
    }
    return CommandResult::success();
}

CommandResult BridgeCommands::showMainWindow()
{
    // Same action as the host-side show, but the caller is told about a miss.
    if (!m_controller.registry().show(kMainWindowLabel)) {
        return CommandResult::failure(BridgeErrorKind::WindowNotFound,
                                      "Main window not found");
    }
    return CommandResult::success();
}

CommandResult BridgeCommands::hideMainWindow()
{
    if (!m_controller.registry().hide(kMainWindowLabel)) {
        return CommandResult::failure(BridgeErrorKind::WindowNotFound,
                                      "Main window not found");
    }
    return CommandResult::success();
}

CommandResult BridgeCommands::closeSplashscreen()
{
    LifecycleEvent event;
    event.kind = LifecycleEventKind::SplashCloseRequested;
    m_controller.handleEvent(event);
    return CommandResult::success();
}

void BridgeCommands::checkBackendHealth(ResultCallback callback)
{
    m_healthClient.check(std::move(callback));
}

QString BridgeCommands::backendUrl() const
{
    return m_config.backendUrl;
}

ApiConfig BridgeCommands::apiConfig() const
{
    ApiConfig config;
    config.backendUrl = m_config.backendUrl.toStdString();
    config.timeout = static_cast<std::uint64_t>(m_config.apiTimeoutMs);
    return config;
}

CommandResult BridgeCommands::showNotification(const QString &title, const QString &body)
{
    AppTray *tray = m_controller.tray();
    if (!tray) {
        return CommandResult::failure(BridgeErrorKind::TrayUnavailable,
                                      "System tray is not available");
    }
    tray->showMessage(title, body);
    return CommandResult::success();
}

PlatformInfo BridgeCommands::platformInfo() const
{
    return currentPlatformInfo();
}

void BridgeCommands::setUrlOpener(const QString &opener)
{
    m_urlOpener = opener;
}

void BridgeCommands::registerHandlers()
{
    m_handlers.insert(QStringLiteral("get_app_version"),
                      [this](const nlohmann::json &, ResultCallback done) {
        done(CommandResult::success(appVersion().toStdString()));
    });

    m_handlers.insert(QStringLiteral("greet"),
                      [this](const nlohmann::json &args, ResultCallback done) {
        const auto name = stringArg(args, "name");
        if (!name) {
            done(missingArgument("name"));
            return;
        }
        done(CommandResult::success(greet(*name).toStdString()));
    });

    m_handlers.insert(QStringLiteral("open_external_url"),
                      [this](const nlohmann::json &args, ResultCallback done) {
        const auto url = stringArg(args, "url");
        if (!url) {
            done(missingArgument("url"));
            return;
        }
        done(openExternalUrl(*url));
    });

    m_handlers.insert(QStringLiteral("show_main_window"),
                      [this](const nlohmann::json &, ResultCallback done) {
        done(showMainWindow());
    });

    m_handlers.insert(QStringLiteral("hide_main_window"),
                      [this](const nlohmann::json &, ResultCallback done) {
        done(hideMainWindow());
    });

    m_handlers.insert(QStringLiteral("close_splashscreen"),
                      [this](const nlohmann::json &, ResultCallback done) {
        done(closeSplashscreen());
    });

    m_handlers.insert(QStringLiteral("check_backend_health"),
                      [this](const nlohmann::json &, ResultCallback done) {
        checkBackendHealth(std::move(done));
    });

    m_handlers.insert(QStringLiteral("get_backend_url"),
                      [this](const nlohmann::json &, ResultCallback done) {
        done(CommandResult::success(backendUrl().toStdString()));
    });

    m_handlers.insert(QStringLiteral("get_api_config"),
                      [this](const nlohmann::json &, ResultCallback done) {
        done(CommandResult::success(nlohmann::json(apiConfig())));
    });

    m_handlers.insert(QStringLiteral("show_notification"),
                      [this](const nlohmann::json &args, ResultCallback done) {
        const auto title = stringArg(args, "title");
        if (!title) {
            done(missingArgument("title"));
            return;
        }
        done(showNotification(*title, stringArg(args, "body").value_or(QString())));
    });

    m_handlers.insert(QStringLiteral("get_platform_info"),
                      [this](const nlohmann::json &, ResultCallback done) {
        done(CommandResult::success(nlohmann::json(platformInfo())));
    });
}

void BridgeCommands::dispatch(const QString &command,
                              const nlohmann::json &args,
                              ResultCallback callback)
{
    const auto it = m_handlers.constFind(command);
    if (it == m_handlers.constEnd()) {
        ALOG_WARN(QStringLiteral("BridgeCommands"),
                  QStringLiteral("dispatch"),
                  QStringLiteral("unknown_command"),
                  QStringLiteral("bridge_call"),
                  QStringLiteral("web_channel"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"command", command.toStdString()}}));
        callback(CommandResult::failure(BridgeErrorKind::UnknownCommand,
                                        "Unknown command: " + command.toStdString()));
        return;
    }
    it.value()(args, std::move(callback));
}

QStringList BridgeCommands::commandNames() const
{
    QStringList names = m_handlers.keys();
    std::sort(names.begin(), names.end());
    return names;
}

void BridgeCommands::invoke(int callId, const QString &command, const QJsonObject &args)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);

    const nlohmann::json params = fromQJsonObject(args);
    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    ALOG_INFO(QStringLiteral("BridgeCommands"),
              QStringLiteral("invoke"),
              QStringLiteral("bridge_command_received"),
              QStringLiteral("web_call"),
              QStringLiteral("web_channel"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"command", command.toStdString()},
                              {"callId", callId},
                              {"paramKeys", paramKeys}}));

    QPointer<BridgeCommands> self(this);
    dispatch(command, params, [self, callId, command, corrId](const CommandResult &result) {
        if (!self) {
            return;
        }
        if (!result.ok()) {
            ALOG_WARN(QStringLiteral("BridgeCommands"),
                      QStringLiteral("invoke"),
                      QStringLiteral("bridge_command_failed"),
                      QStringLiteral("web_call"),
                      QStringLiteral("web_channel"),
                      logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"command", command.toStdString()},
                                      {"kind", result.error},
                                      {"error", result.message}}));
        }
        emit self->commandFinished(callId, toQJsonObject(result));
    });
}

} // namespace axiestudio
