#include <QtTest/QtTest>

#include <QJsonObject>
#include <QSignalSpy>
#include <QWidget>

#include <optional>

#include <nlohmann/json.hpp>

#include "bridge/BridgeCommands.hpp"
#include "bridge/HealthClient.hpp"
#include "common/app_config.hpp"
#include "common/models.hpp"
#include "lifecycle/LifecycleController.hpp"

class BridgeCommandsTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();
    void testAppVersionIsStable();
    void testGreet();
    void testShowMainWindowWithoutWindow();
    void testShowAndHideMainWindow();
    void testCloseSplashscreenShowsMain();
    void testUnknownCommand();
    void testMissingArguments();
    void testInvokeReportsThroughSignal();
    void testOpenExternalUrl();
    void testOpenExternalUrlRejectsInvalid();
    void testBackendSettings();
    void testNotificationWithoutTray();
    void testPlatformInfo();
    void testCommandNames();

private:
    axiestudio::AppConfig m_config;
    axiestudio::LifecycleController *m_controller = nullptr;
    axiestudio::HealthClient *m_health = nullptr;
    axiestudio::BridgeCommands *m_bridge = nullptr;

    axiestudio::CommandResult run(const QString &command,
                                  const nlohmann::json &args = nlohmann::json::object());
};

void BridgeCommandsTests::init()
{
    m_config = axiestudio::AppConfig();
    m_controller = new axiestudio::LifecycleController({}, [](int) {});
    m_health = new axiestudio::HealthClient(m_config.healthUrl(), m_config.healthTimeoutMs);
    m_bridge = new axiestudio::BridgeCommands(m_config, *m_controller, *m_health);
}

void BridgeCommandsTests::cleanup()
{
    delete m_bridge;
    delete m_health;
    delete m_controller;
    m_bridge = nullptr;
    m_health = nullptr;
    m_controller = nullptr;
}

axiestudio::CommandResult BridgeCommandsTests::run(const QString &command,
                                                   const nlohmann::json &args)
{
    std::optional<axiestudio::CommandResult> out;
    m_bridge->dispatch(command, args, [&out](const axiestudio::CommandResult &r) { out = r; });
    if (!out) {
        return axiestudio::CommandResult::failure(axiestudio::BridgeErrorKind::UnknownCommand,
                                                  "no synchronous result");
    }
    return *out;
}

void BridgeCommandsTests::testAppVersionIsStable()
{
    const auto first = run(QStringLiteral("get_app_version"));
    QVERIFY(first.ok());
    QVERIFY(first.value.is_string());
    QCOMPARE(QString::fromStdString(first.value.get<std::string>()), m_bridge->appVersion());

    const auto second = run(QStringLiteral("get_app_version"));
    QVERIFY(first.value == second.value);
}

void BridgeCommandsTests::testGreet()
{
    QCOMPARE(m_bridge->greet(QStringLiteral("Ada")),
             QStringLiteral("Hello, Ada! You've been greeted from the desktop shell!"));
    QCOMPARE(m_bridge->greet(QString()),
             QStringLiteral("Hello, ! You've been greeted from the desktop shell!"));

    const auto result = run(QStringLiteral("greet"), nlohmann::json{{"name", "Ada"}});
    QVERIFY(result.ok());
    QCOMPARE(QString::fromStdString(result.value.get<std::string>()),
             QStringLiteral("Hello, Ada! You've been greeted from the desktop shell!"));
}

void BridgeCommandsTests::testShowMainWindowWithoutWindow()
{
    const auto shown = run(QStringLiteral("show_main_window"));
    QCOMPARE(shown.error, axiestudio::BridgeErrorKind::WindowNotFound);
    QCOMPARE(QString::fromStdString(shown.message), QStringLiteral("Main window not found"));

    const auto hidden = m_bridge->hideMainWindow();
    QCOMPARE(hidden.error, axiestudio::BridgeErrorKind::WindowNotFound);
}

void BridgeCommandsTests::testShowAndHideMainWindow()
{
    QWidget main;
    QVERIFY(m_controller->attachWindow(axiestudio::kMainWindowLabel, &main));

    QVERIFY(run(QStringLiteral("show_main_window")).ok());
    QVERIFY(main.isVisible());
    QVERIFY(run(QStringLiteral("show_main_window")).ok());
    QVERIFY(main.isVisible());

    QVERIFY(run(QStringLiteral("hide_main_window")).ok());
    QVERIFY(!main.isVisible());
}

void BridgeCommandsTests::testCloseSplashscreenShowsMain()
{
    QWidget main;
    QWidget splash;
    QVERIFY(m_controller->attachWindow(axiestudio::kMainWindowLabel, &main));
    QVERIFY(m_controller->attachWindow(axiestudio::kSplashWindowLabel, &splash));
    splash.show();

    QVERIFY(run(QStringLiteral("close_splashscreen")).ok());
    QVERIFY(!splash.isVisible());
    QVERIFY(main.isVisible());

    // Idempotent once the splash is gone.
    QVERIFY(run(QStringLiteral("close_splashscreen")).ok());
}

void BridgeCommandsTests::testUnknownCommand()
{
    const auto result = run(QStringLiteral("format_disk"));
    QCOMPARE(result.error, axiestudio::BridgeErrorKind::UnknownCommand);
    QCOMPARE(QString::fromStdString(result.message), QStringLiteral("Unknown command: format_disk"));
}

void BridgeCommandsTests::testMissingArguments()
{
    const auto greet = run(QStringLiteral("greet"));
    QCOMPARE(greet.error, axiestudio::BridgeErrorKind::InvalidArguments);
    QCOMPARE(QString::fromStdString(greet.message), QStringLiteral("Missing string argument: name"));

    const auto open = run(QStringLiteral("open_external_url"), nlohmann::json{{"url", 42}});
    QCOMPARE(open.error, axiestudio::BridgeErrorKind::InvalidArguments);
    QCOMPARE(QString::fromStdString(open.message), QStringLiteral("Missing string argument: url"));
}

void BridgeCommandsTests::testInvokeReportsThroughSignal()
{
    QSignalSpy spy(m_bridge, &axiestudio::BridgeCommands::commandFinished);

    QJsonObject args;
    args.insert(QStringLiteral("name"), QStringLiteral("Lin"));
    m_bridge->invoke(7, QStringLiteral("greet"), args);
    m_bridge->invoke(8, QStringLiteral("show_main_window"), QJsonObject());

    QCOMPARE(spy.count(), 2);

    QCOMPARE(spy.at(0).at(0).toInt(), 7);
    const QJsonObject greet = spy.at(0).at(1).toJsonObject();
    QCOMPARE(greet.value("ok").toBool(), true);
    QCOMPARE(greet.value("value").toString(),
             QStringLiteral("Hello, Lin! You've been greeted from the desktop shell!"));

    QCOMPARE(spy.at(1).at(0).toInt(), 8);
    const QJsonObject show = spy.at(1).at(1).toJsonObject();
    QCOMPARE(show.value("ok").toBool(), false);
    QCOMPARE(show.value("kind").toString(), QStringLiteral("window_not_found"));
    QCOMPARE(show.value("error").toString(), QStringLiteral("Main window not found"));
}

void BridgeCommandsTests::testOpenExternalUrl()
{
    m_bridge->setUrlOpener(QStringLiteral("true"));
    QVERIFY(m_bridge->openExternalUrl(QStringLiteral("https://example.com")).ok());

    m_bridge->setUrlOpener(QStringLiteral("/nonexistent/axiestudio-url-opener"));
    const auto result = run(QStringLiteral("open_external_url"),
                            nlohmann::json{{"url", "https://example.com"}});
    QCOMPARE(result.error, axiestudio::BridgeErrorKind::ExternalProcessFailure);
    QVERIFY(QString::fromStdString(result.message).startsWith(QStringLiteral("Failed to open URL: ")));
}

void BridgeCommandsTests::testOpenExternalUrlRejectsInvalid()
{
    m_bridge->setUrlOpener(QStringLiteral("true"));
    const auto empty = m_bridge->openExternalUrl(QString());
    QCOMPARE(empty.error, axiestudio::BridgeErrorKind::InvalidArguments);

    const auto relative = m_bridge->openExternalUrl(QStringLiteral("not a url"));
    QCOMPARE(relative.error, axiestudio::BridgeErrorKind::InvalidArguments);
    QCOMPARE(QString::fromStdString(relative.message), QStringLiteral("Invalid URL: not a url"));
}

void BridgeCommandsTests::testBackendSettings()
{
    const auto url = run(QStringLiteral("get_backend_url"));
    QVERIFY(url.ok());
    QCOMPARE(QString::fromStdString(url.value.get<std::string>()),
             QStringLiteral("https://flow.axiestudio.se"));

    const auto config = run(QStringLiteral("get_api_config"));
    QVERIFY(config.ok());
    QCOMPARE(QString::fromStdString(config.value.value("backend_url", "")),
             QStringLiteral("https://flow.axiestudio.se"));
    QCOMPARE(config.value.value("timeout", 0), 30000);
}

void BridgeCommandsTests::testNotificationWithoutTray()
{
    const auto missingTitle = run(QStringLiteral("show_notification"));
    QCOMPARE(missingTitle.error, axiestudio::BridgeErrorKind::InvalidArguments);

    const auto result = run(QStringLiteral("show_notification"),
                            nlohmann::json{{"title", "Flow finished"}, {"body", "Done"}});
    QCOMPARE(result.error, axiestudio::BridgeErrorKind::TrayUnavailable);
    QCOMPARE(QString::fromStdString(result.message), QStringLiteral("System tray is not available"));
}

void BridgeCommandsTests::testPlatformInfo()
{
    const auto result = run(QStringLiteral("get_platform_info"));
    QVERIFY(result.ok());
    QVERIFY(result.value.contains("os"));
    QVERIFY(result.value.contains("os_version"));
    QVERIFY(result.value.contains("kernel"));
    QVERIFY(!result.value.value("arch", "").empty());
}

void BridgeCommandsTests::testCommandNames()
{
    const QStringList expected = {
        QStringLiteral("check_backend_health"),
        QStringLiteral("close_splashscreen"),
        QStringLiteral("get_api_config"),
        QStringLiteral("get_app_version"),
        QStringLiteral("get_backend_url"),
        QStringLiteral("get_platform_info"),
        QStringLiteral("greet"),
        QStringLiteral("hide_main_window"),
        QStringLiteral("open_external_url"),
        QStringLiteral("show_main_window"),
        QStringLiteral("show_notification"),
    };
    QCOMPARE(m_bridge->commandNames(), expected);
}

QTEST_MAIN(BridgeCommandsTests)
#include "test_bridge_commands.moc"
