#include <QtTest/QtTest>

#include <QJsonObject>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testParseHealthResponse();
    void testParseHealthResponseRejectsMalformed_data();
    void testParseHealthResponseRejectsMalformed();
    void testApiConfigJson();
    void testCommandResultSuccessJson();
    void testCommandResultFailureJson();
    void testQJsonConversionKeepsScalars();
    void testFromQJsonObject();
};

void ModelsJsonTests::testParseHealthResponse()
{
    std::string error;
    const auto health = axiestudio::parseHealthResponse(
        QByteArrayLiteral(R"({"status":"ok","uptime":12})"), &error);
    QVERIFY(health.has_value());
    QCOMPARE(QString::fromStdString(health->status), QStringLiteral("ok"));
    QVERIFY(error.empty());

    const nlohmann::json j = *health;
    QVERIFY(j == (nlohmann::json{{"status", "ok"}}));
}

void ModelsJsonTests::testParseHealthResponseRejectsMalformed_data()
{
    QTest::addColumn<QByteArray>("body");

    QTest::newRow("not json") << QByteArrayLiteral("<html>Bad Gateway</html>");
    QTest::newRow("empty") << QByteArray();
    QTest::newRow("array") << QByteArrayLiteral(R"(["ok"])");
    QTest::newRow("missing status") << QByteArrayLiteral(R"({"state":"ok"})");
    QTest::newRow("numeric status") << QByteArrayLiteral(R"({"status":200})");
}

void ModelsJsonTests::testParseHealthResponseRejectsMalformed()
{
    QFETCH(QByteArray, body);

    std::string error;
    const auto health = axiestudio::parseHealthResponse(body, &error);
    QVERIFY(!health.has_value());
    QVERIFY(!error.empty());
}

void ModelsJsonTests::testApiConfigJson()
{
    axiestudio::ApiConfig config;
    config.backendUrl = "https://flow.axiestudio.se";
    config.timeout = 30000;

    const nlohmann::json j = config;
    QCOMPARE(QString::fromStdString(j.value("backend_url", "")),
             QStringLiteral("https://flow.axiestudio.se"));
    QCOMPARE(j.value("timeout", 0), 30000);

    const auto parsed = j.get<axiestudio::ApiConfig>();
    QCOMPARE(QString::fromStdString(parsed.backendUrl),
             QStringLiteral("https://flow.axiestudio.se"));
    QVERIFY(parsed.timeout == 30000u);
}

void ModelsJsonTests::testCommandResultSuccessJson()
{
    const auto result = axiestudio::CommandResult::success(nlohmann::json{{"status", "ok"}});
    QVERIFY(result.ok());

    const QJsonObject object = axiestudio::toQJsonObject(result);
    QCOMPARE(object.value("ok").toBool(), true);
    QCOMPARE(object.value("value").toObject().value("status").toString(), QStringLiteral("ok"));
    QVERIFY(!object.contains("error"));
}

void ModelsJsonTests::testCommandResultFailureJson()
{
    const auto result = axiestudio::CommandResult::failure(
        axiestudio::BridgeErrorKind::WindowNotFound, "Main window not found");
    QVERIFY(!result.ok());

    const QJsonObject object = axiestudio::toQJsonObject(result);
    QCOMPARE(object.value("ok").toBool(), false);
    QCOMPARE(object.value("kind").toString(), QStringLiteral("window_not_found"));
    QCOMPARE(object.value("error").toString(), QStringLiteral("Main window not found"));
}

void ModelsJsonTests::testQJsonConversionKeepsScalars()
{
    QCOMPARE(axiestudio::toQJsonValue(nlohmann::json("1.2.3")).toString(), QStringLiteral("1.2.3"));
    QCOMPARE(axiestudio::toQJsonValue(nlohmann::json(42)).toInt(), 42);
    QVERIFY(axiestudio::toQJsonValue(nlohmann::json(nullptr)).isNull());
}

void ModelsJsonTests::testFromQJsonObject()
{
    QJsonObject args;
    args.insert(QStringLiteral("url"), QStringLiteral("https://example.com"));
    const nlohmann::json parsed = axiestudio::fromQJsonObject(args);
    QCOMPARE(QString::fromStdString(parsed.value("url", "")), QStringLiteral("https://example.com"));

    QVERIFY(axiestudio::fromQJsonObject(QJsonObject()).empty());
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
