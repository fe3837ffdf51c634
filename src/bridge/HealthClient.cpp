#include "bridge/HealthClient.hpp"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>

#include <chrono>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/app_config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace axiestudio {

HealthClient::HealthClient(const QUrl &endpoint, int timeoutMs, QObject *parent)
    : QObject(parent)
    , m_network(new QNetworkAccessManager(this))
    , m_endpoint(endpoint)
    , m_timeoutMs(timeoutMs)
{
}

HealthClient::~HealthClient() = default;

QUrl HealthClient::endpoint() const
{
    return m_endpoint;
}

int HealthClient::timeoutMs() const
{
    return m_timeoutMs;
}

void HealthClient::check(Callback callback)
{
    QNetworkRequest request(m_endpoint);
    request.setTransferTimeout(m_timeoutMs);
    request.setRawHeader("Accept", "application/json");
    request.setHeader(QNetworkRequest::UserAgentHeader,
                      QStringLiteral("AxieStudioDesktop/%1").arg(appVersion()));

    const QString corrId = logging::currentCorrelationId();
    ALOG_INFO(QStringLiteral("HealthClient"),
              QStringLiteral("check"),
              QStringLiteral("health_check_start"),
              QStringLiteral("bridge_call"),
              QStringLiteral("http_get"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"url", m_endpoint.toString().toStdString()},
                              {"timeoutMs", m_timeoutMs}}));

    const auto start = std::chrono::steady_clock::now();
    QNetworkReply *reply = m_network->get(request);
    connect(reply, &QNetworkReply::finished, this,
            [reply, corrId, start, callback = std::move(callback)]() {
        const CommandResult result = classifyReply(reply);
        reply->deleteLater();

        const auto durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (result.ok()) {
            ALOG_INFO(QStringLiteral("HealthClient"),
                      QStringLiteral("check"),
                      QStringLiteral("health_check_completed"),
                      QStringLiteral("bridge_call"),
                      QStringLiteral("http_get"),
                      logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"durationMs", durationMs},
                                      {"health", result.value}}));
        } else {
            ALOG_WARN(QStringLiteral("HealthClient"),
                      QStringLiteral("check"),
                      QStringLiteral("health_check_failed"),
                      QStringLiteral("bridge_call"),
                      QStringLiteral("http_get"),
                      logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"durationMs", durationMs},
                                      {"kind", result.error},
                                      {"error", result.message}}));
        }

        if (callback) {
            callback(result);
        }
    });
}

CommandResult HealthClient::classifyReply(QNetworkReply *reply)
{
    // Connection and proxy level errors (codes below ContentAccessDenied)
    // mean the transfer never completed, even if a status line arrived:
    // the transfer timeout aborts a stalled body with OperationCanceledError.
    const QNetworkReply::NetworkError error = reply->error();
    const bool transportFailed = error != QNetworkReply::NoError
        && error < QNetworkReply::ContentAccessDenied;

    // No status code means no HTTP response at all: refused, DNS or TLS.
    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (transportFailed || !statusAttr.isValid()) {
        return CommandResult::failure(
            BridgeErrorKind::NetworkFailure,
            "Failed to connect to backend: " + reply->errorString().toStdString());
    }

    const int status = statusAttr.toInt();
    if (status < 200 || status >= 300) {
        const QString reason =
            reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        QString text = QString::number(status);
        if (!reason.isEmpty()) {
            text += QLatin1Char(' ') + reason;
        }
        return CommandResult::failure(
            BridgeErrorKind::HttpStatusFailure,
            "Backend health check failed with status: " + text.toStdString());
    }

    std::string parseError;
    const auto health = parseHealthResponse(reply->readAll(), &parseError);
    if (!health) {
        return CommandResult::failure(
            BridgeErrorKind::ResponseParseFailure,
            "Failed to parse health response: " + parseError);
    }
    return CommandResult::success(nlohmann::json(*health));
}

} // namespace axiestudio
