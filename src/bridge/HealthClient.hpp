#pragma once

#include <functional>

#include <QObject>
#include <QUrl>

#include "common/models.hpp"

class QNetworkAccessManager;
class QNetworkReply;

namespace axiestudio {

/**
 * HealthClient probes the backend health endpoint.
 *
 * Every check() issues one GET with a bounded transfer timeout and owns its
 * own reply; concurrent checks share nothing but the access manager. The
 * callback runs on the GUI thread with either the parsed HealthResponse or
 * one of NetworkFailure, HttpStatusFailure, ResponseParseFailure.
 */
class HealthClient : public QObject
{
    Q_OBJECT
public:
    using Callback = std::function<void(const CommandResult &)>;

    explicit HealthClient(const QUrl &endpoint, int timeoutMs, QObject *parent = nullptr);
    ~HealthClient() override;

    QUrl endpoint() const;
    int timeoutMs() const;

    void check(Callback callback);

    // Maps a finished reply to a command result.
    static CommandResult classifyReply(QNetworkReply *reply);

private:
    QNetworkAccessManager *m_network;
    QUrl m_endpoint;
    int m_timeoutMs;
};

} // namespace axiestudio
