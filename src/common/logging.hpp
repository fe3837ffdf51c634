#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace axiestudio::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Opens <process>.log (and <process>-trace.log when tracing) for the current
// process. Call early in main(); events logged before that go to files named
// after the application.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory that receives <process>.log and <process>-trace.log.
QString logsDirPath();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultWho();

} // namespace axiestudio::logging

#define ALOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::axiestudio::logging::logEvent(::axiestudio::logging::LogLevel::Debug, \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ALOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::axiestudio::logging::logEvent(::axiestudio::logging::LogLevel::Info, \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ALOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::axiestudio::logging::logEvent(::axiestudio::logging::LogLevel::Warn, \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ALOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::axiestudio::logging::logEvent(::axiestudio::logging::LogLevel::Error, \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
