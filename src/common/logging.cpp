#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace axiestudio::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

// Append-only JSON-lines file. Kept open between events; rotated to
// "<path>.1" once it reaches kMaxLogSizeBytes.
class LogSink
{
public:
    void reset(const QString &path)
    {
        m_file.close();
        m_path = path;
    }

    void write(const QByteArray &line)
    {
        if (m_file.isOpen() && m_file.size() >= kMaxLogSizeBytes) {
            m_file.close();
            rotate();
        }
        if (!m_file.isOpen() && !open()) {
            std::fprintf(stderr, "%s\n", line.constData());
            return;
        }
        m_file.write(line);
        m_file.write("\n");
        m_file.flush();
    }

private:
    QString m_path;
    QFile m_file;

    bool open()
    {
        QDir().mkpath(QFileInfo(m_path).absolutePath());
        if (QFileInfo(m_path).size() >= kMaxLogSizeBytes) {
            rotate();
        }
        m_file.setFileName(m_path);
        return m_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
    }

    void rotate()
    {
        const QString rotated = m_path + QStringLiteral(".1");
        QFile::remove(rotated);
        QFile::rename(m_path, rotated);
    }
};

std::mutex g_logMutex;
bool g_traceEnabled = false;
bool g_sinksReady = false;
LogSink g_mainSink;
LogSink g_traceSink;

thread_local QString t_corrId;

const char *levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString fallbackProcessName()
{
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("axiestudio");
}

// Caller holds g_logMutex.
void openSinks(const QString &processName)
{
    const QString base = logsDirPath() + QDir::separator() + processName;
    g_mainSink.reset(base + QStringLiteral(".log"));
    g_traceSink.reset(base + QStringLiteral("-trace.log"));
    g_sinksReady = true;
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_traceEnabled = traceEnabled;
    openSinks(processName.isEmpty() ? fallbackProcessName() : processName);
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/axiestudio/logs");
    }
    return home + QStringLiteral("/.local/share/axiestudio/logs");
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultWho()
{
    static const QString who = []() {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname)) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !g_traceEnabled) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level)},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(payload.dump());

    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_sinksReady) {
            openSinks(fallbackProcessName());
        }
        g_mainSink.write(line);
        if (g_traceEnabled) {
            g_traceSink.write(line);
        }
    }

    // Failures also go to the Qt message handler so a terminal launch shows them.
    if (level == LogLevel::Error) {
        qCritical().noquote() << component << where << what << why;
    } else if (level == LogLevel::Warn && g_traceEnabled) {
        qWarning().noquote() << component << where << what << why;
    }
}

} // namespace axiestudio::logging
