#include "common/process_utils.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStringList>
#include <QSysInfo>
#include <QUrl>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace axiestudio {

namespace {

QString findIconNear(const QString &name)
{
    const QString appDir = QCoreApplication::applicationDirPath();
    const QStringList relCandidates = {
        QStringLiteral("."),
        QStringLiteral("resources"),
        QStringLiteral("../resources"),
        QStringLiteral("../../resources"),
        QStringLiteral("../share/axiestudio"),
        QStringLiteral("../share/icons/hicolor/256x256/apps"),
    };

    for (const QString &relPath : relCandidates) {
        const QString candidate =
            QDir(appDir).absoluteFilePath(relPath + QDir::separator() + name);
        if (QFileInfo::exists(candidate)) {
            return QFileInfo(candidate).absoluteFilePath();
        }
    }
    return QString();
}

} // namespace

QString defaultUrlOpener()
{
#if defined(Q_OS_MACOS)
    return QStringLiteral("open");
#else
    return QStringLiteral("xdg-open");
#endif
}

bool openExternalUrl(const QString &url, QString *errorText, const QString &opener)
{
    ALOG_INFO(QStringLiteral("ProcessUtils"),
              QStringLiteral("openExternalUrl"),
              QStringLiteral("open_external_url"),
              QStringLiteral("bridge_call"),
              QStringLiteral("process_start"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"opener", opener.toStdString()},
                              {"scheme", QUrl(url).scheme().toStdString()}}));

    QProcess process;
    process.setProgram(opener);
    process.setArguments({url});
    qint64 pid = 0;
    if (process.startDetached(&pid)) {
        return true;
    }

    if (errorText) {
        *errorText = process.errorString();
    }
    ALOG_WARN(QStringLiteral("ProcessUtils"),
              QStringLiteral("openExternalUrl"),
              QStringLiteral("open_external_url_failed"),
              QStringLiteral("bridge_call"),
              QStringLiteral("process_start"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"opener", opener.toStdString()},
                              {"error", process.errorString().toStdString()}}));
    return false;
}

QString appIconPath()
{
    const QString bundled = QStringLiteral(":/icons/axiestudio.svg");
    if (QFileInfo::exists(bundled)) {
        return bundled;
    }
    return findIconNear(QStringLiteral("axiestudio.svg"));
}

PlatformInfo currentPlatformInfo()
{
    PlatformInfo info;
    info.os = QSysInfo::productType().toStdString();
    info.osVersion = QSysInfo::productVersion().toStdString();
    info.kernel = (QSysInfo::kernelType() + QLatin1Char(' ')
                   + QSysInfo::kernelVersion()).toStdString();
    info.arch = QSysInfo::currentCpuArchitecture().toStdString();
    return info;
}

} // namespace axiestudio
