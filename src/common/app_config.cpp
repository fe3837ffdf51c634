#include "common/app_config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>

#ifndef AXIESTUDIO_VERSION
#define AXIESTUDIO_VERSION "0.0.0"
#endif

namespace axiestudio {

QUrl AppConfig::healthUrl() const
{
    QUrl url(backendUrl);
    QString path = url.path();
    if (path.endsWith(QLatin1Char('/'))) {
        path.chop(1);
    }
    url.setPath(path + QString::fromLatin1(kHealthPath));
    return url;
}

QString appVersion()
{
    return QStringLiteral(AXIESTUDIO_VERSION);
}

bool isDebugBuild()
{
#ifdef NDEBUG
    return false;
#else
    return true;
#endif
}

AppConfig parseAppConfig(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Axie Studio desktop shell"));
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    QCommandLineOption devtoolsOption(QStringList() << "devtools",
                                      "Open the web inspector on startup.");
    QCommandLineOption noTrayOption(QStringList() << "no-tray",
                                    "Quit when the main window is closed instead of hiding it.");
    QCommandLineOption noSplashOption(QStringList() << "no-splash",
                                      "Skip the splash screen.");
    parser.addOption(traceOption);
    parser.addOption(devtoolsOption);
    parser.addOption(noTrayOption);
    parser.addOption(noSplashOption);

    // Unknown flags (e.g. Chromium switches meant for the webview) are ignored.
    if (!parser.parse(arguments)) {
        qInfo() << "Ignoring command line:" << parser.errorText();
    }

    AppConfig config;
    config.traceLogging = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("AXIESTUDIO_TRACE") == 1;
    config.openInspector = parser.isSet(devtoolsOption) || isDebugBuild();
    config.closeToTray = !parser.isSet(noTrayOption);
    config.showSplash = !parser.isSet(noSplashOption);
    return config;
}

} // namespace axiestudio
