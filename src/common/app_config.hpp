#pragma once

#include <QString>
#include <QStringList>
#include <QUrl>

namespace axiestudio {

// Production backend the desktop shell is built against.
inline constexpr const char *kBackendUrl = "https://flow.axiestudio.se";
inline constexpr const char *kHealthPath = "/health";
inline constexpr int kHealthTimeoutMs = 10 * 1000;
inline constexpr int kApiTimeoutMs = 30 * 1000;

struct AppConfig {
    QString backendUrl = QString::fromLatin1(kBackendUrl);
    QString frontendUrl = QString::fromLatin1(kBackendUrl);
    int healthTimeoutMs = kHealthTimeoutMs;
    int apiTimeoutMs = kApiTimeoutMs;

    bool closeToTray = true;
    bool showSplash = true;
    bool openInspector = false;
    bool traceLogging = false;

    QUrl healthUrl() const;
};

// Build-time version string baked in by the build system.
QString appVersion();

bool isDebugBuild();

// Parses the ambient switches (--trace, --devtools, --no-tray, --no-splash)
// and AXIESTUDIO_TRACE. The first element is the program name, as in argv.
AppConfig parseAppConfig(const QStringList &arguments);

} // namespace axiestudio
