#pragma once

#include <QString>

#include "common/models.hpp"

namespace axiestudio {

// Program used to hand URLs to the desktop (xdg-open, or open on macOS).
QString defaultUrlOpener();

// Launches `opener url` detached. On failure returns false and fills
// errorText with the OS error description.
bool openExternalUrl(const QString &url,
                     QString *errorText,
                     const QString &opener = defaultUrlOpener());

QString appIconPath();

PlatformInfo currentPlatformInfo();

} // namespace axiestudio
