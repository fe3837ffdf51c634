#pragma once

#include <QSplashScreen>
#include <QString>

#include <memory>

namespace axiestudio {

// Builds the "splashscreen" window shown while the frontend loads. Closing
// it only hides it; the caller's handle keeps it alive.
std::unique_ptr<QSplashScreen> createSplashScreen(const QString &iconPath);

} // namespace axiestudio
