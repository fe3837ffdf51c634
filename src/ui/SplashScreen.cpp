#include "ui/SplashScreen.hpp"

#include <QColor>
#include <QIcon>
#include <QPainter>
#include <QPixmap>

namespace axiestudio {

namespace {

constexpr int kSplashSize = 360;
constexpr int kIconSize = 160;

QPixmap renderSplashPixmap(const QString &iconPath)
{
    QPixmap pixmap(kSplashSize, kSplashSize);
    pixmap.fill(QColor(0x0f, 0x17, 0x2a));

    if (!iconPath.isEmpty()) {
        const QPixmap icon = QIcon(iconPath).pixmap(kIconSize, kIconSize);
        QPainter painter(&pixmap);
        painter.drawPixmap((kSplashSize - kIconSize) / 2,
                           (kSplashSize - kIconSize) / 2 - 20,
                           icon);
    }
    return pixmap;
}

} // namespace

std::unique_ptr<QSplashScreen> createSplashScreen(const QString &iconPath)
{
    auto splash = std::make_unique<QSplashScreen>(renderSplashPixmap(iconPath));
    splash->setWindowTitle(QStringLiteral("Axie Studio"));
    splash->showMessage(QStringLiteral("Loading Axie Studio..."),
                        Qt::AlignBottom | Qt::AlignHCenter,
                        Qt::white);
    return splash;
}

} // namespace axiestudio
