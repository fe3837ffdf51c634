#include "lifecycle/WindowRegistry.hpp"

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace axiestudio {

bool WindowRegistry::registerWindow(const QString &label, QWidget *window)
{
    if (!window) {
        ALOG_WARN(QStringLiteral("WindowRegistry"),
                  QStringLiteral("registerWindow"),
                  QStringLiteral("register_window_rejected"),
                  QStringLiteral("null_window"),
                  QStringLiteral("registry"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"label", label.toStdString()}}));
        return false;
    }

    QWidget *existing = this->window(label);
    if (existing == window) {
        return true;
    }
    if (existing) {
        ALOG_WARN(QStringLiteral("WindowRegistry"),
                  QStringLiteral("registerWindow"),
                  QStringLiteral("register_window_rejected"),
                  QStringLiteral("label_in_use"),
                  QStringLiteral("registry"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"label", label.toStdString()}}));
        return false;
    }

    Entry entry;
    entry.window = window;
    entry.everShown = window->isVisible();
    m_windows.insert(label, entry);
    m_closed.remove(label);

    ALOG_DEBUG(QStringLiteral("WindowRegistry"),
               QStringLiteral("registerWindow"),
               QStringLiteral("register_window"),
               QStringLiteral("host_setup"),
               QStringLiteral("registry"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"label", label.toStdString()}}));
    return true;
}

void WindowRegistry::unregisterWindow(const QString &label)
{
    m_windows.remove(label);
}

QWidget *WindowRegistry::window(const QString &label) const
{
    const auto it = m_windows.constFind(label);
    if (it == m_windows.constEnd()) {
        return nullptr;
    }
    return it->window.data();
}

bool WindowRegistry::contains(const QString &label) const
{
    return window(label) != nullptr;
}

bool WindowRegistry::show(const QString &label)
{
    QWidget *target = window(label);
    if (!target) {
        logNotFound(QStringLiteral("show"), label);
        return false;
    }

    if (target->isMinimized()) {
        target->showNormal();
    } else {
        target->show();
    }
    target->raise();
    target->activateWindow();
    m_windows[label].everShown = true;

    ALOG_DEBUG(QStringLiteral("WindowRegistry"),
               QStringLiteral("show"),
               QStringLiteral("window_shown"),
               QStringLiteral("lifecycle"),
               QStringLiteral("qt_widget"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"label", label.toStdString()}}));
    return true;
}

bool WindowRegistry::hide(const QString &label)
{
    QWidget *target = window(label);
    if (!target) {
        logNotFound(QStringLiteral("hide"), label);
        return false;
    }

    target->hide();

    ALOG_DEBUG(QStringLiteral("WindowRegistry"),
               QStringLiteral("hide"),
               QStringLiteral("window_hidden"),
               QStringLiteral("lifecycle"),
               QStringLiteral("qt_widget"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"label", label.toStdString()}}));
    return true;
}

bool WindowRegistry::close(const QString &label)
{
    QWidget *target = window(label);
    if (!target) {
        logNotFound(QStringLiteral("close"), label);
        return false;
    }

    if (!target->close()) {
        // An event filter or the widget itself vetoed the close.
        ALOG_WARN(QStringLiteral("WindowRegistry"),
                  QStringLiteral("close"),
                  QStringLiteral("window_close_vetoed"),
                  QStringLiteral("lifecycle"),
                  QStringLiteral("qt_widget"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"label", label.toStdString()}}));
        return false;
    }

    m_windows.remove(label);
    m_closed.insert(label);

    ALOG_INFO(QStringLiteral("WindowRegistry"),
              QStringLiteral("close"),
              QStringLiteral("window_closed"),
              QStringLiteral("lifecycle"),
              QStringLiteral("qt_widget"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"label", label.toStdString()}}));
    return true;
}

WindowVisibility WindowRegistry::visibility(const QString &label) const
{
    if (m_closed.contains(label)) {
        return WindowVisibility::Closed;
    }

    const auto it = m_windows.constFind(label);
    if (it == m_windows.constEnd()) {
        return WindowVisibility::Uninitialized;
    }
    if (!it->window) {
        return WindowVisibility::Closed;
    }
    if (it->window->isVisible()) {
        return WindowVisibility::Shown;
    }
    return it->everShown ? WindowVisibility::Hidden : WindowVisibility::Uninitialized;
}

QStringList WindowRegistry::labels() const
{
    return m_windows.keys();
}

void WindowRegistry::logNotFound(const QString &where, const QString &label) const
{
    ALOG_ERROR(QStringLiteral("WindowRegistry"),
               where,
               QStringLiteral("window_not_found"),
               QStringLiteral("lookup"),
               QStringLiteral("registry"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"label", label.toStdString()},
                               {"visibility", visibility(label)}}));
}

} // namespace axiestudio
