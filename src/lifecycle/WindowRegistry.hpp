#pragma once

#include <QHash>
#include <QPointer>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QWidget>

#include "common/enums.hpp"

namespace axiestudio {

/**
 * WindowRegistry resolves logical window labels ("main", "splashscreen") to
 * the live top-level widgets the host created.
 *
 * The registry never owns a window. Every call re-resolves the label, so a
 * window the host destroyed in the meantime reads as not found instead of a
 * dangling handle. A missing window is an expected outcome: the mutating
 * helpers log it at error severity and return false.
 */
class WindowRegistry
{
public:
    // Refuses a label that still maps to a live window.
    bool registerWindow(const QString &label, QWidget *window);
    void unregisterWindow(const QString &label);

    // nullptr when the label is unknown, closed, or the widget is gone.
    QWidget *window(const QString &label) const;
    bool contains(const QString &label) const;

    bool show(const QString &label);
    bool hide(const QString &label);

    // Terminal: the label reads Closed until a new window is registered.
    bool close(const QString &label);

    WindowVisibility visibility(const QString &label) const;
    QStringList labels() const;

private:
    struct Entry {
        QPointer<QWidget> window;
        bool everShown = false;
    };

    QHash<QString, Entry> m_windows;
    QSet<QString> m_closed;

    void logNotFound(const QString &where, const QString &label) const;
};

} // namespace axiestudio
