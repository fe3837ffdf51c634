#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <QEvent>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace axiestudio {

// Logical window labels shared by the registry, the controller and the bridge.
inline const QString kMainWindowLabel = QStringLiteral("main");
inline const QString kSplashWindowLabel = QStringLiteral("splashscreen");

// Tray menu item ids.
inline const QString kTrayItemShow = QStringLiteral("show");
inline const QString kTrayItemHide = QStringLiteral("hide");
inline const QString kTrayItemQuit = QStringLiteral("quit");

struct HealthResponse {
    std::string status;
};

struct ApiConfig {
    std::string backendUrl;
    std::uint64_t timeout = 0;
};

struct PlatformInfo {
    std::string os;
    std::string osVersion;
    std::string kernel;
    std::string arch;
};

// A host-originated lifecycle occurrence. Only the fields relevant to the
// kind are set; hostEvent is the Qt event a close request may veto.
struct LifecycleEvent {
    LifecycleEventKind kind = LifecycleEventKind::SetupComplete;
    QString windowLabel;
    QString menuItemId;
    QEvent *hostEvent = nullptr;
};

// Outcome of a bridge command: either a JSON value or an error kind with a
// human-readable message for the web caller.
struct CommandResult {
    BridgeErrorKind error = BridgeErrorKind::None;
    std::string message;
    nlohmann::json value;

    bool ok() const { return error == BridgeErrorKind::None; }

    static CommandResult success(nlohmann::json result = nullptr)
    {
        CommandResult out;
        out.value = std::move(result);
        return out;
    }

    static CommandResult failure(BridgeErrorKind kind, std::string text)
    {
        CommandResult out;
        out.error = kind;
        out.message = std::move(text);
        return out;
    }
};

} // namespace axiestudio
