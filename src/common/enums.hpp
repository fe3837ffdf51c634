#pragma once

namespace axiestudio {

enum class WindowVisibility {
    Uninitialized,
    Shown,
    Hidden,
    Closed
};

enum class LifecycleEventKind {
    SetupComplete,
    SplashCloseRequested,
    WindowCloseRequested,
    TrayLeftClick,
    TrayMenuClick
};

enum class BridgeErrorKind {
    None,
    WindowNotFound,
    ExternalProcessFailure,
    NetworkFailure,
    HttpStatusFailure,
    ResponseParseFailure,
    InvalidArguments,
    UnknownCommand,
    TrayUnavailable
};

} // namespace axiestudio
