#pragma once

#include <optional>
#include <string>

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace axiestudio {

inline std::string toErrorKindString(BridgeErrorKind kind)
{
    switch (kind) {
    case BridgeErrorKind::None:
        return "none";
    case BridgeErrorKind::WindowNotFound:
        return "window_not_found";
    case BridgeErrorKind::ExternalProcessFailure:
        return "external_process_failure";
    case BridgeErrorKind::NetworkFailure:
        return "network_failure";
    case BridgeErrorKind::HttpStatusFailure:
        return "http_status_failure";
    case BridgeErrorKind::ResponseParseFailure:
        return "response_parse_failure";
    case BridgeErrorKind::InvalidArguments:
        return "invalid_arguments";
    case BridgeErrorKind::UnknownCommand:
        return "unknown_command";
    case BridgeErrorKind::TrayUnavailable:
        return "tray_unavailable";
    }
    return "none";
}

inline std::string toVisibilityString(WindowVisibility visibility)
{
    switch (visibility) {
    case WindowVisibility::Uninitialized:
        return "uninitialized";
    case WindowVisibility::Shown:
        return "shown";
    case WindowVisibility::Hidden:
        return "hidden";
    case WindowVisibility::Closed:
        return "closed";
    }
    return "uninitialized";
}

inline std::string toEventKindString(LifecycleEventKind kind)
{
    switch (kind) {
    case LifecycleEventKind::SetupComplete:
        return "setup_complete";
    case LifecycleEventKind::SplashCloseRequested:
        return "splash_close_requested";
    case LifecycleEventKind::WindowCloseRequested:
        return "window_close_requested";
    case LifecycleEventKind::TrayLeftClick:
        return "tray_left_click";
    case LifecycleEventKind::TrayMenuClick:
        return "tray_menu_click";
    }
    return "setup_complete";
}

inline void to_json(nlohmann::json &j, const BridgeErrorKind &kind)
{
    j = toErrorKindString(kind);
}

inline void to_json(nlohmann::json &j, const WindowVisibility &visibility)
{
    j = toVisibilityString(visibility);
}

inline void to_json(nlohmann::json &j, const HealthResponse &health)
{
    j = nlohmann::json{{"status", health.status}};
}

// Strict: the health endpoint is untrusted, a missing or non-string status
// throws nlohmann::json::exception.
inline void from_json(const nlohmann::json &j, HealthResponse &health)
{
    j.at("status").get_to(health.status);
}

inline void to_json(nlohmann::json &j, const ApiConfig &config)
{
    j = nlohmann::json{
        {"backend_url", config.backendUrl},
        {"timeout", config.timeout}
    };
}

inline void from_json(const nlohmann::json &j, ApiConfig &config)
{
    config.backendUrl = j.value("backend_url", "");
    config.timeout = j.value("timeout", static_cast<std::uint64_t>(0));
}

inline void to_json(nlohmann::json &j, const PlatformInfo &info)
{
    j = nlohmann::json{
        {"os", info.os},
        {"os_version", info.osVersion},
        {"kernel", info.kernel},
        {"arch", info.arch}
    };
}

inline void to_json(nlohmann::json &j, const CommandResult &result)
{
    if (result.ok()) {
        j = nlohmann::json{{"ok", true}, {"value", result.value}};
        return;
    }
    j = nlohmann::json{
        {"ok", false},
        {"kind", result.error},
        {"error", result.message}
    };
}

inline std::optional<HealthResponse> parseHealthResponse(const QByteArray &body,
                                                         std::string *error)
{
    try {
        const auto parsed = nlohmann::json::parse(body.constBegin(), body.constEnd());
        return parsed.get<HealthResponse>();
    } catch (const nlohmann::json::exception &e) {
        if (error) {
            *error = e.what();
        }
        return std::nullopt;
    }
}

// QWebChannel speaks QJsonValue; wrap so scalars survive the document round trip.
inline QJsonValue toQJsonValue(const nlohmann::json &value)
{
    const nlohmann::json wrapper = {{"v", value}};
    const QJsonDocument doc =
        QJsonDocument::fromJson(QByteArray::fromStdString(wrapper.dump()));
    return doc.object().value(QStringLiteral("v"));
}

inline QJsonObject toQJsonObject(const CommandResult &result)
{
    return toQJsonValue(nlohmann::json(result)).toObject();
}

inline nlohmann::json fromQJsonObject(const QJsonObject &object)
{
    const QByteArray raw = QJsonDocument(object).toJson(QJsonDocument::Compact);
    const auto parsed = nlohmann::json::parse(raw.constBegin(), raw.constEnd(),
                                              nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return nlohmann::json::object();
    }
    return parsed;
}

} // namespace axiestudio
