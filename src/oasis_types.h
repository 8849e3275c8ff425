#pragma once

#include <optional>

#include <QList>
#include <QString>
#include <QVariantMap>

namespace oasis::control {

enum class StatusCode : int {
    Booting = 0,
    Stopped = 2,
    Centering = 3,
    Playing = 4,
    Paused = 5,
    Sleeping = 6,
    Error = 9,
    Updating = 11,
    Downloading = 13,
    Busy = 14,
    Live = 15,
};

inline constexpr int kBallSpeedMin = 100;
inline constexpr int kBallSpeedMax = 400;
inline constexpr int kLedSpeedMin = -90;
inline constexpr int kLedSpeedMax = 90;
inline constexpr int kBrightnessDefault = 100;
inline constexpr int kBrightnessMaxDefault = 200;

// Closed set of device state fields a FieldMap may carry. Wire names are
// the snake_case keys returned by fieldName().
enum class Field {
    AutoClean,
    Autoplay,
    BallSpeed,
    Brightness,
    BrightnessMax,
    Busy,
    Color,
    DownloadProgress,
    Environment,
    Error,
    LedColorId,
    LedEffect,
    LedSpeed,
    MacAddress,
    Playlist,
    PlaylistIndex,
    Progress,
    RepeatPlaylist,
    Schedule,
    SerialNumber,
    SoftwareVersion,
    StatusCode,
    WifiConnected,
    WifiGate,
    WifiIp,
    WifiPdns,
    WifiSdns,
    WifiSsid,
    WifiSub,
};

// Field name -> value. Playlists are stored as QList<int>, flags as bool,
// counters as int, everything else as QString (a null QVariant clears an
// optional string such as the colour).
using FieldMap = QVariantMap;

QString fieldName(Field field);
std::optional<Field> fieldFromName(const QString &name);

QString statusText(int statusCode);
QString errorText(int errorCode);
bool isLedEffect(const QString &code);
QString ledEffectName(const QString &code);
QString autoplayLabel(const QString &option);

enum class CmdStatus {
    Success,
    InvalidArgument,
    NoTransport,
    Failure,
};

struct CommandResult {
    CmdStatus status = CmdStatus::Success;
    QString error;

    bool ok() const noexcept { return status == CmdStatus::Success; }

    static CommandResult success() { return {}; }
    static CommandResult failure(CmdStatus status, const QString &error)
    {
        CommandResult result;
        result.status = status;
        result.error = error;
        return result;
    }
};

} // namespace oasis::control
