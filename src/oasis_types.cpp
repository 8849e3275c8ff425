#include "oasis_types.h"

#include <QHash>

namespace oasis::control {

namespace {

struct FieldEntry {
    Field field;
    const char *name;
};

constexpr FieldEntry kFieldNames[] = {
    {Field::AutoClean, "auto_clean"},
    {Field::Autoplay, "autoplay"},
    {Field::BallSpeed, "ball_speed"},
    {Field::Brightness, "brightness"},
    {Field::BrightnessMax, "brightness_max"},
    {Field::Busy, "busy"},
    {Field::Color, "color"},
    {Field::DownloadProgress, "download_progress"},
    {Field::Environment, "environment"},
    {Field::Error, "error"},
    {Field::LedColorId, "led_color_id"},
    {Field::LedEffect, "led_effect"},
    {Field::LedSpeed, "led_speed"},
    {Field::MacAddress, "mac_address"},
    {Field::Playlist, "playlist"},
    {Field::PlaylistIndex, "playlist_index"},
    {Field::Progress, "progress"},
    {Field::RepeatPlaylist, "repeat_playlist"},
    {Field::Schedule, "schedule"},
    {Field::SerialNumber, "serial_number"},
    {Field::SoftwareVersion, "software_version"},
    {Field::StatusCode, "status_code"},
    {Field::WifiConnected, "wifi_connected"},
    {Field::WifiGate, "wifi_gate"},
    {Field::WifiIp, "wifi_ip"},
    {Field::WifiPdns, "wifi_pdns"},
    {Field::WifiSdns, "wifi_sdns"},
    {Field::WifiSsid, "wifi_ssid"},
    {Field::WifiSub, "wifi_sub"},
};

const QHash<QString, Field> &fieldsByName()
{
    static const QHash<QString, Field> table = [] {
        QHash<QString, Field> out;
        for (const FieldEntry &entry : kFieldNames)
            out.insert(QLatin1String(entry.name), entry.field);
        return out;
    }();
    return table;
}

const QHash<int, QString> &statusTexts()
{
    static const QHash<int, QString> table = {
        {static_cast<int>(StatusCode::Booting), QStringLiteral("booting")},
        {static_cast<int>(StatusCode::Stopped), QStringLiteral("stopped")},
        {static_cast<int>(StatusCode::Centering), QStringLiteral("centering")},
        {static_cast<int>(StatusCode::Playing), QStringLiteral("playing")},
        {static_cast<int>(StatusCode::Paused), QStringLiteral("paused")},
        {static_cast<int>(StatusCode::Sleeping), QStringLiteral("sleeping")},
        {static_cast<int>(StatusCode::Error), QStringLiteral("error")},
        {static_cast<int>(StatusCode::Updating), QStringLiteral("updating")},
        {static_cast<int>(StatusCode::Downloading), QStringLiteral("downloading")},
        {static_cast<int>(StatusCode::Busy), QStringLiteral("busy")},
        {static_cast<int>(StatusCode::Live), QStringLiteral("live")},
    };
    return table;
}

const QHash<int, QString> &errorTexts()
{
    static const QHash<int, QString> table = {
        {0, QStringLiteral("None")},
        {1, QStringLiteral("Error has occurred while reading the flash memory")},
        {2, QStringLiteral("Error while starting the Wifi")},
        {3, QStringLiteral("Error when starting DNS settings for your machine")},
        {4, QStringLiteral("Failed to open the file to write")},
        {5, QStringLiteral("Not enough memory to perform the upgrade")},
        {6, QStringLiteral("Error while trying to upgrade your system")},
        {7, QStringLiteral("Error while trying to download the new version of the software")},
        {8, QStringLiteral("Error while reading the upgrading file")},
        {9, QStringLiteral("Failed to start downloading the upgrade file")},
        {10, QStringLiteral("Error while starting downloading the job file")},
        {11, QStringLiteral("Error while opening the file folder")},
        {12, QStringLiteral("Failed to delete a file")},
        {13, QStringLiteral("Error while opening the job file")},
        {14, QStringLiteral("You have wrong power adapter")},
        {15, QStringLiteral("Failed to update the device IP on Oasis Server")},
        {16, QStringLiteral("Your device failed centering itself")},
        {17, QStringLiteral("There appears to be an issue with your Oasis Device")},
        {18, QStringLiteral("Error while downloading the job file")},
    };
    return table;
}

// Index is the effect code sent on the wire.
constexpr const char *kLedEffectNames[] = {
    "Solid",
    "Rainbow",
    "Glitter",
    "Confetti",
    "Sinelon",
    "BPM",
    "Juggle",
    "Theater",
    "Color Wipe",
    "Sparkle",
    "Comet",
    "Follow Ball",
    "Follow Rainbow",
    "Chasing Comet",
    "Gradient Follow",
    "Cumulative Fill",
    "Multi Comets A",
    "Rainbow Chaser",
    "Twinkle Lights",
    "Tennis Game",
    "Breathing Exercise 4-7-8",
    "Cylon Scanner",
    "Palette Mode",
    "Aurora Flow",
    "Colorful Drops",
    "Color Snake",
    "Flickering Candles",
    "Digital Rain",
    "Center Explosion",
    "Rainbow Plasma",
    "Comet Race",
    "Color Waves",
    "Meteor Storm",
    "Firefly Flicker",
    "Ripple",
    "Jelly Bean",
    "Forest Rain",
    "Multi Comets",
    "Multi Comets with Background",
    "Rainbow Fill",
    "White Red Comet",
    "Color Comets",
};

constexpr int kLedEffectCount = static_cast<int>(sizeof(kLedEffectNames) / sizeof(kLedEffectNames[0]));

std::optional<int> ledEffectIndex(const QString &code)
{
    // Codes are canonical decimal strings; "01" or " 1" are not valid effects.
    bool ok = false;
    const int index = code.toInt(&ok);
    if (!ok || index < 0 || index >= kLedEffectCount || QString::number(index) != code)
        return std::nullopt;
    return index;
}

} // namespace

QString fieldName(Field field)
{
    for (const FieldEntry &entry : kFieldNames) {
        if (entry.field == field)
            return QLatin1String(entry.name);
    }
    return {};
}

std::optional<Field> fieldFromName(const QString &name)
{
    const auto &table = fieldsByName();
    const auto it = table.constFind(name);
    if (it == table.constEnd())
        return std::nullopt;
    return it.value();
}

QString statusText(int statusCode)
{
    return statusTexts().value(statusCode, QStringLiteral("Unknown (%1)").arg(statusCode));
}

QString errorText(int errorCode)
{
    return errorTexts().value(errorCode, QStringLiteral("Unknown (%1)").arg(errorCode));
}

bool isLedEffect(const QString &code)
{
    return ledEffectIndex(code).has_value();
}

QString ledEffectName(const QString &code)
{
    const auto index = ledEffectIndex(code);
    if (!index)
        return QStringLiteral("Unknown (%1)").arg(code);
    return QLatin1String(kLedEffectNames[*index]);
}

QString autoplayLabel(const QString &option)
{
    static const QHash<QString, QString> labels = {
        {QStringLiteral("0"), QStringLiteral("Immediately")},
        {QStringLiteral("1"), QStringLiteral("Off")},
        {QStringLiteral("2"), QStringLiteral("After 5 minutes")},
        {QStringLiteral("3"), QStringLiteral("After 10 minutes")},
        {QStringLiteral("4"), QStringLiteral("After 30 minutes")},
        {QStringLiteral("5"), QStringLiteral("After 24 hours")},
        {QStringLiteral("6"), QStringLiteral("After 1 hour")},
        {QStringLiteral("7"), QStringLiteral("After 6 hours")},
        {QStringLiteral("8"), QStringLiteral("After 12 hours")},
    };
    return labels.value(option, option);
}

} // namespace oasis::control
