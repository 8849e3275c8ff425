#include "oasis_codec.h"

#include <algorithm>

#include <QHash>
#include <QStringList>

namespace oasis::control {

namespace {

enum class TopicKind {
    Int,
    Text,
    Flag,
    Bit,
    Playlist,
    Color,
    FullStatus,
};

struct TopicEntry {
    Field field;
    TopicKind kind;
};

const QHash<QString, TopicEntry> &topicTable()
{
    // OASIS_SPEEED is spelled this way by the firmware.
    static const QHash<QString, TopicEntry> table = {
        {QStringLiteral("OASIS_STATUS"), {Field::StatusCode, TopicKind::Int}},
        {QStringLiteral("OASIS_ERROR"), {Field::Error, TopicKind::Int}},
        {QStringLiteral("OASIS_SPEEED"), {Field::BallSpeed, TopicKind::Int}},
        {QStringLiteral("JOBLIST"), {Field::Playlist, TopicKind::Playlist}},
        {QStringLiteral("CURRENTJOB"), {Field::PlaylistIndex, TopicKind::Int}},
        {QStringLiteral("CURRENTLINE"), {Field::Progress, TopicKind::Int}},
        {QStringLiteral("LED_EFFECT"), {Field::LedEffect, TopicKind::Text}},
        {QStringLiteral("LED_EFFECT_COLOR"), {Field::LedColorId, TopicKind::Text}},
        {QStringLiteral("LED_SPEED"), {Field::LedSpeed, TopicKind::Int}},
        {QStringLiteral("LED_BRIGHTNESS"), {Field::Brightness, TopicKind::Int}},
        {QStringLiteral("LED_MAX"), {Field::BrightnessMax, TopicKind::Int}},
        {QStringLiteral("LED_EFFECT_PARAM"), {Field::Color, TopicKind::Color}},
        {QStringLiteral("SYSTEM_BUSY"), {Field::Busy, TopicKind::Flag}},
        {QStringLiteral("DOWNLOAD_PROGRESS"), {Field::DownloadProgress, TopicKind::Int}},
        {QStringLiteral("REPEAT_JOB"), {Field::RepeatPlaylist, TopicKind::Flag}},
        {QStringLiteral("WAIT_AFTER_JOB"), {Field::Autoplay, TopicKind::Int}},
        {QStringLiteral("AUTO_CLEAN"), {Field::AutoClean, TopicKind::Flag}},
        {QStringLiteral("SOFTWARE_VER"), {Field::SoftwareVersion, TopicKind::Text}},
        {QStringLiteral("MAC_ADDRESS"), {Field::MacAddress, TopicKind::Text}},
        {QStringLiteral("WIFI_SSID"), {Field::WifiSsid, TopicKind::Text}},
        {QStringLiteral("WIFI_IP"), {Field::WifiIp, TopicKind::Text}},
        {QStringLiteral("WIFI_PDNS"), {Field::WifiPdns, TopicKind::Text}},
        {QStringLiteral("WIFI_SDNS"), {Field::WifiSdns, TopicKind::Text}},
        {QStringLiteral("WIFI_GATE"), {Field::WifiGate, TopicKind::Text}},
        {QStringLiteral("WIFI_SUB"), {Field::WifiSub, TopicKind::Text}},
        {QStringLiteral("WIFI_STATUS"), {Field::WifiConnected, TopicKind::Bit}},
        {QStringLiteral("SCHEDULE"), {Field::Schedule, TopicKind::Text}},
        {QStringLiteral("ENVIRONMENT"), {Field::Environment, TopicKind::Text}},
        {QStringLiteral("FULLSTATUS"), {Field::StatusCode, TopicKind::FullStatus}},
    };
    return table;
}

bool parseFlag(const QString &text)
{
    return text == QLatin1String("1") || text == QLatin1String("true") || text == QLatin1String("True");
}

QVariant colorValue(const QString &text)
{
    if (text.contains(QLatin1Char('#')))
        return text;
    return QVariant();
}

} // namespace

bool isKnownStatusTopic(const QString &suffix)
{
    return topicTable().contains(suffix);
}

int parseIntOrZero(const QString &text)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    return ok ? value : 0;
}

bool parseBit(const QString &text)
{
    return text == QLatin1String("1");
}

QList<int> parsePlaylist(const QString &csv)
{
    QList<int> out;
    const QStringList tokens = csv.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString &token : tokens) {
        const int trackId = parseIntOrZero(token);
        if (trackId != 0)
            out.append(trackId);
    }
    return out;
}

StatusLayout statusLayout(const QString &raw)
{
    if (raw.isEmpty())
        return StatusLayout::Invalid;
    const qsizetype count = raw.count(QLatin1Char(';')) + 1;
    if (count < kStatusFieldCount)
        return StatusLayout::Invalid;
    return count == kStatusFieldCount ? StatusLayout::V1 : StatusLayout::V2;
}

std::optional<FieldMap> parseFullStatus(const QString &raw, QString *error)
{
    if (raw.isEmpty()) {
        if (error)
            *error = QStringLiteral("Empty status string");
        return std::nullopt;
    }

    const QStringList values = raw.split(QLatin1Char(';'));
    const StatusLayout layout = statusLayout(raw);
    if (layout == StatusLayout::Invalid) {
        if (error)
            *error = QStringLiteral("Unexpected status format (%1 fields)").arg(values.size());
        return std::nullopt;
    }

    const QList<int> playlist = parsePlaylist(values.at(3));
    const int index = std::clamp(parseIntOrZero(values.at(4)), 0, static_cast<int>(playlist.size()));

    FieldMap status;
    status.insert(fieldName(Field::StatusCode), parseIntOrZero(values.at(0)));
    status.insert(fieldName(Field::Error), parseIntOrZero(values.at(1)));
    status.insert(fieldName(Field::BallSpeed), parseIntOrZero(values.at(2)));
    status.insert(fieldName(Field::Playlist), QVariant::fromValue(playlist));
    status.insert(fieldName(Field::PlaylistIndex), index);
    status.insert(fieldName(Field::Progress), parseIntOrZero(values.at(5)));
    status.insert(fieldName(Field::LedEffect), values.at(6));
    status.insert(fieldName(Field::LedColorId), values.at(7));
    status.insert(fieldName(Field::LedSpeed), parseIntOrZero(values.at(8)));
    status.insert(fieldName(Field::Brightness), parseIntOrZero(values.at(9)));
    status.insert(fieldName(Field::Color), colorValue(values.at(10)));
    status.insert(fieldName(Field::Busy), parseBit(values.at(11)));
    status.insert(fieldName(Field::DownloadProgress), parseIntOrZero(values.at(12)));
    status.insert(fieldName(Field::BrightnessMax), parseIntOrZero(values.at(13)));
    status.insert(fieldName(Field::WifiConnected), parseBit(values.at(14)));
    status.insert(fieldName(Field::RepeatPlaylist), parseBit(values.at(15)));
    status.insert(fieldName(Field::Autoplay), parseIntOrZero(values.at(16)));
    status.insert(fieldName(Field::AutoClean), parseBit(values.at(17)));

    if (layout == StatusLayout::V2)
        status.insert(fieldName(Field::SoftwareVersion), values.at(18));

    return status;
}

std::optional<FieldMap> parseTopicValue(const QString &suffix, const QString &payload, QString *error)
{
    const auto &table = topicTable();
    const auto it = table.constFind(suffix);
    if (it == table.constEnd()) {
        if (error)
            *error = QStringLiteral("Unknown status topic %1").arg(suffix);
        return std::nullopt;
    }

    const TopicEntry entry = it.value();
    const QString key = fieldName(entry.field);
    FieldMap out;

    switch (entry.kind) {
    case TopicKind::Int: {
        bool ok = false;
        int value = payload.trimmed().toInt(&ok);
        if (!ok) {
            // The firmware sometimes sends garbage for the autoplay option.
            if (entry.field != Field::Autoplay) {
                if (error)
                    *error = QStringLiteral("Invalid integer for %1: %2").arg(suffix, payload);
                return std::nullopt;
            }
            value = 0;
        }
        if (entry.field == Field::PlaylistIndex)
            value = std::max(value, 0);
        out.insert(key, value);
        break;
    }
    case TopicKind::Text:
        out.insert(key, payload);
        break;
    case TopicKind::Flag:
        out.insert(key, parseFlag(payload));
        break;
    case TopicKind::Bit:
        out.insert(key, parseBit(payload));
        break;
    case TopicKind::Playlist:
        out.insert(key, QVariant::fromValue(parsePlaylist(payload)));
        break;
    case TopicKind::Color:
        out.insert(key, payload.startsWith(QLatin1Char('#')) ? QVariant(payload) : QVariant());
        break;
    case TopicKind::FullStatus:
        return parseFullStatus(payload, error);
    }

    return out;
}

} // namespace oasis::control
