#include "oasis_device.h"

#include <algorithm>
#include <exception>

#include <QDebug>
#include <QPointer>
#include <QTimer>

#include "oasis_codec.h"
#include "oasis_log.h"
#include "oasis_transport.h"

namespace oasis::control {

namespace {

QList<int> toIntList(const QVariant &value)
{
    if (value.typeId() == QMetaType::QVariantList) {
        QList<int> out;
        const QVariantList items = value.toList();
        for (const QVariant &item : items)
            out.append(item.toInt());
        return out;
    }
    return value.value<QList<int>>();
}

template <typename T>
bool assignField(const QString &serial, Field field, T &member, const T &value)
{
    if (member == value)
        return false;
    qCDebug(oasisDeviceLog).nospace().noquote()
        << serial << ' ' << fieldName(field) << " changed: '" << member << "' -> '" << value << "'";
    member = value;
    return true;
}

} // namespace

Device::Device(const DeviceInfo &info, QObject *parent)
    : QObject(parent)
    , m_model(info.model)
    , m_serialNumber(info.serialNumber)
    , m_name(info.name)
    , m_ssid(info.ssid)
    , m_ipAddress(info.ipAddress)
{
    if (m_name.isEmpty())
        m_name = QStringLiteral("%1 %2").arg(m_model, m_serialNumber);
}

Device::~Device() = default;

int Device::brightness() const
{
    return isSleeping() ? 0 : m_brightness;
}

void Device::setBrightness(int value)
{
    m_brightness = value;
    if (value)
        m_brightnessOn = value;
}

bool Device::isInitialized() const
{
    return !m_serialNumber.isEmpty() && !m_macAddress.isEmpty() && !m_softwareVersion.isEmpty();
}

bool Device::isSleeping() const
{
    return m_statusCode == static_cast<int>(StatusCode::Sleeping);
}

QString Device::statusText() const
{
    return control::statusText(m_statusCode);
}

QString Device::errorMessage() const
{
    if (m_statusCode != static_cast<int>(StatusCode::Error))
        return {};
    return errorText(m_error);
}

std::optional<int> Device::currentTrackId() const
{
    if (m_playlist.isEmpty())
        return std::nullopt;
    if (m_playlistIndex < 0 || m_playlistIndex >= m_playlist.size())
        return m_playlist.first();
    return m_playlist.at(m_playlistIndex);
}

std::optional<TrackInfo> Device::track() const
{
    const auto trackId = currentTrackId();
    if (!trackId)
        return std::nullopt;
    if (m_track && m_track->id == *trackId)
        return m_track;
    if (m_catalog) {
        if (const TrackInfo *known = m_catalog->find(*trackId))
            return *known;
    }
    return std::nullopt;
}

QString Device::trackName() const
{
    const auto current = track();
    if (!current)
        return {};
    if (current->name.isEmpty())
        return unknownTrackName(current->id);
    return current->name;
}

QString Device::trackImageUrl() const
{
    const auto current = track();
    return current ? control::trackImageUrl(*current) : QString();
}

std::optional<double> Device::drawingProgress() const
{
    const auto current = track();
    if (!current)
        return std::nullopt;
    const auto total = current->pathPointCount();
    if (!total || *total <= 0)
        return std::nullopt;
    return std::min(100.0 * m_progress / *total, 100.0);
}

QMap<int, QString> Device::playlistDetails() const
{
    const auto current = track();
    QMap<int, QString> details;
    for (int trackId : m_playlist) {
        QString name;
        if (current && current->id == trackId)
            name = current->name;
        else if (m_catalog) {
            if (const TrackInfo *known = m_catalog->find(trackId))
                name = known->name;
        }
        details.insert(trackId, name.isEmpty() ? unknownTrackName(trackId) : name);
    }
    return details;
}

QVariantMap Device::asVariantMap() const
{
    QVariantMap out;
    out.insert(fieldName(Field::AutoClean), m_autoClean);
    out.insert(fieldName(Field::Autoplay), m_autoplay);
    out.insert(fieldName(Field::BallSpeed), m_ballSpeed);
    out.insert(fieldName(Field::Brightness), brightness());
    out.insert(fieldName(Field::Busy), m_busy);
    out.insert(fieldName(Field::Color), m_color.isNull() ? QVariant() : QVariant(m_color));
    out.insert(fieldName(Field::DownloadProgress), m_downloadProgress);
    out.insert(fieldName(Field::Error), m_error);
    out.insert(fieldName(Field::LedEffect), m_ledEffect);
    out.insert(fieldName(Field::LedSpeed), m_ledSpeed);
    out.insert(fieldName(Field::MacAddress), m_macAddress);
    out.insert(fieldName(Field::Playlist), QVariant::fromValue(m_playlist));
    out.insert(fieldName(Field::PlaylistIndex), m_playlistIndex);
    out.insert(fieldName(Field::Progress), m_progress);
    out.insert(fieldName(Field::RepeatPlaylist), m_repeatPlaylist);
    out.insert(fieldName(Field::SerialNumber), m_serialNumber);
    out.insert(fieldName(Field::SoftwareVersion), m_softwareVersion);
    out.insert(fieldName(Field::StatusCode), m_statusCode);
    return out;
}

bool Device::applyField(Field field, const QVariant &value)
{
    const QString &serial = m_serialNumber;
    switch (field) {
    case Field::AutoClean:
        return assignField(serial, field, m_autoClean, value.toBool());
    case Field::Autoplay:
        return assignField(serial, field, m_autoplay, value.toInt());
    case Field::BallSpeed:
        return assignField(serial, field, m_ballSpeed, value.toInt());
    case Field::Brightness: {
        int raw = m_brightness;
        if (!assignField(serial, field, raw, value.toInt()))
            return false;
        setBrightness(raw);
        return true;
    }
    case Field::BrightnessMax:
        return assignField(serial, field, m_brightnessMax, value.toInt());
    case Field::Busy:
        return assignField(serial, field, m_busy, value.toBool());
    case Field::Color:
        return assignField(serial, field, m_color, value.isNull() ? QString() : value.toString());
    case Field::DownloadProgress:
        return assignField(serial, field, m_downloadProgress, value.toInt());
    case Field::Environment:
        return assignField(serial, field, m_environment, value.toString());
    case Field::Error:
        return assignField(serial, field, m_error, value.toInt());
    case Field::LedColorId:
        return assignField(serial, field, m_ledColorId, value.toString());
    case Field::LedEffect:
        return assignField(serial, field, m_ledEffect, value.toString());
    case Field::LedSpeed:
        return assignField(serial, field, m_ledSpeed, value.toInt());
    case Field::MacAddress:
        return assignField(serial, field, m_macAddress, value.toString());
    case Field::Playlist:
        return assignField(serial, field, m_playlist, toIntList(value));
    case Field::PlaylistIndex:
        return assignField(serial, field, m_playlistIndex,
                           std::clamp(value.toInt(), 0, static_cast<int>(m_playlist.size())));
    case Field::Progress:
        return assignField(serial, field, m_progress, value.toInt());
    case Field::RepeatPlaylist:
        return assignField(serial, field, m_repeatPlaylist, value.toBool());
    case Field::Schedule:
        return assignField(serial, field, m_schedule, value.toString());
    case Field::SerialNumber:
        return assignField(serial, field, m_serialNumber, value.toString());
    case Field::SoftwareVersion:
        return assignField(serial, field, m_softwareVersion, value.toString());
    case Field::StatusCode:
        return assignField(serial, field, m_statusCode, value.toInt());
    case Field::WifiConnected:
        return assignField(serial, field, m_wifiConnected, value.toBool());
    case Field::WifiGate:
        return assignField(serial, field, m_wifiGate, value.toString());
    case Field::WifiIp:
        return assignField(serial, field, m_wifiIp, value.toString());
    case Field::WifiPdns:
        return assignField(serial, field, m_wifiPdns, value.toString());
    case Field::WifiSdns:
        return assignField(serial, field, m_wifiSdns, value.toString());
    case Field::WifiSsid:
        return assignField(serial, field, m_wifiSsid, value.toString());
    case Field::WifiSub:
        return assignField(serial, field, m_wifiSub, value.toString());
    }
    return false;
}

bool Device::applyFieldMap(const FieldMap &updates)
{
    bool changed = false;
    bool trackMayHaveChanged = false;

    for (auto it = updates.constBegin(); it != updates.constEnd(); ++it) {
        const auto field = fieldFromName(it.key());
        if (!field) {
            qCWarning(oasisDeviceLog) << "Unknown field:" << it.key() << "=" << it.value();
            continue;
        }
        if (!applyField(*field, it.value()))
            continue;
        changed = true;
        if (*field == Field::Playlist || *field == Field::PlaylistIndex)
            trackMayHaveChanged = true;
    }

    if (trackMayHaveChanged)
        scheduleTrackRefresh();

    if (changed)
        notifyListeners();

    m_lastUpdated = QDateTime::currentDateTimeUtc();
    return changed;
}

bool Device::applyStatusString(const QString &raw)
{
    QString error;
    const auto status = parseFullStatus(raw, &error);
    if (!status) {
        qCWarning(oasisDeviceLog) << "Discarding status for" << m_serialNumber << ":" << error << raw;
        return false;
    }
    return applyFieldMap(*status);
}

Device::Unsubscribe Device::addUpdateListener(Listener listener)
{
    const quint64 id = ++m_nextListenerId;
    m_listeners.insert(id, std::move(listener));

    QPointer<Device> self(this);
    return [self, id]() {
        if (self)
            self->m_listeners.remove(id);
    };
}

void Device::notifyListeners()
{
    // Listeners may unsubscribe while being called.
    const QList<Listener> listeners = m_listeners.values();
    for (const Listener &listener : listeners) {
        try {
            listener();
        } catch (const std::exception &e) {
            qCWarning(oasisDeviceLog) << "Error in update listener for" << m_serialNumber << ":" << e.what();
        } catch (...) {
            qCWarning(oasisDeviceLog) << "Unknown error in update listener for" << m_serialNumber;
        }
    }
}

void Device::scheduleTrackRefresh()
{
    if (!m_trackSource)
        return;

    // A newer refresh supersedes whatever is pending or in flight.
    const quint64 generation = ++m_trackGeneration;
    QTimer::singleShot(0, this, [this, generation]() {
        refreshCurrentTrack(generation);
    });
}

void Device::refreshCurrentTrack(quint64 generation)
{
    if (generation != m_trackGeneration || !m_trackSource)
        return;

    const auto trackId = currentTrackId();
    if (!trackId) {
        m_track.reset();
        return;
    }
    if (m_track && m_track->id == *trackId)
        return;

    QPointer<Device> guard(this);
    const int id = *trackId;
    m_trackSource->fetchTrackInfo(id, [guard, generation, id](const std::optional<TrackInfo> &info,
                                                              const QString &error) {
        if (guard)
            guard->finishTrackRefresh(generation, id, info, error);
    });
}

void Device::finishTrackRefresh(quint64 generation,
                                int trackId,
                                const std::optional<TrackInfo> &info,
                                const QString &error)
{
    if (generation != m_trackGeneration) {
        qCDebug(oasisDeviceLog) << "Dropping superseded track refresh for" << m_serialNumber << "track" << trackId;
        return;
    }
    if (!info) {
        qCWarning(oasisDeviceLog) << "Error fetching track info for" << trackId << ":" << error;
        return;
    }

    m_track = *info;
    notifyListeners();
}

CommandResult Device::noTransport() const
{
    return CommandResult::failure(CmdStatus::NoTransport,
                                  QStringLiteral("No transport attached for device %1").arg(m_serialNumber));
}

CommandResult Device::requestStatus()
{
    if (!m_transport)
        return noTransport();
    return m_transport->requestStatus(*this);
}

QString Device::fetchMacAddress(CommandResult *result)
{
    if (!m_macAddress.isEmpty()) {
        if (result)
            *result = CommandResult::success();
        return m_macAddress;
    }
    if (!m_transport) {
        qCWarning(oasisDeviceLog) << "Cannot fetch MAC address without a transport for" << m_serialNumber;
        if (result)
            *result = noTransport();
        return {};
    }

    const QString mac = m_transport->macAddress(*this);
    if (mac.isEmpty()) {
        if (result)
            *result = CommandResult::failure(CmdStatus::Failure, QStringLiteral("MAC address unavailable"));
        return {};
    }

    FieldMap update;
    update.insert(fieldName(Field::MacAddress), mac);
    applyFieldMap(update);
    if (result)
        *result = CommandResult::success();
    return mac;
}

CommandResult Device::setAutoClean(bool enabled)
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendAutoClean(*this, enabled);
}

CommandResult Device::setBallSpeed(int speed)
{
    if (speed < kBallSpeedMin || speed > kBallSpeedMax)
        return CommandResult::failure(CmdStatus::InvalidArgument, QStringLiteral("Invalid speed specified"));
    if (!m_transport)
        return noTransport();
    return m_transport->sendBallSpeed(*this, speed);
}

CommandResult Device::setLed(const LedRequest &request)
{
    const QString effect = request.effect.value_or(m_ledEffect);
    QString color = request.color.value_or(m_color);
    if (color.isEmpty())
        color = QStringLiteral("#ffffff");
    const int speed = request.speed.value_or(m_ledSpeed);
    const int level = request.brightness.value_or(brightness());

    if (!isLedEffect(effect))
        return CommandResult::failure(CmdStatus::InvalidArgument, QStringLiteral("Invalid led effect specified"));
    if (speed < kLedSpeedMin || speed > kLedSpeedMax)
        return CommandResult::failure(CmdStatus::InvalidArgument, QStringLiteral("Invalid led speed specified"));
    if (level < 0 || level > m_brightnessMax)
        return CommandResult::failure(CmdStatus::InvalidArgument, QStringLiteral("Invalid brightness specified"));

    if (!m_transport)
        return noTransport();
    return m_transport->sendLed(*this, effect, color, speed, level);
}

CommandResult Device::sleep()
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendSleep(*this);
}

CommandResult Device::moveTrack(int fromIndex, int toIndex)
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendMoveJob(*this, fromIndex, toIndex);
}

CommandResult Device::changeTrack(int index)
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendChangeTrack(*this, index);
}

CommandResult Device::addTrackToPlaylist(int trackId)
{
    return addTrackToPlaylist(QList<int>{trackId});
}

CommandResult Device::addTrackToPlaylist(const QList<int> &tracks)
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendAddJobList(*this, tracks);
}

CommandResult Device::setPlaylist(const QList<int> &playlist, std::optional<bool> startPlaying)
{
    const bool resume = startPlaying.value_or(m_statusCode == static_cast<int>(StatusCode::Playing));

    if (!m_transport)
        return noTransport();

    // The firmware ignores a new job list while a track is running.
    CommandResult result = m_transport->sendStop(*this);
    if (!result.ok())
        return result;

    result = m_transport->sendSetPlaylist(*this, playlist);
    if (!result.ok())
        return result;

    if (resume && !playlist.isEmpty())
        return m_transport->sendPlay(*this);
    return result;
}

CommandResult Device::clearPlaylist()
{
    return setPlaylist({});
}

CommandResult Device::setRepeatPlaylist(bool repeat)
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendRepeatPlaylist(*this, repeat);
}

CommandResult Device::setAutoplay(const QString &option)
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendAutoplay(*this, option);
}

CommandResult Device::setAutoplayEnabled(bool enabled)
{
    return setAutoplay(enabled ? QStringLiteral("0") : QStringLiteral("1"));
}

CommandResult Device::upgrade(bool beta)
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendUpgrade(*this, beta);
}

CommandResult Device::play()
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendPlay(*this);
}

CommandResult Device::pause()
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendPause(*this);
}

CommandResult Device::stop()
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendStop(*this);
}

CommandResult Device::reboot()
{
    if (!m_transport)
        return noTransport();
    return m_transport->sendReboot(*this);
}

} // namespace oasis::control
