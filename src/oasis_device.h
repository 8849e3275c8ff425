#pragma once

#include <functional>
#include <optional>

#include <QDateTime>
#include <QList>
#include <QMap>
#include <QObject>
#include <QString>
#include <QVariantMap>

#include "oasis_tracks.h"
#include "oasis_types.h"

namespace oasis::control {

class Transport;

struct DeviceInfo {
    QString model;
    QString serialNumber;
    QString name;
    QString ssid;
    QString ipAddress;
};

// Optional LED parameters; unset members keep the device's current value.
struct LedRequest {
    std::optional<QString> effect;
    std::optional<QString> color;
    std::optional<int> speed;
    std::optional<int> brightness;
};

// Transport-agnostic model of one Oasis table. Status updates from any
// transport go through applyFieldMap(); commands are validated here and then
// delegated to the attached transport.
class Device : public QObject
{
    Q_OBJECT
public:
    using Listener = std::function<void()>;
    using Unsubscribe = std::function<void()>;

    explicit Device(const DeviceInfo &info = {}, QObject *parent = nullptr);
    ~Device() override;

    static constexpr const char *kManufacturer = "Kinetic Oasis";

    // Collaborators. None of them is owned.
    void attachTransport(Transport *transport) { m_transport = transport; }
    Transport *transport() const { return m_transport; }
    void setTrackSource(TrackInfoSource *source) { m_trackSource = source; }
    void setTrackCatalog(const TrackCatalog *catalog) { m_catalog = catalog; }

    // Identity
    QString model() const { return m_model; }
    QString serialNumber() const { return m_serialNumber; }
    QString name() const { return m_name; }
    void setName(const QString &name) { m_name = name; }
    QString ssid() const { return m_ssid; }
    QString ipAddress() const { return m_ipAddress; }
    QString macAddress() const { return m_macAddress; }
    QString softwareVersion() const { return m_softwareVersion; }

    // Status
    int statusCode() const { return m_statusCode; }
    int error() const { return m_error; }
    int ballSpeed() const { return m_ballSpeed; }
    int brightness() const;
    int rawBrightness() const { return m_brightness; }
    int brightnessMax() const { return m_brightnessMax; }
    int brightnessOn() const { return m_brightnessOn; }
    QString color() const { return m_color; }
    QString ledEffect() const { return m_ledEffect; }
    QString ledColorId() const { return m_ledColorId; }
    int ledSpeed() const { return m_ledSpeed; }
    bool busy() const { return m_busy; }
    int downloadProgress() const { return m_downloadProgress; }
    bool autoClean() const { return m_autoClean; }
    bool repeatPlaylist() const { return m_repeatPlaylist; }
    int autoplay() const { return m_autoplay; }
    QList<int> playlist() const { return m_playlist; }
    int playlistIndex() const { return m_playlistIndex; }
    int progress() const { return m_progress; }
    bool wifiConnected() const { return m_wifiConnected; }
    QString wifiSsid() const { return m_wifiSsid; }
    QString wifiIp() const { return m_wifiIp; }
    QString wifiPdns() const { return m_wifiPdns; }
    QString wifiSdns() const { return m_wifiSdns; }
    QString wifiGate() const { return m_wifiGate; }
    QString wifiSub() const { return m_wifiSub; }
    QString schedule() const { return m_schedule; }
    QString environment() const { return m_environment; }
    QDateTime lastUpdated() const { return m_lastUpdated; }

    // Derived state
    bool isInitialized() const;
    bool isSleeping() const;
    QString statusText() const;
    QString errorMessage() const;
    std::optional<int> currentTrackId() const;
    std::optional<TrackInfo> track() const;
    QString trackName() const;
    QString trackImageUrl() const;
    std::optional<double> drawingProgress() const;
    QMap<int, QString> playlistDetails() const;
    QVariantMap asVariantMap() const;

    // Applies a field update; returns true when anything changed.
    bool applyFieldMap(const FieldMap &updates);
    bool applyStatusString(const QString &raw);

    Unsubscribe addUpdateListener(Listener listener);

    // Commands
    CommandResult requestStatus();
    QString fetchMacAddress(CommandResult *result = nullptr);
    CommandResult setAutoClean(bool enabled);
    CommandResult setBallSpeed(int speed);
    CommandResult setLed(const LedRequest &request);
    CommandResult sleep();
    CommandResult moveTrack(int fromIndex, int toIndex);
    CommandResult changeTrack(int index);
    CommandResult addTrackToPlaylist(int trackId);
    CommandResult addTrackToPlaylist(const QList<int> &tracks);
    CommandResult setPlaylist(const QList<int> &playlist, std::optional<bool> startPlaying = std::nullopt);
    CommandResult clearPlaylist();
    CommandResult setRepeatPlaylist(bool repeat);
    CommandResult setAutoplay(const QString &option);
    CommandResult setAutoplayEnabled(bool enabled);
    CommandResult upgrade(bool beta = false);
    CommandResult play();
    CommandResult pause();
    CommandResult stop();
    CommandResult reboot();

    void scheduleTrackRefresh();

private:
    bool applyField(Field field, const QVariant &value);
    void setBrightness(int value);
    void notifyListeners();
    void refreshCurrentTrack(quint64 generation);
    void finishTrackRefresh(quint64 generation,
                            int trackId,
                            const std::optional<TrackInfo> &info,
                            const QString &error);
    CommandResult noTransport() const;

    Transport *m_transport = nullptr;
    TrackInfoSource *m_trackSource = nullptr;
    const TrackCatalog *m_catalog = nullptr;

    QString m_model;
    QString m_serialNumber;
    QString m_name;
    QString m_ssid;
    QString m_ipAddress;
    QString m_macAddress;
    QString m_softwareVersion;

    int m_statusCode = 0;
    int m_error = 0;
    int m_ballSpeed = kBallSpeedMin;
    int m_brightness = 0;
    int m_brightnessMax = kBrightnessMaxDefault;
    int m_brightnessOn = kBrightnessDefault;
    QString m_color;
    QString m_ledEffect = QStringLiteral("0");
    QString m_ledColorId = QStringLiteral("0");
    int m_ledSpeed = 0;
    bool m_busy = false;
    int m_downloadProgress = 0;
    bool m_autoClean = false;
    bool m_repeatPlaylist = false;
    int m_autoplay = 0;
    QList<int> m_playlist;
    int m_playlistIndex = 0;
    int m_progress = 0;
    bool m_wifiConnected = false;
    QString m_wifiSsid;
    QString m_wifiIp;
    QString m_wifiPdns;
    QString m_wifiSdns;
    QString m_wifiGate;
    QString m_wifiSub;
    QString m_schedule;
    QString m_environment;
    QDateTime m_lastUpdated;

    std::optional<TrackInfo> m_track;
    quint64 m_trackGeneration = 0;

    QMap<quint64, Listener> m_listeners;
    quint64 m_nextListenerId = 0;
};

} // namespace oasis::control
