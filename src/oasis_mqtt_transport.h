#pragma once

#include <functional>
#include <memory>

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QQueue>
#include <QSet>
#include <QString>
#include <QTimer>

#include "oasis_commands.h"
#include "oasis_config.h"
#include "oasis_transport.h"

namespace oasis::control {

class BrokerLink;

// Shared broker session for any number of devices. Status pushes arrive on
// "<serial>/STATUS/<suffix>", commands go to "<serial>/COMMAND/CMD". Commands
// issued while offline are queued and flushed after the next connect.
class MqttTransport : public QObject, public Transport
{
    Q_OBJECT
public:
    enum class State {
        Stopped,
        Connecting,
        Connected,
        Disconnected,
    };
    Q_ENUM(State)

    struct PendingCommand {
        QString serial;
        QByteArray payload;
    };

    explicit MqttTransport(const ClientConfig &config = {}, QObject *parent = nullptr);
    MqttTransport(std::unique_ptr<BrokerLink> link,
                  const ClientConfig &config = {},
                  QObject *parent = nullptr);
    ~MqttTransport() override;

    void start();
    // Cancels reconnects, closes the session and drops every queued command.
    void stop();

    State state() const { return m_state; }
    bool isConnected() const { return m_state == State::Connected; }
    BrokerLink *link() const { return m_link.get(); }

    bool registerDevice(Device *device);
    void unregisterDevice(Device *device);
    bool hasDevice(const QString &serial) const { return m_devices.contains(serial); }
    bool isSubscribed(const QString &serial) const { return m_subscribed.contains(serial); }

    QList<PendingCommand> pendingCommands() const { return m_queue; }
    int maxPendingCommands() const { return m_config.maxPendingCommands; }

    // Waits for the broker connection and then for the device to report
    // itself initialized. A negative timeout uses readyTimeoutMs. Both waits
    // are bounded by the timeout; false means "not yet", not an error.
    bool waitUntilReady(Device &device, int timeoutMs = -1, bool requestStatus = true);

    // Full status plus schedule.
    CommandResult requestFullState(Device &device);

    CommandResult requestStatus(Device &device) override;
    QString macAddress(Device &device) override;

    CommandResult sendAutoClean(Device &device, bool enabled) override;
    CommandResult sendBallSpeed(Device &device, int speed) override;
    CommandResult sendLed(Device &device,
                          const QString &effect,
                          const QString &color,
                          int speed,
                          int brightness) override;
    CommandResult sendSleep(Device &device) override;
    CommandResult sendMoveJob(Device &device, int fromIndex, int toIndex) override;
    CommandResult sendChangeTrack(Device &device, int index) override;
    CommandResult sendAddJobList(Device &device, const QList<int> &tracks) override;
    CommandResult sendSetPlaylist(Device &device, const QList<int> &playlist) override;
    CommandResult sendRepeatPlaylist(Device &device, bool repeat) override;
    CommandResult sendAutoplay(Device &device, const QString &option) override;
    CommandResult sendUpgrade(Device &device, bool beta) override;
    CommandResult sendPlay(Device &device) override;
    CommandResult sendPause(Device &device) override;
    CommandResult sendStop(Device &device) override;
    CommandResult sendReboot(Device &device) override;

    static QString statusTopicFilter(const QString &serial);
    static QString commandTopic(const QString &serial);

signals:
    void connectionStateChanged(oasis::control::MqttTransport::State state);
    void deviceInitialized(const QString &serial);
    void macAddressReceived(const QString &serial);

private slots:
    void onLinkConnected();
    void onLinkDisconnected();
    void onConnectTimeout();
    void onRetryTimeout();
    void handleMessage(const QString &topic, const QByteArray &payload);

private:
    void setState(State state);
    void attemptConnect();
    void handleConnectionLost();
    void logConnectedDuration();

    void subscribeSerial(const QString &serial);
    void unsubscribeSerial(const QString &serial);
    void resubscribeAll();

    CommandResult publishCommand(Device &device, const Command &command);
    void publish(const QString &serial, const QByteArray &payload);
    void enqueue(const QString &serial, const QByteArray &payload);
    void flushPendingCommands();

    bool waitFor(const std::function<bool()> &done, int timeoutMs);

    ClientConfig                  m_config;
    std::unique_ptr<BrokerLink>   m_link;
    State                         m_state = State::Stopped;
    QTimer                        m_retryTimer;
    QTimer                        m_connectTimer;
    QDateTime                     m_connectedAt;

    QHash<QString, Device *>      m_devices;
    QSet<QString>                 m_subscribed;
    QQueue<PendingCommand>        m_queue;

    // Per-device readiness signals, set by incoming status pushes.
    QSet<QString>                 m_initialized;
    QSet<QString>                 m_macKnown;
};

} // namespace oasis::control
