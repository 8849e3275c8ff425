#pragma once

#include <QString>
#include <QUrl>
#include <QVariant>

#include "oasis_commands.h"
#include "oasis_http.h"
#include "oasis_transport.h"

class QNetworkAccessManager;

namespace oasis::control {

// Local-network transport for one device. Every command is a plain-HTTP GET
// against the device with the command as the only query parameter.
class HttpTransport final : public Transport
{
public:
    explicit HttpTransport(const QString &host,
                           QNetworkAccessManager *manager = nullptr,
                           int timeoutMs = kDefaultHttpTimeoutMs);

    QString host() const { return m_host; }
    QUrl baseUrl() const;

    // Closes the network manager when this transport created it.
    void close();

    bool sendCommand(const Command &command, QVariant *response = nullptr, QString *error = nullptr);

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

private:
    CommandResult dispatch(const Command &command);

    QString m_host;
    int m_timeoutMs = kDefaultHttpTimeoutMs;
    HttpClient m_http;
};

} // namespace oasis::control
