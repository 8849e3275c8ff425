#include "oasis_http_transport.h"

#include <QUrlQuery>

#include "oasis_device.h"
#include "oasis_log.h"

namespace oasis::control {

HttpTransport::HttpTransport(const QString &host, QNetworkAccessManager *manager, int timeoutMs)
    : m_host(host.trimmed())
    , m_timeoutMs(timeoutMs)
    , m_http(manager)
{
}

QUrl HttpTransport::baseUrl() const
{
    // The tables only speak plain HTTP.
    return QUrl(QStringLiteral("http://%1/").arg(m_host));
}

void HttpTransport::close()
{
    m_http.close();
}

bool HttpTransport::sendCommand(const Command &command, QVariant *response, QString *error)
{
    QUrl url = baseUrl();
    QUrlQuery query;
    // A bare command still goes out as "KEY=".
    query.addQueryItem(command.key, command.value.isNull() ? QStringLiteral("") : command.value);
    url.setQuery(query);

    const HttpResult result = m_http.get(url, {}, m_timeoutMs);
    if (!result.ok) {
        if (error)
            *error = result.error;
        return false;
    }

    const QVariant body = HttpClient::decodeBody(result);
    qCDebug(oasisHttpLog) << "Result:" << body;
    if (response)
        *response = body;
    return true;
}

CommandResult HttpTransport::dispatch(const Command &command)
{
    QString error;
    if (!sendCommand(command, nullptr, &error))
        return CommandResult::failure(CmdStatus::Failure, error);
    return CommandResult::success();
}

CommandResult HttpTransport::requestStatus(Device &device)
{
    QVariant response;
    QString error;
    if (!sendCommand(command::getStatus(), &response, &error))
        return CommandResult::failure(CmdStatus::Failure, error);

    if (response.typeId() != QMetaType::QString)
        return CommandResult::success();

    const QString raw = response.toString();
    qCDebug(oasisHttpLog) << "Status for" << device.serialNumber() << ":" << raw;
    device.applyStatusString(raw);
    return CommandResult::success();
}

QString HttpTransport::macAddress(Device &device)
{
    QVariant response;
    QString error;
    if (!sendCommand(command::getMac(), &response, &error)) {
        qCWarning(oasisHttpLog) << "Failed to get MAC address via HTTP for" << device.serialNumber() << ":" << error;
        return {};
    }
    if (response.typeId() != QMetaType::QString)
        return {};
    return response.toString().trimmed();
}

CommandResult HttpTransport::sendAutoClean(Device &, bool enabled)
{
    return dispatch(command::autoClean(enabled));
}

CommandResult HttpTransport::sendBallSpeed(Device &, int speed)
{
    return dispatch(command::ballSpeed(speed));
}

CommandResult HttpTransport::sendLed(Device &,
                                     const QString &effect,
                                     const QString &color,
                                     int speed,
                                     int brightness)
{
    return dispatch(command::led(effect, color, speed, brightness));
}

CommandResult HttpTransport::sendSleep(Device &)
{
    return dispatch(command::sleep());
}

CommandResult HttpTransport::sendMoveJob(Device &, int fromIndex, int toIndex)
{
    return dispatch(command::moveJob(fromIndex, toIndex));
}

CommandResult HttpTransport::sendChangeTrack(Device &, int index)
{
    return dispatch(command::changeTrack(index));
}

CommandResult HttpTransport::sendAddJobList(Device &, const QList<int> &tracks)
{
    return dispatch(command::addJobList(tracks));
}

CommandResult HttpTransport::sendSetPlaylist(Device &device, const QList<int> &playlist)
{
    const CommandResult result = dispatch(command::setJobList(playlist));
    if (!result.ok())
        return result;

    FieldMap update;
    update.insert(fieldName(Field::Playlist), QVariant::fromValue(playlist));
    device.applyFieldMap(update);
    return result;
}

CommandResult HttpTransport::sendRepeatPlaylist(Device &, bool repeat)
{
    return dispatch(command::repeatJob(repeat));
}

CommandResult HttpTransport::sendAutoplay(Device &, const QString &option)
{
    return dispatch(command::waitAfter(option));
}

CommandResult HttpTransport::sendUpgrade(Device &, bool beta)
{
    return dispatch(command::upgrade(beta));
}

CommandResult HttpTransport::sendPlay(Device &)
{
    return dispatch(command::play());
}

CommandResult HttpTransport::sendPause(Device &)
{
    return dispatch(command::pause());
}

CommandResult HttpTransport::sendStop(Device &)
{
    return dispatch(command::stop());
}

CommandResult HttpTransport::sendReboot(Device &)
{
    return dispatch(command::reboot());
}

} // namespace oasis::control
