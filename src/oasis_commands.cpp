#include "oasis_commands.h"

#include <QStringList>

namespace oasis::control {

namespace {

Command bare(const char *key, bool wakes = false)
{
    Command cmd;
    cmd.key = QLatin1String(key);
    cmd.wakesDevice = wakes;
    return cmd;
}

Command valued(const char *key, const QString &value, bool wakes = false)
{
    Command cmd;
    cmd.key = QLatin1String(key);
    cmd.value = value;
    cmd.hasValue = true;
    cmd.wakesDevice = wakes;
    return cmd;
}

QString bit(bool value)
{
    return value ? QStringLiteral("1") : QStringLiteral("0");
}

} // namespace

QByteArray Command::toPayload() const
{
    if (!hasValue)
        return key.toUtf8();
    return (key + QLatin1Char('=') + value).toUtf8();
}

namespace command {

QString joinTrackIds(const QList<int> &tracks)
{
    QStringList ids;
    ids.reserve(tracks.size());
    for (int id : tracks)
        ids.append(QString::number(id));
    return ids.join(QLatin1Char(','));
}

Command getStatus() { return bare("GETSTATUS"); }
Command getAll() { return bare("GETALL"); }
Command getMac() { return bare("GETMAC"); }

Command autoClean(bool enabled)
{
    return valued("WRIAUTOCLEAN", bit(enabled));
}

Command ballSpeed(int speed)
{
    return valued("WRIOASISSPEED", QString::number(speed));
}

Command led(const QString &effect, const QString &color, int speed, int brightness)
{
    const QString value = QStringLiteral("%1;0;%2;%3;%4").arg(effect, color).arg(speed).arg(brightness);
    return valued("WRILED", value, brightness != 0);
}

Command sleep() { return bare("CMDSLEEP"); }

Command moveJob(int fromIndex, int toIndex)
{
    return valued("MOVEJOB", QStringLiteral("%1;%2").arg(fromIndex).arg(toIndex));
}

Command changeTrack(int index)
{
    return valued("CMDCHANGETRACK", QString::number(index));
}

Command addJobList(const QList<int> &tracks)
{
    return valued("ADDJOBLIST", joinTrackIds(tracks));
}

Command setJobList(const QList<int> &tracks)
{
    return valued("WRIJOBLIST", joinTrackIds(tracks));
}

Command repeatJob(bool repeat)
{
    return valued("WRIREPEATJOB", bit(repeat));
}

Command waitAfter(const QString &option)
{
    return valued("WRIWAITAFTER", option);
}

Command upgrade(bool beta)
{
    return valued("CMDUPGRADE", bit(beta));
}

Command play() { return bare("CMDPLAY", true); }
Command pause() { return bare("CMDPAUSE"); }
Command stop() { return bare("CMDSTOP"); }
Command reboot() { return bare("CMDBOOT"); }

} // namespace command

} // namespace oasis::control
