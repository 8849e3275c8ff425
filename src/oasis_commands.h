#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

namespace oasis::control {

// One device command: a single key with an optional value. HTTP sends it as
// the query "KEY=VALUE" ("KEY=" without a value); the broker transport
// publishes "KEY=VALUE" or the bare key.
struct Command {
    QString key;
    QString value;
    bool hasValue = false;
    bool wakesDevice = false;

    QByteArray toPayload() const;
};

namespace command {

Command getStatus();
Command getAll();
Command getMac();
Command autoClean(bool enabled);
Command ballSpeed(int speed);
Command led(const QString &effect, const QString &color, int speed, int brightness);
Command sleep();
Command moveJob(int fromIndex, int toIndex);
Command changeTrack(int index);
Command addJobList(const QList<int> &tracks);
Command setJobList(const QList<int> &tracks);
Command repeatJob(bool repeat);
Command waitAfter(const QString &option);
Command upgrade(bool beta);
Command play();
Command pause();
Command stop();
Command reboot();

QString joinTrackIds(const QList<int> &tracks);

} // namespace command

} // namespace oasis::control
