#pragma once

#include <QList>
#include <QString>

#include "oasis_types.h"

namespace oasis::control {

class Device;

// Contract every device transport implements. Calls may interleave on the
// event loop; ordering between callers is the transport's concern.
class Transport
{
public:
    virtual ~Transport() = default;

    // Asks the device for a fresh status and applies what comes back (HTTP)
    // or lets the pushed updates apply it later (broker).
    virtual CommandResult requestStatus(Device &device) = 0;

    // Empty when the address is still unknown after the request.
    virtual QString macAddress(Device &device) = 0;

    virtual CommandResult sendAutoClean(Device &device, bool enabled) = 0;
    virtual CommandResult sendBallSpeed(Device &device, int speed) = 0;
    virtual CommandResult sendLed(Device &device,
                                  const QString &effect,
                                  const QString &color,
                                  int speed,
                                  int brightness) = 0;
    virtual CommandResult sendSleep(Device &device) = 0;
    virtual CommandResult sendMoveJob(Device &device, int fromIndex, int toIndex) = 0;
    virtual CommandResult sendChangeTrack(Device &device, int index) = 0;
    virtual CommandResult sendAddJobList(Device &device, const QList<int> &tracks) = 0;
    virtual CommandResult sendSetPlaylist(Device &device, const QList<int> &playlist) = 0;
    virtual CommandResult sendRepeatPlaylist(Device &device, bool repeat) = 0;
    virtual CommandResult sendAutoplay(Device &device, const QString &option) = 0;
    virtual CommandResult sendUpgrade(Device &device, bool beta) = 0;
    virtual CommandResult sendPlay(Device &device) = 0;
    virtual CommandResult sendPause(Device &device) = 0;
    virtual CommandResult sendStop(Device &device) = 0;
    virtual CommandResult sendReboot(Device &device) = 0;
};

} // namespace oasis::control
