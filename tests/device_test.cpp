#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include <QCoreApplication>
#include <QJsonDocument>
#include <QStringList>

#include "oasis_device.h"
#include "oasis_transport.h"

using namespace oasis::control;

namespace {

// Records every call as "<name>" or "<name>:<args>".
class RecordingTransport final : public Transport
{
public:
    CommandResult requestStatus(Device &) override { return record(QStringLiteral("status")); }
    QString macAddress(Device &) override
    {
        calls.append(QStringLiteral("mac"));
        return mac;
    }
    CommandResult sendAutoClean(Device &, bool enabled) override
    {
        return record(QStringLiteral("autoclean:%1").arg(enabled ? 1 : 0));
    }
    CommandResult sendBallSpeed(Device &, int speed) override { return record(QStringLiteral("speed:%1").arg(speed)); }
    CommandResult sendLed(Device &, const QString &effect, const QString &color, int speed, int brightness) override
    {
        return record(QStringLiteral("led:%1;%2;%3;%4").arg(effect, color).arg(speed).arg(brightness));
    }
    CommandResult sendSleep(Device &) override { return record(QStringLiteral("sleep")); }
    CommandResult sendMoveJob(Device &, int fromIndex, int toIndex) override
    {
        return record(QStringLiteral("move:%1;%2").arg(fromIndex).arg(toIndex));
    }
    CommandResult sendChangeTrack(Device &, int index) override { return record(QStringLiteral("change:%1").arg(index)); }
    CommandResult sendAddJobList(Device &, const QList<int> &tracks) override
    {
        return record(QStringLiteral("add:%1").arg(tracks.size()));
    }
    CommandResult sendSetPlaylist(Device &, const QList<int> &playlist) override
    {
        return record(QStringLiteral("set:%1").arg(playlist.size()));
    }
    CommandResult sendRepeatPlaylist(Device &, bool repeat) override
    {
        return record(QStringLiteral("repeat:%1").arg(repeat ? 1 : 0));
    }
    CommandResult sendAutoplay(Device &, const QString &option) override
    {
        return record(QStringLiteral("autoplay:%1").arg(option));
    }
    CommandResult sendUpgrade(Device &, bool beta) override { return record(QStringLiteral("upgrade:%1").arg(beta ? 1 : 0)); }
    CommandResult sendPlay(Device &) override { return record(QStringLiteral("play")); }
    CommandResult sendPause(Device &) override { return record(QStringLiteral("pause")); }
    CommandResult sendStop(Device &) override { return record(QStringLiteral("stop")); }
    CommandResult sendReboot(Device &) override { return record(QStringLiteral("reboot")); }

    QStringList calls;
    QString failOn;
    QString mac;

private:
    CommandResult record(const QString &call)
    {
        calls.append(call);
        if (call == failOn)
            return CommandResult::failure(CmdStatus::Failure, QStringLiteral("HTTP 500"));
        return CommandResult::success();
    }
};

// Holds requests until the test completes them.
class ManualTrackSource final : public TrackInfoSource
{
public:
    void fetchTrackInfo(int trackId, TrackInfoCallback done) override
    {
        requested.append(trackId);
        pending.append(std::move(done));
    }

    void complete(int index, const QString &name)
    {
        TrackInfo track;
        track.id = requested.at(index);
        track.name = name;
        pending.at(index)(track, QString());
    }

    QList<int> requested;
    QList<TrackInfoCallback> pending;
};

FieldMap fields(std::initializer_list<std::pair<Field, QVariant>> values)
{
    FieldMap out;
    for (const auto &value : values)
        out.insert(fieldName(value.first), value.second);
    return out;
}

DeviceInfo miniInfo()
{
    DeviceInfo info;
    info.model = QStringLiteral("Oasis Mini");
    info.serialNumber = QStringLiteral("OM123");
    return info;
}

} // namespace

class DeviceTest : public ::testing::Test
{
protected:
    DeviceTest()
    {
        device = std::make_unique<Device>(miniInfo());
        device->attachTransport(&transport);
    }

    RecordingTransport transport;
    std::unique_ptr<Device> device;
};

TEST_F(DeviceTest, NameDefaultsToModelAndSerial)
{
    EXPECT_EQ(device->name(), QStringLiteral("Oasis Mini OM123"));
    EXPECT_FALSE(device->isInitialized());
}

TEST_F(DeviceTest, RepeatedUpdateNotifiesOnce)
{
    int notified = 0;
    const auto unsubscribe = device->addUpdateListener([&notified]() { ++notified; });

    const FieldMap update = fields({{Field::BallSpeed, 250}, {Field::StatusCode, 4}});
    EXPECT_TRUE(device->applyFieldMap(update));
    EXPECT_FALSE(device->applyFieldMap(update));
    EXPECT_EQ(notified, 1);
    EXPECT_EQ(device->ballSpeed(), 250);
    EXPECT_EQ(device->statusText(), QStringLiteral("playing"));

    unsubscribe();
    device->applyFieldMap(fields({{Field::BallSpeed, 300}}));
    EXPECT_EQ(notified, 1);
}

TEST_F(DeviceTest, UnknownFieldsAreIgnored)
{
    FieldMap update;
    update.insert(QStringLiteral("not_a_field"), 1);
    EXPECT_FALSE(device->applyFieldMap(update));
}

TEST_F(DeviceTest, ThrowingListenerDoesNotStopOthers)
{
    int notified = 0;
    device->addUpdateListener([]() { throw std::runtime_error("listener failed"); });
    device->addUpdateListener([&notified]() { ++notified; });

    EXPECT_TRUE(device->applyFieldMap(fields({{Field::Progress, 10}})));
    EXPECT_EQ(notified, 1);
}

TEST_F(DeviceTest, NonStandardThrowFromListenerIsContained)
{
    int notified = 0;
    device->addUpdateListener([]() { throw 42; });
    device->addUpdateListener([&notified]() { ++notified; });

    EXPECT_NO_THROW(device->applyFieldMap(fields({{Field::Progress, 10}})));
    EXPECT_EQ(notified, 1);
}

TEST_F(DeviceTest, AppliesStatusString)
{
    EXPECT_TRUE(device->applyStatusString(QStringLiteral("4;0;150;10,20,30;1;42;0;0;0;120;#ff0000;0;0;200;1;0;1;0")));
    EXPECT_EQ(device->currentTrackId(), std::optional<int>(20));
    EXPECT_EQ(device->brightness(), 120);
    EXPECT_EQ(device->color(), QStringLiteral("#ff0000"));

    EXPECT_FALSE(device->applyStatusString(QStringLiteral("garbage")));
    EXPECT_EQ(device->ballSpeed(), 150);
}

TEST_F(DeviceTest, SleepingTableReportsZeroBrightness)
{
    device->applyFieldMap(fields({{Field::Brightness, 120}, {Field::StatusCode, 6}}));
    EXPECT_TRUE(device->isSleeping());
    EXPECT_EQ(device->brightness(), 0);
    EXPECT_EQ(device->rawBrightness(), 120);
    EXPECT_EQ(device->brightnessOn(), 120);

    device->applyFieldMap(fields({{Field::Brightness, 0}}));
    EXPECT_EQ(device->brightnessOn(), 120);
}

TEST_F(DeviceTest, ErrorMessageOnlyInErrorState)
{
    device->applyFieldMap(fields({{Field::Error, 16}}));
    EXPECT_TRUE(device->errorMessage().isEmpty());

    device->applyFieldMap(fields({{Field::StatusCode, 9}}));
    EXPECT_EQ(device->errorMessage(), QStringLiteral("Your device failed centering itself"));

    device->applyFieldMap(fields({{Field::Error, 99}}));
    EXPECT_EQ(device->errorMessage(), QStringLiteral("Unknown (99)"));
}

TEST_F(DeviceTest, CurrentTrackFallsBackToFirstEntry)
{
    EXPECT_FALSE(device->currentTrackId().has_value());
    device->applyFieldMap(fields({{Field::Playlist, QVariant::fromValue(QList<int>{5, 6})},
                                  {Field::PlaylistIndex, 9}}));
    EXPECT_EQ(device->currentTrackId(), std::optional<int>(5));
}

TEST_F(DeviceTest, PlaylistIndexIsClampedToPlaylistLength)
{
    device->applyFieldMap(fields({{Field::Playlist, QVariant::fromValue(QList<int>{5, 6})}}));
    device->applyFieldMap(fields({{Field::PlaylistIndex, 9}}));
    EXPECT_EQ(device->playlistIndex(), 2);

    device->applyFieldMap(fields({{Field::PlaylistIndex, -3}}));
    EXPECT_EQ(device->playlistIndex(), 0);

    device->applyFieldMap(fields({{Field::PlaylistIndex, 1}}));
    EXPECT_EQ(device->playlistIndex(), 1);
    EXPECT_EQ(device->currentTrackId(), std::optional<int>(6));
}

TEST_F(DeviceTest, InvalidLedEffectIsNotSent)
{
    LedRequest request;
    request.effect = QStringLiteral("99");
    const CommandResult result = device->setLed(request);
    EXPECT_EQ(result.status, CmdStatus::InvalidArgument);
    EXPECT_EQ(result.error, QStringLiteral("Invalid led effect specified"));
    EXPECT_TRUE(transport.calls.isEmpty());
}

TEST_F(DeviceTest, LedRangesAreValidated)
{
    LedRequest speed;
    speed.speed = 91;
    EXPECT_EQ(device->setLed(speed).error, QStringLiteral("Invalid led speed specified"));

    LedRequest brightness;
    brightness.brightness = 201;
    EXPECT_EQ(device->setLed(brightness).error, QStringLiteral("Invalid brightness specified"));
    EXPECT_TRUE(transport.calls.isEmpty());
}

TEST_F(DeviceTest, LedFillsFromCurrentState)
{
    device->applyFieldMap(fields({{Field::LedEffect, QStringLiteral("2")}, {Field::LedSpeed, 15},
                                  {Field::Brightness, 80}}));
    LedRequest request;
    request.brightness = 150;
    EXPECT_TRUE(device->setLed(request).ok());
    ASSERT_EQ(transport.calls.size(), 1);
    EXPECT_EQ(transport.calls.first(), QStringLiteral("led:2;#ffffff;15;150"));
}

TEST_F(DeviceTest, BallSpeedRange)
{
    EXPECT_EQ(device->setBallSpeed(99).status, CmdStatus::InvalidArgument);
    EXPECT_EQ(device->setBallSpeed(401).status, CmdStatus::InvalidArgument);
    EXPECT_TRUE(device->setBallSpeed(400).ok());
    EXPECT_EQ(transport.calls, QStringList{QStringLiteral("speed:400")});
}

TEST(DeviceNoTransportTest, CommandsFailWithoutTransport)
{
    Device device(miniInfo());
    EXPECT_EQ(device.play().status, CmdStatus::NoTransport);
    EXPECT_EQ(device.requestStatus().status, CmdStatus::NoTransport);
    CommandResult macResult;
    EXPECT_TRUE(device.fetchMacAddress(&macResult).isEmpty());
    EXPECT_EQ(macResult.status, CmdStatus::NoTransport);
    // Validation still runs first.
    EXPECT_EQ(device.setBallSpeed(10).status, CmdStatus::InvalidArgument);
}

TEST_F(DeviceTest, SetPlaylistResumesWhenPlaying)
{
    device->applyFieldMap(fields({{Field::StatusCode, 4}}));
    EXPECT_TRUE(device->setPlaylist({1, 2, 3}).ok());
    EXPECT_EQ(transport.calls, (QStringList{QStringLiteral("stop"), QStringLiteral("set:3"), QStringLiteral("play")}));
}

TEST_F(DeviceTest, SetPlaylistStaysStoppedOtherwise)
{
    device->applyFieldMap(fields({{Field::StatusCode, 2}}));
    EXPECT_TRUE(device->setPlaylist({1, 2}).ok());
    EXPECT_EQ(transport.calls, (QStringList{QStringLiteral("stop"), QStringLiteral("set:2")}));

    transport.calls.clear();
    EXPECT_TRUE(device->clearPlaylist().ok());
    EXPECT_EQ(transport.calls, (QStringList{QStringLiteral("stop"), QStringLiteral("set:0")}));

    transport.calls.clear();
    EXPECT_TRUE(device->setPlaylist({}, true).ok());
    EXPECT_EQ(transport.calls, (QStringList{QStringLiteral("stop"), QStringLiteral("set:0")}));
}

TEST_F(DeviceTest, SetPlaylistPlaysWhenAsked)
{
    device->applyFieldMap(fields({{Field::StatusCode, 2}}));
    EXPECT_TRUE(device->setPlaylist({1, 2}, true).ok());
    EXPECT_EQ(transport.calls, (QStringList{QStringLiteral("stop"), QStringLiteral("set:2"), QStringLiteral("play")}));
}

TEST_F(DeviceTest, SetPlaylistHonoursExplicitNoPlay)
{
    device->applyFieldMap(fields({{Field::StatusCode, 4}}));
    EXPECT_TRUE(device->setPlaylist({1, 2}, false).ok());
    EXPECT_EQ(transport.calls, (QStringList{QStringLiteral("stop"), QStringLiteral("set:2")}));
}

TEST_F(DeviceTest, SetPlaylistStopsAtFirstFailure)
{
    transport.failOn = QStringLiteral("stop");
    const CommandResult result = device->setPlaylist({1}, true);
    EXPECT_EQ(result.status, CmdStatus::Failure);
    EXPECT_EQ(transport.calls, QStringList{QStringLiteral("stop")});
}

TEST_F(DeviceTest, AutoplayToggleMapsToOptions)
{
    EXPECT_TRUE(device->setAutoplayEnabled(true).ok());
    EXPECT_TRUE(device->setAutoplayEnabled(false).ok());
    EXPECT_EQ(transport.calls, (QStringList{QStringLiteral("autoplay:0"), QStringLiteral("autoplay:1")}));
}

TEST_F(DeviceTest, FetchMacAddressStoresResult)
{
    transport.mac = QStringLiteral("aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(device->fetchMacAddress(), transport.mac);
    EXPECT_EQ(device->macAddress(), transport.mac);

    // Known addresses are not fetched again.
    EXPECT_EQ(device->fetchMacAddress(), transport.mac);
    EXPECT_EQ(transport.calls.count(QStringLiteral("mac")), 1);
}

TEST_F(DeviceTest, FetchMacAddressReportsMissingAddress)
{
    CommandResult result;
    EXPECT_TRUE(device->fetchMacAddress(&result).isEmpty());
    EXPECT_EQ(result.status, CmdStatus::Failure);
    EXPECT_TRUE(device->macAddress().isEmpty());
}

TEST_F(DeviceTest, TrackDetailsFromCatalog)
{
    const QJsonObject obj = QJsonDocument::fromJson(R"({
        "20": {"name": "Spiral", "image": "spiral.png", "svg_content": {}, "reduced_svg_content_new": 200}
    })").object();
    const TrackCatalog catalog = TrackCatalog::fromJson(obj);
    device->setTrackCatalog(&catalog);

    device->applyFieldMap(fields({{Field::Playlist, QVariant::fromValue(QList<int>{20, 21})},
                                  {Field::PlaylistIndex, 0}, {Field::Progress, 50}}));
    EXPECT_EQ(device->trackName(), QStringLiteral("Spiral"));
    EXPECT_EQ(device->trackImageUrl(), QStringLiteral("https://app.grounded.so/uploads/spiral.png"));
    EXPECT_EQ(device->drawingProgress(), std::optional<double>(25.0));

    const QMap<int, QString> details = device->playlistDetails();
    EXPECT_EQ(details.value(20), QStringLiteral("Spiral"));
    EXPECT_EQ(details.value(21), QStringLiteral("Unknown Title (#21)"));
}

TEST_F(DeviceTest, SupersededTrackRefreshIsDropped)
{
    ManualTrackSource source;
    device->setTrackSource(&source);
    int notified = 0;
    device->addUpdateListener([&notified]() { ++notified; });

    device->applyFieldMap(fields({{Field::Playlist, QVariant::fromValue(QList<int>{1, 2})},
                                  {Field::PlaylistIndex, 0}}));
    QCoreApplication::processEvents();
    ASSERT_EQ(source.requested, QList<int>{1});

    device->applyFieldMap(fields({{Field::PlaylistIndex, 1}}));
    QCoreApplication::processEvents();
    ASSERT_EQ(source.requested, (QList<int>{1, 2}));
    EXPECT_EQ(notified, 2);

    source.complete(0, QStringLiteral("One"));
    EXPECT_EQ(notified, 2);
    EXPECT_FALSE(device->track().has_value());

    source.complete(1, QStringLiteral("Two"));
    EXPECT_EQ(notified, 3);
    EXPECT_EQ(device->trackName(), QStringLiteral("Two"));
}

TEST_F(DeviceTest, TrackRefreshErrorKeepsState)
{
    ManualTrackSource source;
    device->setTrackSource(&source);
    device->applyFieldMap(fields({{Field::Playlist, QVariant::fromValue(QList<int>{3})}}));
    QCoreApplication::processEvents();
    ASSERT_EQ(source.pending.size(), 1);

    source.pending.first()(std::nullopt, QStringLiteral("Unauthenticated"));
    EXPECT_FALSE(device->track().has_value());
    EXPECT_TRUE(device->trackName().isEmpty());
}
