#include <gtest/gtest.h>

#include "oasis_commands.h"

using namespace oasis::control;

TEST(CommandTest, BareCommandsHaveNoValue)
{
    const Command status = command::getStatus();
    EXPECT_EQ(status.key, QStringLiteral("GETSTATUS"));
    EXPECT_FALSE(status.hasValue);
    EXPECT_EQ(status.toPayload(), QByteArray("GETSTATUS"));

    EXPECT_EQ(command::getAll().toPayload(), QByteArray("GETALL"));
    EXPECT_EQ(command::pause().toPayload(), QByteArray("CMDPAUSE"));
    EXPECT_EQ(command::stop().toPayload(), QByteArray("CMDSTOP"));
    EXPECT_EQ(command::reboot().toPayload(), QByteArray("CMDBOOT"));
    EXPECT_EQ(command::sleep().toPayload(), QByteArray("CMDSLEEP"));
}

TEST(CommandTest, ValuedCommandsJoinWithEquals)
{
    EXPECT_EQ(command::ballSpeed(250).toPayload(), QByteArray("WRIOASISSPEED=250"));
    EXPECT_EQ(command::autoClean(true).toPayload(), QByteArray("WRIAUTOCLEAN=1"));
    EXPECT_EQ(command::repeatJob(false).toPayload(), QByteArray("WRIREPEATJOB=0"));
    EXPECT_EQ(command::changeTrack(3).toPayload(), QByteArray("CMDCHANGETRACK=3"));
    EXPECT_EQ(command::moveJob(1, 4).toPayload(), QByteArray("MOVEJOB=1;4"));
    EXPECT_EQ(command::waitAfter(QStringLiteral("2")).toPayload(), QByteArray("WRIWAITAFTER=2"));
    EXPECT_EQ(command::upgrade(true).toPayload(), QByteArray("CMDUPGRADE=1"));
}

TEST(CommandTest, JobListsAreCommaSeparated)
{
    EXPECT_EQ(command::setJobList({10, 20, 30}).toPayload(), QByteArray("WRIJOBLIST=10,20,30"));
    EXPECT_EQ(command::addJobList({7}).toPayload(), QByteArray("ADDJOBLIST=7"));

    const Command empty = command::setJobList({});
    EXPECT_TRUE(empty.hasValue);
    EXPECT_EQ(empty.toPayload(), QByteArray("WRIJOBLIST="));
}

TEST(CommandTest, LedCommandLayout)
{
    const Command led = command::led(QStringLiteral("3"), QStringLiteral("#ff0000"), 10, 120);
    EXPECT_EQ(led.toPayload(), QByteArray("WRILED=3;0;#ff0000;10;120"));
    EXPECT_TRUE(led.wakesDevice);

    EXPECT_FALSE(command::led(QStringLiteral("0"), QStringLiteral("#ffffff"), 0, 0).wakesDevice);
}

TEST(CommandTest, OnlyPlayAndLitLedWakeTheTable)
{
    EXPECT_TRUE(command::play().wakesDevice);
    EXPECT_FALSE(command::pause().wakesDevice);
    EXPECT_FALSE(command::ballSpeed(200).wakesDevice);
    EXPECT_FALSE(command::getStatus().wakesDevice);
}
