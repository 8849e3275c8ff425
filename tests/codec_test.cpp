#include <gtest/gtest.h>

#include "oasis_codec.h"

using namespace oasis::control;

namespace {

QList<int> playlistOf(const FieldMap &map)
{
    return map.value(fieldName(Field::Playlist)).value<QList<int>>();
}

} // namespace

TEST(StatusStringTest, ParsesEighteenFieldStatus)
{
    const QString raw = QStringLiteral("4;0;150;10,20,30;1;42;0;0;0;120;#ff0000;0;0;200;1;0;1;0");
    EXPECT_EQ(statusLayout(raw), StatusLayout::V1);

    QString error;
    const auto status = parseFullStatus(raw, &error);
    ASSERT_TRUE(status.has_value()) << error.toStdString();

    EXPECT_EQ(status->value(fieldName(Field::StatusCode)).toInt(), 4);
    EXPECT_EQ(status->value(fieldName(Field::Error)).toInt(), 0);
    EXPECT_EQ(status->value(fieldName(Field::BallSpeed)).toInt(), 150);
    EXPECT_EQ(playlistOf(*status), (QList<int>{10, 20, 30}));
    EXPECT_EQ(status->value(fieldName(Field::PlaylistIndex)).toInt(), 1);
    EXPECT_EQ(status->value(fieldName(Field::Progress)).toInt(), 42);
    EXPECT_EQ(status->value(fieldName(Field::Brightness)).toInt(), 120);
    EXPECT_EQ(status->value(fieldName(Field::Color)).toString(), QStringLiteral("#ff0000"));
    EXPECT_EQ(status->value(fieldName(Field::BrightnessMax)).toInt(), 200);
    EXPECT_TRUE(status->value(fieldName(Field::WifiConnected)).toBool());
    EXPECT_FALSE(status->value(fieldName(Field::RepeatPlaylist)).toBool());
    EXPECT_EQ(status->value(fieldName(Field::Autoplay)).toInt(), 1);
    EXPECT_FALSE(status->value(fieldName(Field::AutoClean)).toBool());
    EXPECT_FALSE(status->contains(fieldName(Field::SoftwareVersion)));
}

TEST(StatusStringTest, NineteenthFieldIsSoftwareVersion)
{
    const QString raw = QStringLiteral("2;0;200;;0;0;3;1;10;80;#00ff00;0;0;200;1;1;0;1;2.81");
    EXPECT_EQ(statusLayout(raw), StatusLayout::V2);

    const auto status = parseFullStatus(raw);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->value(fieldName(Field::SoftwareVersion)).toString(), QStringLiteral("2.81"));
    EXPECT_TRUE(playlistOf(*status).isEmpty());
    EXPECT_TRUE(status->value(fieldName(Field::RepeatPlaylist)).toBool());
    EXPECT_TRUE(status->value(fieldName(Field::AutoClean)).toBool());
}

TEST(StatusStringTest, RejectsShortAndEmptyInput)
{
    QString error;
    EXPECT_FALSE(parseFullStatus(QString(), &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_FALSE(parseFullStatus(QStringLiteral("4;0;150"), &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("3 fields")));
    EXPECT_EQ(statusLayout(QStringLiteral("4;0;150")), StatusLayout::Invalid);
}

TEST(StatusStringTest, MalformedNumbersParseAsZero)
{
    const auto status = parseFullStatus(QStringLiteral("x;0;fast;1,a,3;0;0;0;0;0;0;;0;0;200;0;0;0;0"));
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->value(fieldName(Field::StatusCode)).toInt(), 0);
    EXPECT_EQ(status->value(fieldName(Field::BallSpeed)).toInt(), 0);
    EXPECT_EQ(playlistOf(*status), (QList<int>{1, 3}));
    EXPECT_TRUE(status->value(fieldName(Field::Color)).isNull());
}

TEST(StatusStringTest, PlaylistIndexIsClampedToPlaylist)
{
    auto status = parseFullStatus(QStringLiteral("4;0;150;10,20;7;0;0;0;0;0;;0;0;200;0;0;0;0"));
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->value(fieldName(Field::PlaylistIndex)).toInt(), 2);

    status = parseFullStatus(QStringLiteral("4;0;150;10,20;-3;0;0;0;0;0;;0;0;200;0;0;0;0"));
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->value(fieldName(Field::PlaylistIndex)).toInt(), 0);
}

TEST(StatusTopicTest, MapsScalarTopics)
{
    auto update = parseTopicValue(QStringLiteral("OASIS_SPEEED"), QStringLiteral("250"));
    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->value(fieldName(Field::BallSpeed)).toInt(), 250);

    update = parseTopicValue(QStringLiteral("LED_EFFECT"), QStringLiteral("3"));
    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->value(fieldName(Field::LedEffect)).toString(), QStringLiteral("3"));

    update = parseTopicValue(QStringLiteral("MAC_ADDRESS"), QStringLiteral("aa:bb:cc:dd:ee:ff"));
    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->value(fieldName(Field::MacAddress)).toString(), QStringLiteral("aa:bb:cc:dd:ee:ff"));
}

TEST(StatusTopicTest, FlagsAcceptTextualTrue)
{
    for (const char *text : {"1", "true", "True"}) {
        const auto update = parseTopicValue(QStringLiteral("REPEAT_JOB"), QLatin1String(text));
        ASSERT_TRUE(update.has_value());
        EXPECT_TRUE(update->value(fieldName(Field::RepeatPlaylist)).toBool()) << text;
    }
    const auto off = parseTopicValue(QStringLiteral("AUTO_CLEAN"), QStringLiteral("false"));
    ASSERT_TRUE(off.has_value());
    EXPECT_FALSE(off->value(fieldName(Field::AutoClean)).toBool());

    // WIFI_STATUS only treats "1" as connected.
    const auto wifi = parseTopicValue(QStringLiteral("WIFI_STATUS"), QStringLiteral("true"));
    ASSERT_TRUE(wifi.has_value());
    EXPECT_FALSE(wifi->value(fieldName(Field::WifiConnected)).toBool());
}

TEST(StatusTopicTest, JobListAndCurrentJob)
{
    auto update = parseTopicValue(QStringLiteral("JOBLIST"), QStringLiteral("5,6,7"));
    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(playlistOf(*update), (QList<int>{5, 6, 7}));

    update = parseTopicValue(QStringLiteral("CURRENTJOB"), QStringLiteral("-1"));
    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->value(fieldName(Field::PlaylistIndex)).toInt(), 0);
}

TEST(StatusTopicTest, ColorNeedsHashPrefix)
{
    auto update = parseTopicValue(QStringLiteral("LED_EFFECT_PARAM"), QStringLiteral("#123456"));
    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->value(fieldName(Field::Color)).toString(), QStringLiteral("#123456"));

    update = parseTopicValue(QStringLiteral("LED_EFFECT_PARAM"), QStringLiteral("123456"));
    ASSERT_TRUE(update.has_value());
    EXPECT_TRUE(update->contains(fieldName(Field::Color)));
    EXPECT_TRUE(update->value(fieldName(Field::Color)).isNull());
}

TEST(StatusTopicTest, InvalidIntegerIsAnError)
{
    QString error;
    EXPECT_FALSE(parseTopicValue(QStringLiteral("OASIS_STATUS"), QStringLiteral("abc"), &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    const auto autoplay = parseTopicValue(QStringLiteral("WAIT_AFTER_JOB"), QStringLiteral("n/a"));
    ASSERT_TRUE(autoplay.has_value());
    EXPECT_EQ(autoplay->value(fieldName(Field::Autoplay)).toInt(), 0);
}

TEST(StatusTopicTest, UnknownSuffixIsRejected)
{
    QString error;
    EXPECT_FALSE(isKnownStatusTopic(QStringLiteral("BOGUS")));
    EXPECT_FALSE(parseTopicValue(QStringLiteral("BOGUS"), QStringLiteral("1"), &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("BOGUS")));
}

TEST(StatusTopicTest, FullStatusTopicUsesStatusParser)
{
    const auto update = parseTopicValue(QStringLiteral("FULLSTATUS"),
                                        QStringLiteral("4;0;150;10,20,30;1;42;0;0;0;120;#ff0000;0;0;200;1;0;1;0;3.0"));
    ASSERT_TRUE(update.has_value());
    EXPECT_EQ(update->value(fieldName(Field::SoftwareVersion)).toString(), QStringLiteral("3.0"));
    EXPECT_EQ(update->value(fieldName(Field::StatusCode)).toInt(), 4);

    EXPECT_FALSE(parseTopicValue(QStringLiteral("FULLSTATUS"), QStringLiteral("1;2")).has_value());
}
