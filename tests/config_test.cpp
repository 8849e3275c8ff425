#include <gtest/gtest.h>

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "oasis_config.h"

using namespace oasis::control;

namespace {

QJsonObject parseObject(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace

TEST(ConfigTest, DefaultsMatchTheCloudService)
{
    const ClientConfig config;
    EXPECT_EQ(config.broker.host, QStringLiteral("mqtt.grounded.so"));
    EXPECT_EQ(config.broker.port, 8084);
    EXPECT_EQ(config.broker.url().toString(), QStringLiteral("wss://mqtt.grounded.so:8084/mqtt"));
    EXPECT_FALSE(config.broker.username.isEmpty());
    EXPECT_FALSE(config.broker.password.isEmpty());
    EXPECT_EQ(config.cloud.baseUrl.host(), QStringLiteral("app.grounded.so"));
    EXPECT_EQ(config.reconnectIntervalMs, kDefaultReconnectIntervalMs);
    EXPECT_EQ(config.maxPendingCommands, kDefaultMaxPendingCommands);
}

TEST(ConfigTest, ReadsOverrides)
{
    const ClientConfig config = ClientConfig::fromJson(parseObject(R"({
        "broker": {"host": "broker.local", "port": 9001, "path": "/ws", "keepAliveSec": 60},
        "cloud": {"baseUrl": "http://cloud.local:8080", "playlistsRefreshMs": 1000},
        "reconnectIntervalMs": 2000,
        "maxPendingCommands": 3,
        "readyTimeoutMs": 500,
        "trackCatalogPath": "/tmp/tracks.json"
    })"));

    EXPECT_EQ(config.broker.url().toString(), QStringLiteral("wss://broker.local:9001/ws"));
    EXPECT_EQ(config.broker.keepAliveSec, 60);
    EXPECT_EQ(config.cloud.baseUrl.toString(), QStringLiteral("http://cloud.local:8080"));
    EXPECT_EQ(config.cloud.playlistsRefreshMs, 1000);
    EXPECT_EQ(config.cloud.softwareRefreshMs, kDefaultSoftwareRefreshMs);
    EXPECT_EQ(config.reconnectIntervalMs, 2000);
    EXPECT_EQ(config.maxPendingCommands, 3);
    EXPECT_EQ(config.readyTimeoutMs, 500);
    EXPECT_EQ(config.trackCatalogPath, QStringLiteral("/tmp/tracks.json"));
}

TEST(ConfigTest, OutOfRangeValuesKeepDefaults)
{
    const ClientConfig config = ClientConfig::fromJson(parseObject(R"({
        "broker": {"port": 70000, "host": "  "},
        "cloud": {"baseUrl": "not a url"},
        "reconnectIntervalMs": 100,
        "maxPendingCommands": 0,
        "macTimeoutMs": "fast"
    })"));

    EXPECT_EQ(config.broker.port, 8084);
    EXPECT_EQ(config.broker.host, QStringLiteral("mqtt.grounded.so"));
    EXPECT_EQ(config.cloud.baseUrl.host(), QStringLiteral("app.grounded.so"));
    EXPECT_EQ(config.reconnectIntervalMs, kDefaultReconnectIntervalMs);
    EXPECT_EQ(config.maxPendingCommands, kDefaultMaxPendingCommands);
    EXPECT_EQ(config.macTimeoutMs, kDefaultMacTimeoutMs);
}

TEST(ConfigTest, LoadFileReportsErrors)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    ClientConfig config;
    QString error;
    EXPECT_FALSE(ClientConfig::loadFile(dir.filePath(QStringLiteral("missing.json")), &config, &error));
    EXPECT_TRUE(error.startsWith(QStringLiteral("Cannot open")));

    const QString broken = dir.filePath(QStringLiteral("broken.json"));
    QFile file(broken);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();
    EXPECT_FALSE(ClientConfig::loadFile(broken, &config, &error));
    EXPECT_TRUE(error.startsWith(QStringLiteral("Invalid JSON")));

    const QString array = dir.filePath(QStringLiteral("array.json"));
    QFile arrayFile(array);
    ASSERT_TRUE(arrayFile.open(QIODevice::WriteOnly));
    arrayFile.write("[1, 2]");
    arrayFile.close();
    EXPECT_FALSE(ClientConfig::loadFile(array, &config, &error));
    EXPECT_TRUE(error.startsWith(QStringLiteral("Expected a JSON object")));
}

TEST(ConfigTest, LoadFileReadsObject)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("config.json"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(R"({"httpTimeoutMs": 2500})");
    file.close();

    ClientConfig config;
    QString error;
    ASSERT_TRUE(ClientConfig::loadFile(path, &config, &error)) << error.toStdString();
    EXPECT_EQ(config.httpTimeoutMs, 2500);
}
