#pragma once

#include <QJsonObject>
#include <QString>
#include <QUrl>

#include "oasis_http.h"

namespace oasis::control {

inline constexpr int kDefaultReconnectIntervalMs = 4000;
inline constexpr int kMinReconnectIntervalMs = 500;
inline constexpr int kDefaultConnectTimeoutMs = 15000;
inline constexpr int kDefaultMaxPendingCommands = 10;
inline constexpr int kDefaultReadyTimeoutMs = 10000;
inline constexpr int kDefaultMacTimeoutMs = 3000;
inline constexpr int kDefaultPlaylistsRefreshMs = 5 * 60 * 1000;
inline constexpr int kDefaultSoftwareRefreshMs = 60 * 60 * 1000;
inline constexpr int kDefaultTrackInfoRefreshMs = 24 * 60 * 60 * 1000;

struct BrokerSettings {
    BrokerSettings();

    QString host;
    int port = 8084;
    QString path;
    QString username;
    QString password;
    int keepAliveSec = 30;

    // wss://<host>:<port>/<path>
    QUrl url() const;
};

struct CloudSettings {
    QUrl baseUrl = QUrl(QStringLiteral("https://app.grounded.so"));
    int playlistsRefreshMs = kDefaultPlaylistsRefreshMs;
    int softwareRefreshMs = kDefaultSoftwareRefreshMs;
    int trackInfoRefreshMs = kDefaultTrackInfoRefreshMs;
};

struct ClientConfig {
    BrokerSettings broker;
    CloudSettings cloud;
    int reconnectIntervalMs = kDefaultReconnectIntervalMs;
    int connectTimeoutMs = kDefaultConnectTimeoutMs;
    int maxPendingCommands = kDefaultMaxPendingCommands;
    int readyTimeoutMs = kDefaultReadyTimeoutMs;
    int macTimeoutMs = kDefaultMacTimeoutMs;
    int httpTimeoutMs = kDefaultHttpTimeoutMs;
    QString trackCatalogPath;

    // Missing or out-of-range keys keep their defaults.
    static ClientConfig fromJson(const QJsonObject &obj);
    static bool loadFile(const QString &path, ClientConfig *out, QString *error = nullptr);
};

} // namespace oasis::control
