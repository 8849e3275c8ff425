#pragma once

#include <functional>

#include <QJsonArray>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QUrl>

#include "oasis_cache.h"
#include "oasis_config.h"
#include "oasis_http.h"
#include "oasis_tracks.h"

class QNetworkAccessManager;

namespace oasis::control {

enum class CloudError {
    None,
    Unauthenticated,
    NotFound,
    Http,
    Network,
    InvalidResponse,
};

struct CloudReply {
    CloudError error = CloudError::None;
    int statusCode = 0;
    QString message;
    QJsonValue data;

    bool ok() const noexcept { return error == CloudError::None; }

    static CloudReply failure(CloudError error, const QString &message, int statusCode = 0)
    {
        CloudReply reply;
        reply.error = error;
        reply.message = message;
        reply.statusCode = statusCode;
        return reply;
    }
};

using CloudCallback = std::function<void(const CloudReply &reply)>;

// Client for the vendor's account API (app.grounded.so). Authenticated
// calls carry a bearer token; without one they fail with Unauthenticated
// before any request is made. Playlists, track records and the latest
// software descriptor are served from a MetadataCache.
class CloudClient final : public TrackInfoSource
{
public:
    explicit CloudClient(const CloudSettings &settings = {},
                         QNetworkAccessManager *manager = nullptr,
                         int timeoutMs = kDefaultHttpTimeoutMs);
    ~CloudClient() override;

    CloudClient(const CloudClient &) = delete;
    CloudClient &operator=(const CloudClient &) = delete;

    QUrl baseUrl() const { return m_settings.baseUrl; }
    QUrl resolve(const QString &path) const;

    QString accessToken() const { return m_accessToken; }
    void setAccessToken(const QString &token) { m_accessToken = token; }
    bool isAuthenticated() const { return !m_accessToken.isEmpty(); }

    // Closes the network manager when this client created it.
    void close();
    void invalidateCaches() { m_cache.clear(); }

    void loginAsync(const QString &email, const QString &password, CloudCallback done);
    void logoutAsync(CloudCallback done);
    void userAsync(CloudCallback done);
    void devicesAsync(CloudCallback done);
    void playlistsAsync(bool personalOnly, CloudCallback done);
    // A track the API does not know resolves to a placeholder record.
    void trackInfoAsync(int trackId, CloudCallback done);
    // Collects "data" across every page, following next_page_url.
    void tracksAsync(const QList<int> &trackIds, CloudCallback done);
    void latestSoftwareAsync(CloudCallback done);

    // Blocking forms of the calls above.
    CloudReply login(const QString &email, const QString &password);
    CloudReply logout();
    CloudReply user();
    CloudReply devices();
    CloudReply playlists(bool personalOnly = false);
    CloudReply trackInfo(int trackId);
    CloudReply tracks(const QList<int> &trackIds);
    CloudReply latestSoftware();

    void fetchTrackInfo(int trackId, TrackInfoCallback done) override;

private:
    void send(const QByteArray &method,
              const QUrl &url,
              const QByteArray &body,
              bool authenticated,
              CloudCallback done);
    void fetchTrackPage(const QUrl &url, const QJsonArray &collected, int pagesLeft, CloudCallback done);
    CloudReply toReply(const HttpResult &result, const QUrl &url) const;
    CloudReply wait(const std::function<void(CloudCallback)> &start);

    CloudSettings m_settings;
    int m_timeoutMs = kDefaultHttpTimeoutMs;
    QString m_accessToken;
    HttpClient m_http;
    MetadataCache<CloudReply> m_cache;
};

} // namespace oasis::control
