#include "oasis_cloud.h"

#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrlQuery>

#include "oasis_log.h"

namespace oasis::control {

namespace {

constexpr int kMaxTrackPages = 100;
const QString kSoftwareCacheKey = QStringLiteral("software");

QString playlistsCacheKey(bool personalOnly)
{
    return personalOnly ? QStringLiteral("playlists:personal") : QStringLiteral("playlists:all");
}

QString trackCacheKey(int trackId)
{
    return QStringLiteral("track:%1").arg(trackId);
}

QString boolParam(bool value)
{
    return value ? QStringLiteral("true") : QStringLiteral("false");
}

} // namespace

CloudClient::CloudClient(const CloudSettings &settings, QNetworkAccessManager *manager, int timeoutMs)
    : m_settings(settings)
    , m_timeoutMs(timeoutMs)
    , m_http(manager)
{
}

CloudClient::~CloudClient() = default;

QUrl CloudClient::resolve(const QString &path) const
{
    if (path.startsWith(QLatin1String("http")))
        return QUrl(path);
    return m_settings.baseUrl.resolved(QUrl(path));
}

void CloudClient::close()
{
    m_http.close();
}

CloudReply CloudClient::toReply(const HttpResult &result, const QUrl &url) const
{
    if (result.statusCode == 0)
        return CloudReply::failure(CloudError::Network, result.error);
    if (result.statusCode == 401)
        return CloudReply::failure(CloudError::Unauthenticated, QStringLiteral("Unauthenticated"), 401);
    if (result.statusCode == 404)
        return CloudReply::failure(CloudError::NotFound, result.error, 404);
    if (!result.ok)
        return CloudReply::failure(CloudError::Http, result.error, result.statusCode);

    CloudReply reply;
    reply.statusCode = result.statusCode;

    if (result.contentType == "application/json") {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(result.payload, &parseError);
        if (parseError.error != QJsonParseError::NoError) {
            return CloudReply::failure(CloudError::InvalidResponse,
                                       QStringLiteral("Invalid JSON: %1").arg(parseError.errorString()),
                                       result.statusCode);
        }
        if (doc.isObject())
            reply.data = doc.object();
        else if (doc.isArray())
            reply.data = doc.array();
        return reply;
    }

    if (result.contentType == "text/plain") {
        reply.data = QString::fromUtf8(result.payload);
        return reply;
    }

    // An expired session is answered with the web login page instead of 401.
    if (result.contentType == "text/html" && url.host() == m_settings.baseUrl.host()
        && result.payload.contains("login-page")) {
        return CloudReply::failure(CloudError::Unauthenticated, QStringLiteral("Unauthenticated"),
                                   result.statusCode);
    }
    return reply;
}

void CloudClient::send(const QByteArray &method,
                       const QUrl &url,
                       const QByteArray &body,
                       bool authenticated,
                       CloudCallback done)
{
    RawHeaders headers;
    if (authenticated) {
        if (m_accessToken.isEmpty()) {
            done(CloudReply::failure(CloudError::Unauthenticated, QStringLiteral("Unauthenticated")));
            return;
        }
        headers.append({QByteArrayLiteral("Authorization"), "Bearer " + m_accessToken.toUtf8()});
    }
    headers.append({QByteArrayLiteral("Accept"), QByteArrayLiteral("application/json")});

    auto handle = [this, url, done = std::move(done)](const HttpResult &result) {
        const CloudReply reply = toReply(result, url);
        if (!reply.ok())
            qCDebug(oasisCloudLog) << "Cloud request" << url.toString() << "failed:" << reply.message;
        done(reply);
    };

    if (method == QByteArrayLiteral("POST"))
        m_http.postJsonAsync(url, body, headers, m_timeoutMs, std::move(handle));
    else
        m_http.getAsync(url, headers, m_timeoutMs, std::move(handle));
}

void CloudClient::loginAsync(const QString &email, const QString &password, CloudCallback done)
{
    QJsonObject credentials;
    credentials.insert(QStringLiteral("email"), email);
    credentials.insert(QStringLiteral("password"), password);
    const QByteArray body = QJsonDocument(credentials).toJson(QJsonDocument::Compact);

    send(QByteArrayLiteral("POST"), resolve(QStringLiteral("api/auth/login")), body, false,
         [this, done = std::move(done)](const CloudReply &reply) {
        if (reply.ok()) {
            m_accessToken = reply.data.toObject().value(QStringLiteral("access_token")).toString();
            qCDebug(oasisCloudLog) << "Cloud login succeeded, token set:" << !m_accessToken.isEmpty();
        }
        done(reply);
    });
}

void CloudClient::logoutAsync(CloudCallback done)
{
    send(QByteArrayLiteral("GET"), resolve(QStringLiteral("api/auth/logout")), {}, true,
         [this, done = std::move(done)](const CloudReply &reply) {
        if (reply.ok()) {
            m_accessToken.clear();
            m_cache.clear();
        }
        done(reply);
    });
}

void CloudClient::userAsync(CloudCallback done)
{
    send(QByteArrayLiteral("GET"), resolve(QStringLiteral("api/auth/user")), {}, true, std::move(done));
}

void CloudClient::devicesAsync(CloudCallback done)
{
    send(QByteArrayLiteral("GET"), resolve(QStringLiteral("api/user/devices")), {}, true, std::move(done));
}

void CloudClient::playlistsAsync(bool personalOnly, CloudCallback done)
{
    m_cache.get(playlistsCacheKey(personalOnly), m_settings.playlistsRefreshMs,
                [this, personalOnly](CloudCallback fetched) {
        QUrl url = resolve(QStringLiteral("api/playlist"));
        QUrlQuery query;
        query.addQueryItem(QStringLiteral("my_playlists"), boolParam(personalOnly));
        url.setQuery(query);
        send(QByteArrayLiteral("GET"), url, {}, true, std::move(fetched));
    }, std::move(done));
}

void CloudClient::trackInfoAsync(int trackId, CloudCallback done)
{
    m_cache.get(trackCacheKey(trackId), m_settings.trackInfoRefreshMs,
                [this, trackId](CloudCallback fetched) {
        const QUrl url = resolve(QStringLiteral("api/track/%1").arg(trackId));
        send(QByteArrayLiteral("GET"), url, {}, true,
             [trackId, fetched = std::move(fetched)](const CloudReply &reply) {
            if (reply.error != CloudError::NotFound) {
                fetched(reply);
                return;
            }
            CloudReply placeholder;
            placeholder.statusCode = reply.statusCode;
            placeholder.data = TrackInfo::placeholder(trackId).raw;
            fetched(placeholder);
        });
    }, std::move(done));
}

void CloudClient::tracksAsync(const QList<int> &trackIds, CloudCallback done)
{
    QUrl url = resolve(QStringLiteral("api/track"));
    QUrlQuery query;
    for (int id : trackIds)
        query.addQueryItem(QStringLiteral("ids[]"), QString::number(id));
    url.setQuery(query);

    fetchTrackPage(url, QJsonArray(), kMaxTrackPages, std::move(done));
}

void CloudClient::fetchTrackPage(const QUrl &url, const QJsonArray &collected, int pagesLeft, CloudCallback done)
{
    send(QByteArrayLiteral("GET"), url, {}, true,
         [this, url, collected, pagesLeft, done = std::move(done)](const CloudReply &reply) {
        if (!reply.ok()) {
            done(reply);
            return;
        }

        QJsonArray tracks = collected;
        const QJsonObject page = reply.data.toObject();
        const QJsonArray data = page.value(QStringLiteral("data")).toArray();
        for (const QJsonValue &track : data)
            tracks.append(track);

        const QString next = page.value(QStringLiteral("next_page_url")).toString();
        const QUrl nextUrl = next.isEmpty() ? QUrl() : resolve(next);
        if (nextUrl.isEmpty() || nextUrl == url || pagesLeft <= 1) {
            if (!nextUrl.isEmpty() && nextUrl != url)
                qCWarning(oasisCloudLog) << "Stopping track pagination after" << kMaxTrackPages << "pages";
            CloudReply out = reply;
            out.data = tracks;
            done(out);
            return;
        }
        fetchTrackPage(nextUrl, tracks, pagesLeft - 1, done);
    });
}

void CloudClient::latestSoftwareAsync(CloudCallback done)
{
    m_cache.get(kSoftwareCacheKey, m_settings.softwareRefreshMs, [this](CloudCallback fetched) {
        send(QByteArrayLiteral("GET"), resolve(QStringLiteral("api/software/last-version")), {}, true,
             std::move(fetched));
    }, std::move(done));
}

void CloudClient::fetchTrackInfo(int trackId, TrackInfoCallback done)
{
    trackInfoAsync(trackId, [trackId, done = std::move(done)](const CloudReply &reply) {
        if (!reply.ok()) {
            done(std::nullopt, reply.message);
            return;
        }
        TrackInfo track = TrackInfo::fromJson(reply.data.toObject());
        if (!track.isValid())
            track = TrackInfo::placeholder(trackId);
        done(track, QString());
    });
}

CloudReply CloudClient::wait(const std::function<void(CloudCallback)> &start)
{
    CloudReply out;
    bool finished = false;
    QEventLoop loop;
    start([&](const CloudReply &reply) {
        out = reply;
        finished = true;
        loop.quit();
    });
    if (!finished)
        loop.exec();
    return out;
}

CloudReply CloudClient::login(const QString &email, const QString &password)
{
    return wait([&](CloudCallback done) { loginAsync(email, password, std::move(done)); });
}

CloudReply CloudClient::logout()
{
    return wait([this](CloudCallback done) { logoutAsync(std::move(done)); });
}

CloudReply CloudClient::user()
{
    return wait([this](CloudCallback done) { userAsync(std::move(done)); });
}

CloudReply CloudClient::devices()
{
    return wait([this](CloudCallback done) { devicesAsync(std::move(done)); });
}

CloudReply CloudClient::playlists(bool personalOnly)
{
    return wait([this, personalOnly](CloudCallback done) { playlistsAsync(personalOnly, std::move(done)); });
}

CloudReply CloudClient::trackInfo(int trackId)
{
    return wait([this, trackId](CloudCallback done) { trackInfoAsync(trackId, std::move(done)); });
}

CloudReply CloudClient::tracks(const QList<int> &trackIds)
{
    return wait([&](CloudCallback done) { tracksAsync(trackIds, std::move(done)); });
}

CloudReply CloudClient::latestSoftware()
{
    return wait([this](CloudCallback done) { latestSoftwareAsync(std::move(done)); });
}

} // namespace oasis::control
