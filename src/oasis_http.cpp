#include "oasis_http.h"

#include <QEventLoop>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include "oasis_log.h"

namespace oasis::control {

namespace {

QByteArray mimeType(const QVariant &header)
{
    QByteArray type = header.toByteArray();
    const int separator = type.indexOf(';');
    if (separator >= 0)
        type.truncate(separator);
    return type.trimmed().toLower();
}

} // namespace

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

HttpClient::~HttpClient()
{
    // Callbacks of requests still in flight must not run after this point.
    const QList<QNetworkReply *> pending = m_pending.values();
    for (QNetworkReply *reply : pending) {
        QObject::disconnect(reply, nullptr, nullptr, nullptr);
        reply->abort();
        reply->deleteLater();
    }
}

QNetworkAccessManager *HttpClient::manager()
{
    if (!m_manager) {
        m_ownedManager = std::make_unique<QNetworkAccessManager>();
        m_manager = m_ownedManager.get();
    }
    return m_manager;
}

void HttpClient::close()
{
    // abort() emits finished, which removes the reply from m_pending.
    const QList<QNetworkReply *> pending = m_pending.values();
    for (QNetworkReply *reply : pending)
        reply->abort();
    m_pending.clear();

    if (!m_ownedManager)
        return;
    m_ownedManager.reset();
    m_manager = nullptr;
}

HttpResult HttpClient::get(const QUrl &url, const RawHeaders &headers, int timeoutMs)
{
    return request(QByteArrayLiteral("GET"), url, {}, headers, timeoutMs);
}

HttpResult HttpClient::postJson(const QUrl &url,
                                const QByteArray &payload,
                                const RawHeaders &headers,
                                int timeoutMs)
{
    return request(QByteArrayLiteral("POST"), url, payload, headers, timeoutMs);
}

void HttpClient::getAsync(const QUrl &url, const RawHeaders &headers, int timeoutMs, HttpCallback done)
{
    startRequest(QByteArrayLiteral("GET"), url, {}, headers, timeoutMs, std::move(done));
}

void HttpClient::postJsonAsync(const QUrl &url,
                               const QByteArray &payload,
                               const RawHeaders &headers,
                               int timeoutMs,
                               HttpCallback done)
{
    startRequest(QByteArrayLiteral("POST"), url, payload, headers, timeoutMs, std::move(done));
}

QVariant HttpClient::decodeBody(const HttpResult &result)
{
    if (result.contentType == "application/json") {
        const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
        return doc.toVariant();
    }
    if (result.contentType == "text/plain")
        return QString::fromUtf8(result.payload);
    return QVariant();
}

QNetworkRequest HttpClient::buildRequest(const QUrl &url, const RawHeaders &headers, bool hasJsonBody) const
{
    QNetworkRequest out(url);
    out.setRawHeader("User-Agent", "oasis-control/1.0");
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    for (const auto &header : headers)
        out.setRawHeader(header.first, header.second);
    return out;
}

void HttpClient::startRequest(const QByteArray &method,
                              const QUrl &url,
                              const QByteArray &payload,
                              const RawHeaders &headers,
                              int timeoutMs,
                              HttpCallback done)
{
    if (!url.isValid() || url.host().isEmpty()) {
        HttpResult result;
        result.error = QStringLiteral("Invalid URL %1").arg(url.toString());
        done(result);
        return;
    }

    qCDebug(oasisHttpLog).noquote() << method << url.toString();

    const QNetworkRequest requestObj = buildRequest(url, headers, !payload.isEmpty());
    QNetworkAccessManager *nam = manager();

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET")) {
        reply = nam->get(requestObj);
    } else if (method == QByteArrayLiteral("POST")) {
        reply = nam->post(requestObj, payload);
    } else {
        reply = nam->sendCustomRequest(requestObj, method, payload);
    }

    if (!reply) {
        HttpResult result;
        result.error = QStringLiteral("Failed to create network request");
        done(result);
        return;
    }
    m_pending.insert(reply);

    auto *timer = new QTimer(reply);
    timer->setSingleShot(true);
    QObject::connect(timer, &QTimer::timeout, reply, [reply]() {
        reply->setProperty("oasisTimedOut", true);
        reply->abort();
    });
    timer->start(timeoutMs > 0 ? timeoutMs : kDefaultHttpTimeoutMs);

    QObject::connect(reply, &QNetworkReply::finished, reply, [this, reply, done = std::move(done)]() {
        m_pending.remove(reply);
        reply->deleteLater();

        HttpResult result;
        if (reply->property("oasisTimedOut").toBool()) {
            result.error = QStringLiteral("Request timed out");
            done(result);
            return;
        }

        result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        result.contentType = mimeType(reply->header(QNetworkRequest::ContentTypeHeader));
        result.payload = reply->readAll();

        // 4xx/5xx replies also carry a network error; keep the status code so
        // callers can tell them apart from transport failures.
        if (reply->error() != QNetworkReply::NoError && result.statusCode == 0) {
            result.error = reply->errorString();
        } else if (result.statusCode == 200) {
            result.ok = true;
        } else {
            result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
        }
        done(result);
    });
}

HttpResult HttpClient::request(const QByteArray &method,
                               const QUrl &url,
                               const QByteArray &payload,
                               const RawHeaders &headers,
                               int timeoutMs)
{
    HttpResult result;
    bool finished = false;
    QEventLoop loop;

    startRequest(method, url, payload, headers, timeoutMs, [&](const HttpResult &reply) {
        result = reply;
        finished = true;
        loop.quit();
    });

    if (!finished)
        loop.exec();
    return result;
}

} // namespace oasis::control
