#pragma once

#include <functional>
#include <memory>

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QSet>
#include <QString>
#include <QUrl>
#include <QVariant>

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

namespace oasis::control {

inline constexpr int kDefaultHttpTimeoutMs = 10000;

using RawHeaders = QList<QPair<QByteArray, QByteArray>>;

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray contentType;
    QByteArray payload;
    QString error;
};

using HttpCallback = std::function<void(const HttpResult &result)>;

// Request/response helper over QNetworkAccessManager. The *Async calls
// report through a callback once the reply finishes or the timeout fires;
// get() and postJson() spin a local event loop until then, so other queued
// work keeps running meanwhile. Only a 200 response counts as success.
class HttpClient
{
public:
    // When manager is null one is created on first use and owned by this
    // client.
    explicit HttpClient(QNetworkAccessManager *manager = nullptr);
    ~HttpClient();

    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    HttpResult get(const QUrl &url,
                   const RawHeaders &headers = {},
                   int timeoutMs = kDefaultHttpTimeoutMs);

    HttpResult postJson(const QUrl &url,
                        const QByteArray &payload,
                        const RawHeaders &headers = {},
                        int timeoutMs = kDefaultHttpTimeoutMs);

    void getAsync(const QUrl &url, const RawHeaders &headers, int timeoutMs, HttpCallback done);
    void postJsonAsync(const QUrl &url,
                       const QByteArray &payload,
                       const RawHeaders &headers,
                       int timeoutMs,
                       HttpCallback done);

    // Aborts outstanding requests (their callbacks still run) and releases
    // the network manager if this client created it. A later request
    // creates a fresh one.
    void close();

    bool ownsManager() const { return m_ownedManager != nullptr; }

    // JSON bodies become the parsed document's variant, text/plain bodies
    // a QString; any other content type yields a null QVariant.
    static QVariant decodeBody(const HttpResult &result);

private:
    QNetworkAccessManager *manager();

    QNetworkRequest buildRequest(const QUrl &url, const RawHeaders &headers, bool hasJsonBody) const;

    void startRequest(const QByteArray &method,
                      const QUrl &url,
                      const QByteArray &payload,
                      const RawHeaders &headers,
                      int timeoutMs,
                      HttpCallback done);

    HttpResult request(const QByteArray &method,
                       const QUrl &url,
                       const QByteArray &payload,
                       const RawHeaders &headers,
                       int timeoutMs);

    QNetworkAccessManager *m_manager = nullptr;
    std::unique_ptr<QNetworkAccessManager> m_ownedManager;
    QSet<QNetworkReply *> m_pending;
};

} // namespace oasis::control
