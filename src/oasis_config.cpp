#include "oasis_config.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

namespace oasis::control {

namespace {

// Application credentials shipped with the official app, base64-encoded.
constexpr char kBrokerUsername[] = "YXBw";
constexpr char kBrokerPassword[] = "RWdETFlKMDczfi4t";

QString decodeCredential(const char *encoded)
{
    return QString::fromUtf8(QByteArray::fromBase64(QByteArray(encoded)));
}

int positiveInt(const QJsonObject &obj, const QString &key, int fallback, int minimum = 1)
{
    const QJsonValue value = obj.value(key);
    if (!value.isDouble())
        return fallback;
    const int parsed = value.toInt(fallback);
    return parsed >= minimum ? parsed : fallback;
}

QString nonEmptyString(const QJsonObject &obj, const QString &key, const QString &fallback)
{
    const QString value = obj.value(key).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

} // namespace

BrokerSettings::BrokerSettings()
    : host(QStringLiteral("mqtt.grounded.so"))
    , path(QStringLiteral("mqtt"))
    , username(decodeCredential(kBrokerUsername))
    , password(decodeCredential(kBrokerPassword))
{
}

QUrl BrokerSettings::url() const
{
    QUrl out;
    out.setScheme(QStringLiteral("wss"));
    out.setHost(host);
    out.setPort(port);
    QString cleanPath = path;
    while (cleanPath.startsWith(QLatin1Char('/')))
        cleanPath.remove(0, 1);
    out.setPath(QLatin1Char('/') + cleanPath);
    return out;
}

ClientConfig ClientConfig::fromJson(const QJsonObject &obj)
{
    ClientConfig config;

    const QJsonObject broker = obj.value(QStringLiteral("broker")).toObject();
    config.broker.host = nonEmptyString(broker, QStringLiteral("host"), config.broker.host);
    config.broker.port = positiveInt(broker, QStringLiteral("port"), config.broker.port);
    if (config.broker.port > 65535)
        config.broker.port = BrokerSettings().port;
    if (broker.contains(QStringLiteral("path")))
        config.broker.path = broker.value(QStringLiteral("path")).toString().trimmed();
    config.broker.username = nonEmptyString(broker, QStringLiteral("username"), config.broker.username);
    if (broker.contains(QStringLiteral("password")))
        config.broker.password = broker.value(QStringLiteral("password")).toString();
    config.broker.keepAliveSec = positiveInt(broker, QStringLiteral("keepAliveSec"), config.broker.keepAliveSec);

    const QJsonObject cloud = obj.value(QStringLiteral("cloud")).toObject();
    const QString baseUrl = cloud.value(QStringLiteral("baseUrl")).toString().trimmed();
    if (!baseUrl.isEmpty()) {
        const QUrl url(baseUrl);
        if (url.isValid() && !url.host().isEmpty())
            config.cloud.baseUrl = url;
    }
    config.cloud.playlistsRefreshMs = positiveInt(cloud, QStringLiteral("playlistsRefreshMs"),
                                                  config.cloud.playlistsRefreshMs);
    config.cloud.softwareRefreshMs = positiveInt(cloud, QStringLiteral("softwareRefreshMs"),
                                                 config.cloud.softwareRefreshMs);
    config.cloud.trackInfoRefreshMs = positiveInt(cloud, QStringLiteral("trackInfoRefreshMs"),
                                                  config.cloud.trackInfoRefreshMs);

    config.reconnectIntervalMs = positiveInt(obj, QStringLiteral("reconnectIntervalMs"),
                                             kDefaultReconnectIntervalMs, kMinReconnectIntervalMs);
    config.connectTimeoutMs = positiveInt(obj, QStringLiteral("connectTimeoutMs"), config.connectTimeoutMs);
    config.maxPendingCommands = positiveInt(obj, QStringLiteral("maxPendingCommands"),
                                            kDefaultMaxPendingCommands);
    config.readyTimeoutMs = positiveInt(obj, QStringLiteral("readyTimeoutMs"), config.readyTimeoutMs);
    config.macTimeoutMs = positiveInt(obj, QStringLiteral("macTimeoutMs"), config.macTimeoutMs);
    config.httpTimeoutMs = positiveInt(obj, QStringLiteral("httpTimeoutMs"), config.httpTimeoutMs);
    config.trackCatalogPath = obj.value(QStringLiteral("trackCatalogPath")).toString().trimmed();

    return config;
}

bool ClientConfig::loadFile(const QString &path, ClientConfig *out, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = parseError.error != QJsonParseError::NoError
                ? QStringLiteral("Invalid JSON in %1: %2").arg(path, parseError.errorString())
                : QStringLiteral("Expected a JSON object in %1").arg(path);
        }
        return false;
    }

    if (out)
        *out = fromJson(doc.object());
    return true;
}

} // namespace oasis::control
