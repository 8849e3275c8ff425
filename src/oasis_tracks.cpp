#include "oasis_tracks.h"

#include <QFile>
#include <QJsonDocument>

namespace oasis::control {

namespace {

const QString kImageUrlTemplate = QStringLiteral("https://app.grounded.so/uploads/%1");

} // namespace

QString unknownTrackName(int trackId)
{
    return QStringLiteral("Unknown Title (#%1)").arg(trackId);
}

QString trackImageUrl(const TrackInfo &track)
{
    if (track.image.isEmpty())
        return {};
    return kImageUrlTemplate.arg(track.image);
}

TrackInfo TrackInfo::fromJson(const QJsonObject &obj)
{
    TrackInfo track;
    track.id = obj.value(QStringLiteral("id")).toInt();
    track.name = obj.value(QStringLiteral("name")).toString();
    track.image = obj.value(QStringLiteral("image")).toString();
    track.raw = obj;
    return track;
}

TrackInfo TrackInfo::placeholder(int trackId)
{
    TrackInfo track;
    track.id = trackId;
    track.name = unknownTrackName(trackId);
    track.raw.insert(QStringLiteral("id"), trackId);
    track.raw.insert(QStringLiteral("name"), track.name);
    return track;
}

std::optional<int> TrackInfo::pathPointCount() const
{
    const QJsonValue svg = raw.value(QStringLiteral("svg_content"));
    if (svg.isUndefined() || svg.isNull())
        return std::nullopt;

    const int reduced = raw.value(QStringLiteral("reduced_svg_content_new")).toInt();
    if (reduced > 0)
        return reduced;

    // Only the decrypted drawing can be measured; the encrypted payload is
    // opaque here.
    const QString decrypted = svg.toObject().value(QStringLiteral("decrypted")).toString();
    if (decrypted.isEmpty())
        return std::nullopt;
    return static_cast<int>(decrypted.count(QLatin1Char('L'))) + 1;
}

TrackCatalog TrackCatalog::fromJson(const QJsonObject &obj)
{
    TrackCatalog catalog;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        bool ok = false;
        const int id = it.key().toInt(&ok);
        if (!ok || !it.value().isObject())
            continue;
        TrackInfo track = TrackInfo::fromJson(it.value().toObject());
        track.id = id;
        catalog.m_tracks.insert(id, track);
    }
    return catalog;
}

bool TrackCatalog::loadFile(const QString &path, TrackCatalog *out, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("Invalid track catalog %1: %2").arg(path, parseError.errorString());
        return false;
    }

    if (out)
        *out = fromJson(doc.object());
    return true;
}

const TrackInfo *TrackCatalog::find(int trackId) const
{
    const auto it = m_tracks.constFind(trackId);
    if (it == m_tracks.constEnd())
        return nullptr;
    return &it.value();
}

} // namespace oasis::control
