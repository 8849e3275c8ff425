#pragma once

#include <functional>
#include <optional>

#include <QHash>
#include <QJsonObject>
#include <QString>

namespace oasis::control {

struct TrackInfo {
    int id = 0;
    QString name;
    QString image;
    QJsonObject raw;

    bool isValid() const noexcept { return id > 0; }

    // Number of path points the drawing progress is measured against, when
    // the record carries the drawing.
    std::optional<int> pathPointCount() const;

    static TrackInfo fromJson(const QJsonObject &obj);
    static TrackInfo placeholder(int trackId);
};

QString unknownTrackName(int trackId);
QString trackImageUrl(const TrackInfo &track);

// Receives the track, or std::nullopt and a reason.
using TrackInfoCallback = std::function<void(const std::optional<TrackInfo> &track, const QString &error)>;

// Source of per-track metadata; implemented by the cloud client. done may
// run before fetchTrackInfo() returns.
class TrackInfoSource
{
public:
    virtual ~TrackInfoSource() = default;
    virtual void fetchTrackInfo(int trackId, TrackInfoCallback done) = 0;
};

// Read-only table of known tracks, loaded once at startup and shared by
// pointer with every device.
class TrackCatalog
{
public:
    TrackCatalog() = default;

    static TrackCatalog fromJson(const QJsonObject &obj);
    static bool loadFile(const QString &path, TrackCatalog *out, QString *error = nullptr);

    const TrackInfo *find(int trackId) const;
    int size() const { return static_cast<int>(m_tracks.size()); }
    bool isEmpty() const { return m_tracks.isEmpty(); }

private:
    QHash<int, TrackInfo> m_tracks;
};

} // namespace oasis::control
