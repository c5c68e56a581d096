#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QVector>
#include <optional>

// ── Track metadata (as read by the engine's tag reader) ─────────────
struct TrackMetadata {
    QString title;
    QString artist;
    QString album;
    QString genre;
    QString codec;
    int     year = 0;
    int     trackNumber = 0;
    double  durationSeconds = 0.0;
    int     sampleRate = 0;     // Hz
    int     channels = 0;
    int     bitsPerSample = 0;
    bool    hasArtwork = false;
};

// ── Data Structs ────────────────────────────────────────────────────
struct Track {
    QString path;           // identity
    QString displayName;    // usually the file name
    std::optional<TrackMetadata> metadata;
    int     rating = 0;     // 0-5 stars
    bool    isFavorite = false;

    bool isValid() const { return !path.isEmpty(); }
    double declaredDuration() const;
    QString displayTitle() const;
    bool hasArtwork() const { return metadata && metadata->hasArtwork; }
};

struct HistoryEntry {
    Track     track;
    QDateTime lastPlayedAt;  // UTC
    int       playCount = 1;
};

struct TransportState {
    int    currentTrackIndex = -1;  // -1 = nothing loaded
    bool   isPlaying = false;
    double positionSeconds = 0.0;   // always within [0, durationSeconds]
    double durationSeconds = 0.0;
    int    volumePercent = 50;

    bool hasTrack() const { return currentTrackIndex >= 0; }
};

Q_DECLARE_METATYPE(Track)

// ── Utility Functions ───────────────────────────────────────────────
QString formatDuration(int seconds);
int     clampRating(int rating);

#endif // MUSICDATA_H
