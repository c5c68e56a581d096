#pragma once

#include <QByteArray>
#include <QMetaType>
#include <QString>
#include <functional>
#include <optional>

// Failure categories an engine command can report.
enum class EngineError {
    None,
    EngineUnavailable,  // command could not be dispatched
    PlaybackRejected,   // unsupported or missing file
    SeekRejected,       // position out of bounds or engine busy
    VolumeRejected
};

QString engineErrorName(EngineError error);

struct EngineReply {
    EngineError error = EngineError::None;
    QString message;
    double value = 0.0;  // seconds for loadAndPlay / currentPosition

    bool ok() const { return error == EngineError::None; }

    static EngineReply success(double value = 0.0);
    static EngineReply failure(EngineError error, const QString& message);
};

struct AlbumArtwork {
    QByteArray data;
    QString mimeType;

    bool isNull() const { return data.isEmpty(); }
};

Q_DECLARE_METATYPE(EngineError)
Q_DECLARE_METATYPE(AlbumArtwork)

// Boundary to the native playback backend.
//
// All commands are asynchronous: the engine invokes the callback once,
// on the thread that owns the caller, when the command completes.
// Replies to overlapping commands may arrive in any order.  Callbacks
// may also run before the issuing call returns.
class IAudioEngine {
public:
    virtual ~IAudioEngine() = default;

    using ReplyCallback = std::function<void(const EngineReply&)>;
    using ArtworkCallback = std::function<void(const std::optional<AlbumArtwork>&)>;

    // Transport.  loadAndPlay replies with the track duration in seconds
    // (0 if the engine could not determine it).
    virtual void loadAndPlay(const QString& path, ReplyCallback done) = 0;
    virtual void pause(ReplyCallback done) = 0;
    virtual void resume(ReplyCallback done) = 0;
    virtual void stop(ReplyCallback done) = 0;
    virtual void seekTo(double seconds, ReplyCallback done) = 0;

    // Authoritative playback position in seconds.
    virtual void currentPosition(ReplyCallback done) = 0;

    // 0.0 - 1.0
    virtual void setVolume(double fraction, ReplyCallback done) = 0;

    // Embedded cover art; nullopt when the file has none.
    virtual void albumArtwork(const QString& path, ArtworkCallback done) = 0;

    // Push notification for natural end of track.  Engines without one
    // keep the default; position polling covers them.
    virtual void setTrackFinishedHandler(std::function<void()>) {}
};
