#pragma once
#include <QObject>
#include <QVector>
#include <optional>
#include "HistoryRecorder.h"
#include "MusicData.h"
#include "PlaybackModeStateMachine.h"
#include "Playlist.h"
#include "ShuffleSequencer.h"
#include "audio/IAudioEngine.h"

class IPlaybackStore;
class Settings;
class TransportController;

// Composition root of the playback core.  Owns the playlist, history,
// shuffle bag and mode, wires them to the transport, and writes every
// user-visible mutation through to the store.
//
// Manual next/previous/play always win over an automatic advance that
// is still in flight: each one supersedes the transport generation, so
// the pending auto-advance reply is discarded.
class PlaybackSession : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool playing READ isPlaying NOTIFY playStateChanged)
    Q_PROPERTY(double position READ position NOTIFY positionChanged)
    Q_PROPERTY(int volume READ volume WRITE setVolume NOTIFY volumeChanged)

public:
    // engine must outlive the session; store and settings are optional.
    explicit PlaybackSession(IAudioEngine* engine, IPlaybackStore* store = nullptr,
                             Settings* settings = nullptr, QObject* parent = nullptr);
    ~PlaybackSession() override;

    // ── Observable state ─────────────────────────────────────────────
    TransportState transportState() const;
    bool isPlaying() const;
    double position() const;
    int volume() const;
    Track currentTrack() const;
    AlbumArtwork artwork() const;
    QVector<Track> playlist() const { return m_playlist.tracks(); }
    QVector<HistoryEntry> history() const { return m_history.entries(); }
    PlaybackMode playbackMode() const { return m_mode->mode(); }
    std::optional<int> peekNextIndex() const;

    int skipSeconds() const { return m_skipSeconds; }
    void setSkipSeconds(int seconds);

    TransportController* transport() const { return m_transport; }

public slots:
    void restoreFromStore();

    void play(const Track& track);
    void playAt(int index);
    void togglePlay();
    void next();
    void previous();
    void seek(double seconds);
    void skipForward(double seconds);
    void skipBackward(double seconds);
    void skipForward() { skipForward(m_skipSeconds); }
    void skipBackward() { skipBackward(m_skipSeconds); }
    void setVolume(int percent);
    void cyclePlaybackMode();
    void setPlaybackMode(PlaybackMode mode);

    void loadPlaylist(const QVector<Track>& tracks);
    void addTracks(const QVector<Track>& tracks);
    void reorder(int fromIndex, int toIndex);
    void clearPlaylist();
    void clearHistory();

signals:
    void stateChanged();
    void playStateChanged(bool playing);
    void positionChanged(double seconds);
    void volumeChanged(int percent);
    void trackChanged(const Track& track);
    void playlistChanged();
    void historyChanged();
    void playbackModeChanged(PlaybackMode mode);
    void artworkChanged(const AlbumArtwork& artwork);
    void errorOccurred(EngineError error, const QString& message);
    void playlistFinished();  // Linear mode ran off the end

private:
    void connectTransport();
    void startTrack(int index);
    int effectiveIndex() const;
    void advanceAfterTrackEnd();
    void persistPlaylist();
    void persistHistory();

    ShuffleSequencer m_shuffle;
    HistoryRecorder m_history;
    Playlist m_playlist;
    PlaybackModeStateMachine* m_mode = nullptr;
    TransportController* m_transport = nullptr;
    IPlaybackStore* m_store;
    int m_skipSeconds = 10;
    bool m_restoring = false;
};
