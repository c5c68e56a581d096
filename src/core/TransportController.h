#pragma once
#include <QObject>
#include "MusicData.h"
#include "Settings.h"
#include "audio/IAudioEngine.h"

class QTimer;
class HistoryRecorder;

// Owns the transport state (current track, play/pause, position,
// duration, volume) and is the only component that talks to the
// audio engine.
//
// Every play/stop/reset bumps a generation counter; engine replies
// issued under an older generation are dropped, so a slow reply can
// never overwrite newer state.  Seeks bump a separate epoch so a poll
// issued before the seek cannot clobber the optimistic position.
//
// The engine must outlive the controller.
class TransportController : public QObject {
    Q_OBJECT

public:
    TransportController(IAudioEngine* engine, HistoryRecorder* history,
                        const TransportConfig& config = TransportConfig(),
                        QObject* parent = nullptr);
    ~TransportController() override;

    TransportState state() const { return m_state; }
    Track currentTrack() const { return m_currentTrack; }
    AlbumArtwork artwork() const { return m_artwork; }
    bool isLoading() const { return m_loadInFlight; }

    // The load in flight.  A playlist edit while loading moves the index
    // with setPendingIndex(); the reply commits whatever it holds then.
    int pendingIndex() const { return m_pendingIndex; }
    Track pendingTrack() const { return m_pendingTrack; }
    void setPendingIndex(int index);
    bool isPolling() const;
    quint64 generation() const { return m_generation; }

    TransportConfig config() const { return m_config; }
    void setConfig(const TransportConfig& config);

public slots:
    void play(const Track& track, int index);
    void togglePlay();
    void seek(double targetSeconds);
    void skipBy(double deltaSeconds);
    void setVolume(int percent);

    void stop();         // engine stop, index and position kept
    void finishAtEnd();  // natural end with nothing to advance to
    void reset();        // back to empty: no track, position 0
    void setCurrentIndex(int index);

    // One authoritative-position poll; driven by the poll timer.
    void pollPosition();

signals:
    void stateChanged();
    void playStateChanged(bool playing);
    void positionChanged(double seconds);
    void volumeChanged(int percent);
    void trackStarted(int index, const Track& track);
    void trackEnded();
    void commandFailed(EngineError error, const QString& message);
    void artworkChanged(const AlbumArtwork& artwork);

private:
    bool isCurrent(quint64 generation) const { return generation == m_generation; }
    bool reachedEnd(double position) const;
    void setPlaying(bool playing);
    void setPosition(double seconds);
    void startPolling();
    void stopPolling();
    void syncPositionFromEngine(quint64 generation, quint64 seekEpoch);
    void handleEndOfTrack();
    void applyVolume();
    void refreshArtwork(const Track& track, quint64 generation);
    void reportFailure(const char* command, const EngineReply& reply);
    void clearPending();

    IAudioEngine* m_engine;
    HistoryRecorder* m_history;
    TransportConfig m_config;
    QTimer* m_pollTimer = nullptr;

    TransportState m_state;
    Track m_currentTrack;
    Track m_pendingTrack;
    int m_pendingIndex = -1;
    AlbumArtwork m_artwork;

    quint64 m_generation = 0;
    quint64 m_seekEpoch = 0;
    quint64 m_pollSerial = 0;
    bool m_pollInFlight = false;
    bool m_loadInFlight = false;
    bool m_toggleInFlight = false;
    bool m_endHandled = false;  // guards against double auto-advance
};
