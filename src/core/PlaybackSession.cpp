#include "PlaybackSession.h"
#include "IPlaybackStore.h"
#include "Settings.h"
#include "TransportController.h"

#include <QDebug>

// ── Constructor ─────────────────────────────────────────────────────
PlaybackSession::PlaybackSession(IAudioEngine* engine, IPlaybackStore* store,
                                 Settings* settings, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
    TransportConfig config;
    if (settings) {
        config = settings->transportConfig();
        m_skipSeconds = settings->skipSeconds();
    }

    m_mode = new PlaybackModeStateMachine(&m_shuffle, this);
    m_transport = new TransportController(engine, &m_history, config, this);

    if (settings) {
        connect(settings, &Settings::transportConfigChanged, this, [this, settings]() {
            m_transport->setConfig(settings->transportConfig());
        });
        connect(settings, &Settings::skipSecondsChanged,
                this, &PlaybackSession::setSkipSeconds);
    }

    connect(m_mode, &PlaybackModeStateMachine::modeChanged, this, [this](PlaybackMode mode) {
        if (m_store && !m_restoring)
            m_store->savePlaybackMode(mode);
        emit playbackModeChanged(mode);
    });

    connectTransport();
}

PlaybackSession::~PlaybackSession()
{
    if (m_store)
        m_store->flush();
}

// ── connectTransport ────────────────────────────────────────────────
void PlaybackSession::connectTransport()
{
    connect(m_transport, &TransportController::stateChanged,
            this, &PlaybackSession::stateChanged);
    connect(m_transport, &TransportController::playStateChanged,
            this, &PlaybackSession::playStateChanged);
    connect(m_transport, &TransportController::positionChanged,
            this, &PlaybackSession::positionChanged);
    connect(m_transport, &TransportController::artworkChanged,
            this, &PlaybackSession::artworkChanged);
    connect(m_transport, &TransportController::commandFailed,
            this, &PlaybackSession::errorOccurred);

    connect(m_transport, &TransportController::volumeChanged, this, [this](int percent) {
        if (m_store && !m_restoring)
            m_store->saveVolume(percent);
        emit volumeChanged(percent);
    });

    connect(m_transport, &TransportController::trackStarted,
            this, [this](int, const Track& track) {
        persistHistory();
        emit historyChanged();
        emit trackChanged(track);
    });

    connect(m_transport, &TransportController::trackEnded,
            this, &PlaybackSession::advanceAfterTrackEnd);
}

// ── Observable state ────────────────────────────────────────────────
TransportState PlaybackSession::transportState() const
{
    return m_transport->state();
}

bool PlaybackSession::isPlaying() const
{
    return m_transport->state().isPlaying;
}

double PlaybackSession::position() const
{
    return m_transport->state().positionSeconds;
}

int PlaybackSession::volume() const
{
    return m_transport->state().volumePercent;
}

Track PlaybackSession::currentTrack() const
{
    return m_transport->currentTrack();
}

AlbumArtwork PlaybackSession::artwork() const
{
    return m_transport->artwork();
}

std::optional<int> PlaybackSession::peekNextIndex() const
{
    return m_mode->peekNext(m_playlist.size(), effectiveIndex());
}

void PlaybackSession::setSkipSeconds(int seconds)
{
    if (seconds > 0)
        m_skipSeconds = seconds;
}

// ── restoreFromStore ────────────────────────────────────────────────
void PlaybackSession::restoreFromStore()
{
    if (!m_store) return;

    PersistedSession saved = m_store->load();

    m_restoring = true;
    m_playlist.setTracks(saved.playlist);
    m_history.restore(saved.history);
    m_shuffle.reset();
    m_mode->setMode(saved.mode);
    m_transport->setVolume(saved.volume);
    m_restoring = false;

    qDebug() << "[Session] Restored" << m_playlist.size() << "tracks, mode:"
             << PlaybackModeStateMachine::modeName(saved.mode)
             << "volume:" << saved.volume;

    emit playlistChanged();
    emit historyChanged();
}

// ── play / playAt ───────────────────────────────────────────────────
void PlaybackSession::play(const Track& track)
{
    if (!track.isValid()) return;

    const int before = m_playlist.size();
    const int idx = m_playlist.findOrInsert(track, effectiveIndex());

    if (m_playlist.size() != before) {
        // Insertion shifted indices after idx
        m_shuffle.reset();
        int current = m_transport->state().currentTrackIndex;
        if (current >= idx)
            m_transport->setCurrentIndex(current + 1);
        persistPlaylist();
        emit playlistChanged();
    }

    startTrack(idx);
}

void PlaybackSession::playAt(int index)
{
    if (!m_playlist.isValidIndex(index)) return;
    startTrack(index);
}

void PlaybackSession::startTrack(int index)
{
    m_transport->play(m_playlist.at(index), index);
}

int PlaybackSession::effectiveIndex() const
{
    if (m_transport->isLoading() && m_transport->pendingIndex() >= 0)
        return m_transport->pendingIndex();
    return m_transport->state().currentTrackIndex;
}

// ── togglePlay ──────────────────────────────────────────────────────
void PlaybackSession::togglePlay()
{
    m_transport->togglePlay();
}

// ── next ────────────────────────────────────────────────────────────
void PlaybackSession::next()
{
    const int current = effectiveIndex();
    if (m_playlist.isEmpty() || current < 0)
        return;

    std::optional<int> target = m_mode->resolveNext(m_playlist.size(), current);
    if (!target) {
        qDebug() << "[Session] Next at end of playlist — stopping";
        m_transport->stop();
        return;
    }
    startTrack(*target);
}

// ── previous ────────────────────────────────────────────────────────
void PlaybackSession::previous()
{
    const int current = effectiveIndex();
    if (m_playlist.isEmpty() || current < 0)
        return;

    std::optional<int> target = m_mode->resolvePrevious(m_playlist.size(), current);
    if (!target)
        return;  // Linear at the first track
    startTrack(*target);
}

// ── advanceAfterTrackEnd (auto-advance, same table as next()) ───────
void PlaybackSession::advanceAfterTrackEnd()
{
    const int current = m_transport->state().currentTrackIndex;
    std::optional<int> target = m_mode->resolveNext(m_playlist.size(), current);

    if (!target) {
        m_transport->finishAtEnd();
        emit playlistFinished();
        return;
    }

    qDebug() << "[Session] Auto-advance" << current << "→" << *target
             << "(" << PlaybackModeStateMachine::modeName(m_mode->mode()) << ")";
    startTrack(*target);
}

// ── seek / skip ─────────────────────────────────────────────────────
void PlaybackSession::seek(double seconds)
{
    m_transport->seek(seconds);
}

void PlaybackSession::skipForward(double seconds)
{
    m_transport->skipBy(seconds);
}

void PlaybackSession::skipBackward(double seconds)
{
    m_transport->skipBy(-seconds);
}

// ── setVolume ───────────────────────────────────────────────────────
void PlaybackSession::setVolume(int percent)
{
    m_transport->setVolume(percent);
}

// ── Playback mode ───────────────────────────────────────────────────
void PlaybackSession::cyclePlaybackMode()
{
    m_mode->cycle();
}

void PlaybackSession::setPlaybackMode(PlaybackMode mode)
{
    m_mode->setMode(mode);
}

// ── Playlist mutations ──────────────────────────────────────────────
void PlaybackSession::loadPlaylist(const QVector<Track>& tracks)
{
    const Track playing = m_transport->currentTrack();
    const Track loading = m_transport->isLoading() ? m_transport->pendingTrack() : Track();
    m_playlist.setTracks(tracks);
    m_shuffle.reset();

    if (loading.isValid()) {
        // The load in flight decides what ends up current
        const int idx = m_playlist.indexOfPath(loading.path);
        if (idx >= 0) {
            m_transport->setPendingIndex(idx);
            m_transport->setCurrentIndex(m_playlist.indexOfPath(playing.path));
        } else {
            qDebug() << "[Session] Loading track not in new playlist — cancelling";
            m_transport->reset();
        }
    } else if (playing.isValid()) {
        const int idx = m_playlist.indexOfPath(playing.path);
        if (idx >= 0) {
            m_transport->setCurrentIndex(idx);
        } else {
            qDebug() << "[Session] Current track not in new playlist — stopping";
            m_transport->reset();
        }
    }

    persistPlaylist();
    emit playlistChanged();
}

void PlaybackSession::addTracks(const QVector<Track>& tracks)
{
    if (tracks.isEmpty()) return;
    m_playlist.append(tracks);
    persistPlaylist();
    emit playlistChanged();
}

void PlaybackSession::reorder(int fromIndex, int toIndex)
{
    if (!m_playlist.move(fromIndex, toIndex))
        return;

    // Keep pointing at the same tracks
    m_transport->setCurrentIndex(Playlist::remapIndex(
        m_transport->state().currentTrackIndex, fromIndex, toIndex));
    m_transport->setPendingIndex(Playlist::remapIndex(
        m_transport->pendingIndex(), fromIndex, toIndex));
    m_shuffle.remapAfterMove(fromIndex, toIndex);

    persistPlaylist();
    emit playlistChanged();
}

void PlaybackSession::clearPlaylist()
{
    m_transport->reset();
    m_playlist.clear();
    m_shuffle.reset();

    persistPlaylist();
    emit playlistChanged();
}

void PlaybackSession::clearHistory()
{
    m_history.clear();
    persistHistory();
    emit historyChanged();
}

// ── Persistence (write-through) ─────────────────────────────────────
void PlaybackSession::persistPlaylist()
{
    if (m_store && !m_restoring)
        m_store->savePlaylist(m_playlist.tracks());
}

void PlaybackSession::persistHistory()
{
    if (m_store && !m_restoring)
        m_store->saveHistory(m_history.entries());
}
