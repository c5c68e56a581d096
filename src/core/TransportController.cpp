#include "TransportController.h"
#include "HistoryRecorder.h"

#include <QDebug>
#include <QPointer>
#include <QTimer>
#include <QtGlobal>

// ── Constructor ─────────────────────────────────────────────────────
TransportController::TransportController(IAudioEngine* engine, HistoryRecorder* history,
                                         const TransportConfig& config, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_history(history)
    , m_config(config)
{
    m_pollTimer = new QTimer(this);
    m_pollTimer->setInterval(m_config.pollIntervalMs);
    connect(m_pollTimer, &QTimer::timeout, this, &TransportController::pollPosition);

    QPointer<TransportController> self(this);
    m_engine->setTrackFinishedHandler([self]() {
        if (self && self->m_state.isPlaying && !self->m_loadInFlight)
            self->handleEndOfTrack();
    });
}

TransportController::~TransportController()
{
    m_pollTimer->stop();
    m_engine->setTrackFinishedHandler({});
}

bool TransportController::isPolling() const
{
    return m_pollTimer->isActive();
}

void TransportController::setConfig(const TransportConfig& config)
{
    m_config = config;
    m_pollTimer->setInterval(m_config.pollIntervalMs);
}

// ── play ────────────────────────────────────────────────────────────
void TransportController::play(const Track& track, int index)
{
    if (!track.isValid()) {
        qWarning() << "[Transport] play() called with an empty path";
        return;
    }

    const quint64 gen = ++m_generation;
    m_loadInFlight = true;
    m_toggleInFlight = false;
    m_pendingTrack = track;
    m_pendingIndex = index;

    qDebug() << "[Transport] Loading" << track.displayTitle()
             << "at index" << index << "(gen" << gen << ")";

    QPointer<TransportController> self(this);
    m_engine->loadAndPlay(track.path, [self, gen, track](const EngineReply& reply) {
        if (!self) return;
        if (!self->isCurrent(gen)) {
            qDebug() << "[Transport] Discarding stale play reply for" << track.path;
            return;
        }
        // The playlist may have been edited since the request went out
        const int index = self->m_pendingIndex;
        self->m_loadInFlight = false;
        self->clearPending();

        if (!reply.ok()) {
            self->reportFailure("play", reply);
            self->setPlaying(false);
            emit self->stateChanged();
            return;
        }

        self->m_currentTrack = track;
        self->m_state.currentTrackIndex = index;
        // Engine duration is authoritative; the tag value is only a fallback
        self->m_state.durationSeconds = reply.value > 0.0 ? reply.value
                                                          : track.declaredDuration();
        self->m_endHandled = false;
        self->setPosition(0.0);

        qDebug() << "[Transport] Now playing" << track.displayTitle()
                 << formatDuration(static_cast<int>(self->m_state.durationSeconds));

        self->applyVolume();
        if (self->m_history)
            self->m_history->record(track);
        self->setPlaying(true);
        self->refreshArtwork(track, gen);

        emit self->trackStarted(index, track);
        emit self->stateChanged();
    });
}

// ── togglePlay ──────────────────────────────────────────────────────
void TransportController::togglePlay()
{
    if (!m_state.hasTrack() || m_loadInFlight || m_toggleInFlight)
        return;

    const quint64 gen = m_generation;
    m_toggleInFlight = true;
    QPointer<TransportController> self(this);

    if (m_state.isPlaying) {
        m_engine->pause([self, gen](const EngineReply& reply) {
            if (!self || !self->isCurrent(gen)) return;
            self->m_toggleInFlight = false;
            if (!reply.ok())
                self->reportFailure("pause", reply);
            self->setPlaying(false);
        });
    } else {
        m_engine->resume([self, gen](const EngineReply& reply) {
            if (!self || !self->isCurrent(gen)) return;
            self->m_toggleInFlight = false;
            if (!reply.ok()) {
                self->reportFailure("resume", reply);
                self->setPlaying(false);
                return;
            }
            // Resuming after a handled end makes the next end a new event
            self->m_endHandled = false;
            self->setPlaying(true);
        });
    }
}

// ── seek ────────────────────────────────────────────────────────────
void TransportController::seek(double targetSeconds)
{
    if (!m_state.hasTrack())
        return;

    const double clamped = qBound(0.0, targetSeconds, m_state.durationSeconds);

    // Optimistic: show the target now, correct after the engine settles
    setPosition(clamped);
    if (!reachedEnd(clamped))
        m_endHandled = false;

    const quint64 gen = m_generation;
    const quint64 epoch = ++m_seekEpoch;
    QPointer<TransportController> self(this);

    m_engine->seekTo(clamped, [self, gen, epoch](const EngineReply& reply) {
        if (!self || !self->isCurrent(gen)) return;
        if (!reply.ok()) {
            self->reportFailure("seek", reply);
            // Re-read anyway so the displayed position stays truthful
            self->syncPositionFromEngine(gen, epoch);
            return;
        }
        QTimer::singleShot(self->m_config.seekSettleMs, self.data(), [self, gen, epoch]() {
            if (self)
                self->syncPositionFromEngine(gen, epoch);
        });
    });
}

// ── skipBy ──────────────────────────────────────────────────────────
void TransportController::skipBy(double deltaSeconds)
{
    if (!m_state.hasTrack())
        return;
    seek(m_state.positionSeconds + deltaSeconds);
}

// ── setVolume ───────────────────────────────────────────────────────
void TransportController::setVolume(int percent)
{
    const int clamped = qBound(0, percent, 100);
    if (clamped == m_state.volumePercent)
        return;

    // Volume is a UI preference: a rejected command does not roll it back
    m_state.volumePercent = clamped;
    emit volumeChanged(clamped);
    emit stateChanged();
    applyVolume();
}

void TransportController::applyVolume()
{
    QPointer<TransportController> self(this);
    m_engine->setVolume(m_state.volumePercent / 100.0, [self](const EngineReply& reply) {
        if (self && !reply.ok())
            self->reportFailure("setVolume", reply);
    });
}

void TransportController::setPendingIndex(int index)
{
    if (m_loadInFlight)
        m_pendingIndex = index;
}

void TransportController::clearPending()
{
    m_pendingTrack = Track();
    m_pendingIndex = -1;
}

// ── stop / finishAtEnd / reset ──────────────────────────────────────
void TransportController::stop()
{
    ++m_generation;
    m_loadInFlight = false;
    m_toggleInFlight = false;
    clearPending();

    QPointer<TransportController> self(this);
    m_engine->stop([self](const EngineReply& reply) {
        if (self && !reply.ok())
            self->reportFailure("stop", reply);
    });
    setPlaying(false);
    emit stateChanged();
}

void TransportController::finishAtEnd()
{
    ++m_generation;
    m_toggleInFlight = false;
    m_endHandled = true;
    setPosition(m_state.durationSeconds);
    setPlaying(false);
    qDebug() << "[Transport] End of playlist — stopped";
    emit stateChanged();
}

void TransportController::reset()
{
    ++m_generation;
    m_loadInFlight = false;
    m_toggleInFlight = false;
    m_endHandled = false;
    clearPending();

    QPointer<TransportController> self(this);
    m_engine->stop([self](const EngineReply& reply) {
        if (self && !reply.ok())
            self->reportFailure("stop", reply);
    });

    setPlaying(false);
    m_currentTrack = Track();
    m_state.currentTrackIndex = -1;
    m_state.durationSeconds = 0.0;
    setPosition(0.0);
    if (!m_artwork.isNull()) {
        m_artwork = AlbumArtwork();
        emit artworkChanged(m_artwork);
    }
    emit stateChanged();
}

void TransportController::setCurrentIndex(int index)
{
    if (index == m_state.currentTrackIndex) return;
    m_state.currentTrackIndex = index;
    emit stateChanged();
}

// ── Position polling ────────────────────────────────────────────────
void TransportController::pollPosition()
{
    if (!m_state.isPlaying || m_loadInFlight || m_pollInFlight)
        return;

    m_pollInFlight = true;
    const quint64 gen = m_generation;
    const quint64 epoch = m_seekEpoch;
    const quint64 serial = ++m_pollSerial;
    QPointer<TransportController> self(this);

    m_engine->currentPosition([self, gen, epoch, serial](const EngineReply& reply) {
        if (!self) return;
        if (serial == self->m_pollSerial)
            self->m_pollInFlight = false;
        if (!self->isCurrent(gen) || !self->m_state.isPlaying || self->m_loadInFlight)
            return;
        if (!reply.ok()) {
            qWarning() << "[Transport] Failed to get current time:" << reply.message;
            return;
        }
        // A seek issued after this poll owns the position now
        if (epoch == self->m_seekEpoch)
            self->setPosition(reply.value);
        if (self->reachedEnd(reply.value))
            self->handleEndOfTrack();
    });
}

void TransportController::syncPositionFromEngine(quint64 generation, quint64 seekEpoch)
{
    QPointer<TransportController> self(this);
    m_engine->currentPosition([self, generation, seekEpoch](const EngineReply& reply) {
        if (!self || !self->isCurrent(generation)) return;
        if (seekEpoch != self->m_seekEpoch) return;  // a newer seek will sync itself
        if (!reply.ok()) {
            qWarning() << "[Transport] Failed to sync time with backend:" << reply.message;
            return;
        }
        self->setPosition(reply.value);
    });
}

bool TransportController::reachedEnd(double position) const
{
    return m_state.durationSeconds > 0.0
        && position >= m_state.durationSeconds - m_config.endEpsilon;
}

void TransportController::handleEndOfTrack()
{
    if (m_endHandled) return;
    m_endHandled = true;
    stopPolling();
    qDebug() << "[Transport] Track ended:" << m_currentTrack.displayTitle();
    emit trackEnded();
}

// ── Internal state helpers ──────────────────────────────────────────
void TransportController::setPlaying(bool playing)
{
    if (playing)
        startPolling();
    else
        stopPolling();

    if (playing == m_state.isPlaying) return;
    m_state.isPlaying = playing;
    emit playStateChanged(playing);
}

void TransportController::setPosition(double seconds)
{
    const double clamped = qBound(0.0, seconds, m_state.durationSeconds);
    if (qFuzzyCompare(clamped + 1.0, m_state.positionSeconds + 1.0)) {
        m_state.positionSeconds = clamped;
        return;
    }
    m_state.positionSeconds = clamped;
    emit positionChanged(clamped);
}

void TransportController::startPolling()
{
    if (!m_pollTimer->isActive())
        m_pollTimer->start();
}

void TransportController::stopPolling()
{
    m_pollTimer->stop();
    m_pollInFlight = false;
}

void TransportController::refreshArtwork(const Track& track, quint64 generation)
{
    if (!track.hasArtwork()) {
        if (!m_artwork.isNull()) {
            m_artwork = AlbumArtwork();
            emit artworkChanged(m_artwork);
        }
        return;
    }

    QPointer<TransportController> self(this);
    m_engine->albumArtwork(track.path,
                           [self, generation](const std::optional<AlbumArtwork>& art) {
        if (!self || !self->isCurrent(generation)) return;
        self->m_artwork = art ? *art : AlbumArtwork();
        emit self->artworkChanged(self->m_artwork);
    });
}

void TransportController::reportFailure(const char* command, const EngineReply& reply)
{
    qWarning() << "[Transport]" << command << "failed:"
               << engineErrorName(reply.error) << reply.message;
    emit commandFailed(reply.error, reply.message);
}
