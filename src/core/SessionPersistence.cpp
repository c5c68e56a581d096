#include "SessionPersistence.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QMutex>
#include <QSettings>
#include <QTimer>
#include <QtConcurrent>

namespace {

QMutex& writeMutex()
{
    static QMutex mutex;
    return mutex;
}

void writeTrack(QSettings& settings, const Track& t)
{
    settings.setValue(QStringLiteral("path"), t.path);
    settings.setValue(QStringLiteral("displayName"), t.displayName);
    settings.setValue(QStringLiteral("rating"), t.rating);
    settings.setValue(QStringLiteral("favorite"), t.isFavorite);
    settings.setValue(QStringLiteral("hasMetadata"), t.metadata.has_value());
    if (!t.metadata) return;

    const TrackMetadata& m = *t.metadata;
    settings.setValue(QStringLiteral("title"), m.title);
    settings.setValue(QStringLiteral("artist"), m.artist);
    settings.setValue(QStringLiteral("album"), m.album);
    settings.setValue(QStringLiteral("genre"), m.genre);
    settings.setValue(QStringLiteral("codec"), m.codec);
    settings.setValue(QStringLiteral("year"), m.year);
    settings.setValue(QStringLiteral("trackNumber"), m.trackNumber);
    settings.setValue(QStringLiteral("duration"), m.durationSeconds);
    settings.setValue(QStringLiteral("sampleRate"), m.sampleRate);
    settings.setValue(QStringLiteral("channels"), m.channels);
    settings.setValue(QStringLiteral("bitsPerSample"), m.bitsPerSample);
    settings.setValue(QStringLiteral("hasArtwork"), m.hasArtwork);
}

Track readTrack(const QSettings& settings)
{
    Track t;
    t.path = settings.value(QStringLiteral("path")).toString();
    t.displayName = settings.value(QStringLiteral("displayName")).toString();
    t.rating = clampRating(settings.value(QStringLiteral("rating"), 0).toInt());
    t.isFavorite = settings.value(QStringLiteral("favorite"), false).toBool();
    if (!settings.value(QStringLiteral("hasMetadata"), false).toBool())
        return t;

    TrackMetadata m;
    m.title = settings.value(QStringLiteral("title")).toString();
    m.artist = settings.value(QStringLiteral("artist")).toString();
    m.album = settings.value(QStringLiteral("album")).toString();
    m.genre = settings.value(QStringLiteral("genre")).toString();
    m.codec = settings.value(QStringLiteral("codec")).toString();
    m.year = settings.value(QStringLiteral("year")).toInt();
    m.trackNumber = settings.value(QStringLiteral("trackNumber")).toInt();
    m.durationSeconds = settings.value(QStringLiteral("duration")).toDouble();
    m.sampleRate = settings.value(QStringLiteral("sampleRate")).toInt();
    m.channels = settings.value(QStringLiteral("channels")).toInt();
    m.bitsPerSample = settings.value(QStringLiteral("bitsPerSample")).toInt();
    m.hasArtwork = settings.value(QStringLiteral("hasArtwork"), false).toBool();
    t.metadata = m;
    return t;
}

void writePlaylist(QSettings& settings, const QVector<Track>& tracks)
{
    settings.remove(QStringLiteral("playlist/tracks"));
    settings.beginWriteArray(QStringLiteral("playlist/tracks"), tracks.size());
    for (int i = 0; i < tracks.size(); ++i) {
        settings.setArrayIndex(i);
        writeTrack(settings, tracks[i]);
    }
    settings.endArray();
}

void writeHistory(QSettings& settings, const QVector<HistoryEntry>& entries)
{
    settings.remove(QStringLiteral("history/entries"));
    settings.beginWriteArray(QStringLiteral("history/entries"), entries.size());
    for (int i = 0; i < entries.size(); ++i) {
        settings.setArrayIndex(i);
        const HistoryEntry& e = entries[i];
        writeTrack(settings, e.track);
        settings.setValue(QStringLiteral("playedAt"), e.lastPlayedAt.toString(Qt::ISODateWithMs));
        settings.setValue(QStringLiteral("playCount"), e.playCount);
    }
    settings.endArray();
}

} // namespace

void SessionPersistence::writeSnapshot(const QString& path, const Snapshot& snap)
{
    QMutexLocker lock(&writeMutex());

    QSettings settings(path, QSettings::IniFormat);
    if (snap.playlistDirty)
        writePlaylist(settings, snap.playlist);
    if (snap.historyDirty)
        writeHistory(settings, snap.history);
    if (snap.volumeDirty)
        settings.setValue(QStringLiteral("playback/volume"), snap.volume);
    if (snap.modeDirty)
        settings.setValue(QStringLiteral("playback/mode"), PlaybackModeStateMachine::modeName(snap.mode));
    settings.sync();
    if (settings.status() != QSettings::NoError)
        qWarning() << "[Persist] Write failed for" << path << "status" << settings.status();
}

SessionPersistence::SessionPersistence(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_path(iniPath)
{
    m_saveTimer = new QTimer(this);
    m_saveTimer->setSingleShot(true);
    m_saveTimer->setInterval(500);
    connect(m_saveTimer, &QTimer::timeout, this, &SessionPersistence::doSave);

    // Volume is saved at most once per slider drag
    m_volumeSaveTimer = new QTimer(this);
    m_volumeSaveTimer->setSingleShot(true);
    m_volumeSaveTimer->setInterval(300);
    connect(m_volumeSaveTimer, &QTimer::timeout, this, &SessionPersistence::doSave);
}

SessionPersistence::~SessionPersistence()
{
    flush();
}

bool SessionPersistence::hasPendingWrites() const
{
    return m_saveTimer->isActive() || m_volumeSaveTimer->isActive()
        || m_lastWrite.isRunning() || hasDirtyData();
}

// ── load ────────────────────────────────────────────────────────────
PersistedSession SessionPersistence::load()
{
    m_lastWrite.waitForFinished();
    QMutexLocker lock(&writeMutex());
    QSettings settings(m_path, QSettings::IniFormat);
    PersistedSession session;

    int count = settings.beginReadArray(QStringLiteral("playlist/tracks"));
    session.playlist.reserve(count);
    for (int i = 0; i < count; ++i) {
        settings.setArrayIndex(i);
        Track t = readTrack(settings);
        if (t.isValid())
            session.playlist.append(t);
    }
    settings.endArray();

    count = settings.beginReadArray(QStringLiteral("history/entries"));
    for (int i = 0; i < count; ++i) {
        settings.setArrayIndex(i);
        HistoryEntry e;
        e.track = readTrack(settings);
        e.lastPlayedAt = QDateTime::fromString(
            settings.value(QStringLiteral("playedAt")).toString(), Qt::ISODateWithMs);
        e.playCount = qMax(1, settings.value(QStringLiteral("playCount"), 1).toInt());
        if (e.track.isValid())
            session.history.append(e);
    }
    settings.endArray();

    session.volume = qBound(0, settings.value(QStringLiteral("playback/volume"), 50).toInt(), 100);

    const QString modeName = settings.value(QStringLiteral("playback/mode"),
                                            QStringLiteral("linear")).toString();
    if (auto mode = PlaybackModeStateMachine::modeFromName(modeName))
        session.mode = *mode;
    else
        qWarning() << "[Persist] Unknown playback mode" << modeName << "— using linear";

    qDebug() << "[Persist] Loaded" << session.playlist.size() << "tracks,"
             << session.history.size() << "history entries";
    return session;
}

// ── Write-through entry points ──────────────────────────────────────
void SessionPersistence::savePlaylist(const QVector<Track>& tracks)
{
    m_pendingPlaylist = tracks;
    m_playlistDirty = true;
    m_saveTimer->start();  // restarts the 500ms timer
}

void SessionPersistence::saveHistory(const QVector<HistoryEntry>& entries)
{
    m_pendingHistory = entries;
    m_historyDirty = true;
    m_saveTimer->start();
}

void SessionPersistence::saveVolume(int percent)
{
    m_pendingVolume = percent;
    m_volumeDirty = true;
    m_volumeSaveTimer->start();
}

void SessionPersistence::savePlaybackMode(PlaybackMode mode)
{
    m_pendingMode = mode;
    m_modeDirty = true;
    doSave();  // no debounce, but still off the owner thread
}

// ── doSave (snapshot on owner thread, write on worker) ──────────────
void SessionPersistence::doSave()
{
    // One writer at a time keeps snapshots landing in order
    if (m_lastWrite.isRunning()) {
        m_saveTimer->start();
        return;
    }
    if (!hasDirtyData())
        return;

    m_volumeSaveTimer->stop();
    const Snapshot snap = takeSnapshot();
    const QString path = m_path;
    m_lastWrite = QtConcurrent::run([path, snap]() {
        QElapsedTimer timer;
        timer.start();
        writeSnapshot(path, snap);
        qDebug() << "[Persist] Saved" << snap.playlist.size() << "tracks /"
                 << snap.history.size() << "history entries in"
                 << timer.elapsed() << "ms (async)";
    });
}

// ── flush (synchronous) ─────────────────────────────────────────────
void SessionPersistence::flush()
{
    // An older async write must not land after this one
    m_lastWrite.waitForFinished();

    m_volumeSaveTimer->stop();
    m_saveTimer->stop();
    if (hasDirtyData()) {
        writeSnapshot(m_path, takeSnapshot());
        qDebug() << "[Shutdown] Flushed pending session save";
    }
}

SessionPersistence::Snapshot SessionPersistence::takeSnapshot()
{
    Snapshot snap;
    snap.playlist = m_pendingPlaylist;
    snap.history = m_pendingHistory;
    snap.playlistDirty = m_playlistDirty;
    snap.historyDirty = m_historyDirty;
    snap.volume = m_pendingVolume;
    snap.volumeDirty = m_volumeDirty;
    snap.mode = m_pendingMode;
    snap.modeDirty = m_modeDirty;
    m_playlistDirty = false;
    m_historyDirty = false;
    m_volumeDirty = false;
    m_modeDirty = false;
    return snap;
}

bool SessionPersistence::hasDirtyData() const
{
    return m_playlistDirty || m_historyDirty || m_volumeDirty || m_modeDirty;
}
