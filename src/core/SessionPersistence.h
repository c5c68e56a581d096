#pragma once
#include <QFuture>
#include <QObject>
#include <QString>
#include "IPlaybackStore.h"

class QTimer;

// IPlaybackStore on an INI QSettings file.  Every write is performed on
// a worker thread from a snapshot; playlist, history and volume writes
// are debounced.  Only load() and flush() touch the file synchronously.
class SessionPersistence : public QObject, public IPlaybackStore {
    Q_OBJECT
public:
    explicit SessionPersistence(const QString& iniPath, QObject* parent = nullptr);
    ~SessionPersistence() override;

    PersistedSession load() override;
    void savePlaylist(const QVector<Track>& tracks) override;
    void saveHistory(const QVector<HistoryEntry>& entries) override;
    void saveVolume(int percent) override;
    void savePlaybackMode(PlaybackMode mode) override;
    void flush() override;

    QString path() const { return m_path; }
    bool hasPendingWrites() const;

private:
    struct Snapshot {
        QVector<Track> playlist;
        QVector<HistoryEntry> history;
        int volume = 50;
        PlaybackMode mode = PlaybackMode::Linear;
        bool playlistDirty = false;
        bool historyDirty = false;
        bool volumeDirty = false;
        bool modeDirty = false;
    };

    void doSave();
    Snapshot takeSnapshot();
    bool hasDirtyData() const;
    static void writeSnapshot(const QString& path, const Snapshot& snap);

    QString m_path;
    QTimer* m_saveTimer;
    QTimer* m_volumeSaveTimer;

    QVector<Track> m_pendingPlaylist;
    QVector<HistoryEntry> m_pendingHistory;
    bool m_playlistDirty = false;
    bool m_historyDirty = false;
    int m_pendingVolume = 50;
    PlaybackMode m_pendingMode = PlaybackMode::Linear;
    bool m_volumeDirty = false;
    bool m_modeDirty = false;
    QFuture<void> m_lastWrite;
};
