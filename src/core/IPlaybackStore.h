#pragma once

#include <QVector>
#include "MusicData.h"
#include "PlaybackModeStateMachine.h"

struct PersistedSession {
    QVector<Track> playlist;
    QVector<HistoryEntry> history;
    int volume = 50;
    PlaybackMode mode = PlaybackMode::Linear;
};

// Durable storage for the session's user-visible state.  The session
// calls the save methods write-through on every mutation; an
// implementation is free to coalesce them as long as flush() writes
// everything still pending.
class IPlaybackStore {
public:
    virtual ~IPlaybackStore() = default;

    virtual PersistedSession load() = 0;
    virtual void savePlaylist(const QVector<Track>& tracks) = 0;
    virtual void saveHistory(const QVector<HistoryEntry>& entries) = 0;
    virtual void saveVolume(int percent) = 0;
    virtual void savePlaybackMode(PlaybackMode mode) = 0;
    virtual void flush() = 0;
};
