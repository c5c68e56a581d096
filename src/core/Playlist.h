#pragma once
#include <QVector>
#include "MusicData.h"

class Playlist {
public:
    Playlist() = default;

    // CRUD
    void setTracks(const QVector<Track>& tracks) { m_tracks = tracks; }
    void append(const Track& track);
    void append(const QVector<Track>& tracks);
    bool move(int fromIndex, int toIndex);
    void clear() { m_tracks.clear(); }

    // Returns the index of track (by path), inserting it after
    // afterIndex when the playlist does not contain it yet.
    int findOrInsert(const Track& track, int afterIndex);

    // Access
    QVector<Track> tracks() const { return m_tracks; }
    const Track& at(int index) const { return m_tracks.at(index); }
    int size() const { return m_tracks.size(); }
    bool isEmpty() const { return m_tracks.isEmpty(); }
    bool isValidIndex(int index) const { return index >= 0 && index < m_tracks.size(); }
    int indexOfPath(const QString& path) const;

    // Where an index that referred to some element points after
    // move(fromIndex, toIndex).  -1 stays -1.
    static int remapIndex(int index, int fromIndex, int toIndex);

private:
    QVector<Track> m_tracks;
};
