#include "Playlist.h"
#include <QDebug>

void Playlist::append(const Track& track)
{
    m_tracks.append(track);
}

void Playlist::append(const QVector<Track>& tracks)
{
    m_tracks.append(tracks);
    qDebug() << "[Playlist] Added" << tracks.size() << "tracks"
             << "(" << m_tracks.size() << "total)";
}

bool Playlist::move(int fromIndex, int toIndex)
{
    if (!isValidIndex(fromIndex) || !isValidIndex(toIndex)) return false;
    if (fromIndex == toIndex) return false;

    Track track = m_tracks.takeAt(fromIndex);
    m_tracks.insert(toIndex, track);
    return true;
}

int Playlist::findOrInsert(const Track& track, int afterIndex)
{
    int idx = indexOfPath(track.path);
    if (idx >= 0)
        return idx;

    int insertPos = (afterIndex >= 0) ? afterIndex + 1 : 0;
    if (insertPos > m_tracks.size()) insertPos = m_tracks.size();
    m_tracks.insert(insertPos, track);
    return insertPos;
}

int Playlist::indexOfPath(const QString& path) const
{
    for (int i = 0; i < m_tracks.size(); ++i) {
        if (m_tracks.at(i).path == path)
            return i;
    }
    return -1;
}

int Playlist::remapIndex(int index, int fromIndex, int toIndex)
{
    if (index < 0) return index;
    if (index == fromIndex) return toIndex;
    if (fromIndex < index && toIndex >= index)
        return index - 1;
    if (fromIndex > index && toIndex <= index)
        return index + 1;
    return index;
}
