#include "HistoryRecorder.h"

void HistoryRecorder::record(const Track& track, const QDateTime& playedAt)
{
    if (!track.isValid()) return;

    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries.at(i).track.path != track.path)
            continue;
        HistoryEntry entry = m_entries.takeAt(i);
        entry.track = track;
        entry.playCount++;
        entry.lastPlayedAt = playedAt;
        m_entries.prepend(entry);
        return;
    }

    HistoryEntry entry;
    entry.track = track;
    entry.lastPlayedAt = playedAt;
    entry.playCount = 1;
    m_entries.prepend(entry);

    if (m_entries.size() > kMaxEntries)
        m_entries.resize(kMaxEntries);
}

void HistoryRecorder::restore(const QVector<HistoryEntry>& entries)
{
    m_entries = entries;
    if (m_entries.size() > kMaxEntries)
        m_entries.resize(kMaxEntries);
}
