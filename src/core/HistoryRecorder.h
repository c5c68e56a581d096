#pragma once
#include <QDateTime>
#include <QVector>
#include "MusicData.h"

// Most-recent-first play log, deduplicated by track path.
class HistoryRecorder {
public:
    static constexpr int kMaxEntries = 100;

    HistoryRecorder() = default;

    void record(const Track& track,
                const QDateTime& playedAt = QDateTime::currentDateTimeUtc());
    void clear() { m_entries.clear(); }
    void restore(const QVector<HistoryEntry>& entries);

    QVector<HistoryEntry> entries() const { return m_entries; }
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

private:
    QVector<HistoryEntry> m_entries;
};
