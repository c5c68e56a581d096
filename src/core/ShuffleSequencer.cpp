#include "ShuffleSequencer.h"
#include "Playlist.h"
#include <QDebug>
#include <QRandomGenerator>
#include <utility>

ShuffleSequencer::ShuffleSequencer(QRandomGenerator* rng)
    : m_rng(rng ? rng : QRandomGenerator::global())
{
}

int ShuffleSequencer::next(int playlistSize, int justPlayed)
{
    if (playlistSize <= 0) return -1;
    if (playlistSize == 1) return 0;

    bool haveCurrent = justPlayed >= 0 && justPlayed < playlistSize;
    if (haveCurrent)
        m_consumed.insert(justPlayed);

    if (m_consumed.size() >= playlistSize) {
        // Cycle complete; the new one still excludes the current track
        m_consumed.clear();
        if (haveCurrent)
            m_consumed.insert(justPlayed);
        qDebug() << "[Shuffle] New cycle —" << playlistSize << "tracks";
    }

    int picked = pickExcluding(playlistSize, m_consumed);
    if (haveCurrent)
        m_backStack.append(justPlayed);
    return picked;
}

int ShuffleSequencer::previous(int playlistSize, int current)
{
    if (playlistSize <= 0) return -1;
    if (playlistSize == 1) return 0;

    while (!m_backStack.isEmpty()) {
        int idx = m_backStack.takeLast();
        if (idx < 0 || idx >= playlistSize || idx == current)
            continue;  // stale after the playlist shrank
        m_consumed.remove(idx);
        return idx;
    }

    QSet<int> excluded;
    if (current >= 0) excluded.insert(current);
    return pickExcluding(playlistSize, excluded);
}

void ShuffleSequencer::reset()
{
    m_consumed.clear();
    m_backStack.clear();
}

void ShuffleSequencer::remapAfterMove(int fromIndex, int toIndex)
{
    QSet<int> remapped;
    for (int idx : std::as_const(m_consumed))
        remapped.insert(Playlist::remapIndex(idx, fromIndex, toIndex));
    m_consumed = remapped;

    for (int& idx : m_backStack)
        idx = Playlist::remapIndex(idx, fromIndex, toIndex);
}

int ShuffleSequencer::pickExcluding(int playlistSize, const QSet<int>& excluded) const
{
    QVector<int> candidates;
    candidates.reserve(playlistSize);
    for (int i = 0; i < playlistSize; ++i) {
        if (!excluded.contains(i))
            candidates.append(i);
    }
    if (candidates.isEmpty())
        return 0;
    return candidates.at(m_rng->bounded(static_cast<int>(candidates.size())));
}
