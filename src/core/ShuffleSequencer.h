#pragma once
#include <QSet>
#include <QVector>

class QRandomGenerator;

// Non-repeating random traversal over playlist indices.
//
// The bag holds the indices played since the last reshuffle.  next()
// never returns an index in the bag, and resets the bag to just the
// current index once every other index has been consumed.  previous()
// walks an explicit back stack so it undoes next() exactly.
class ShuffleSequencer {
public:
    explicit ShuffleSequencer(QRandomGenerator* rng = nullptr);

    int next(int playlistSize, int justPlayed);
    int previous(int playlistSize, int current);

    void reset();
    void remapAfterMove(int fromIndex, int toIndex);

    QSet<int> consumed() const { return m_consumed; }
    QVector<int> backStack() const { return m_backStack; }

private:
    int pickExcluding(int playlistSize, const QSet<int>& excluded) const;

    QRandomGenerator* m_rng;
    QSet<int> m_consumed;
    QVector<int> m_backStack;  // indices to return to on previous()
};
