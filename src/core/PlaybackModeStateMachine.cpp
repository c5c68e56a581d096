#include "PlaybackModeStateMachine.h"
#include "ShuffleSequencer.h"
#include <QDebug>

PlaybackModeStateMachine::PlaybackModeStateMachine(ShuffleSequencer* sequencer, QObject* parent)
    : QObject(parent)
    , m_sequencer(sequencer)
{
}

void PlaybackModeStateMachine::setMode(Mode mode)
{
    if (m_mode == mode) return;

    Mode oldMode = m_mode;
    m_mode = mode;

    // Entering or leaving Shuffle starts a fresh bag
    if ((oldMode == Mode::Shuffle || mode == Mode::Shuffle) && m_sequencer)
        m_sequencer->reset();

    qDebug() << "[Mode]" << modeName(oldMode) << "→" << modeName(mode);
    emit modeChanged(m_mode);
}

PlaybackModeStateMachine::Mode PlaybackModeStateMachine::cycle()
{
    switch (m_mode) {
    case Mode::Linear:    setMode(Mode::RepeatAll); break;
    case Mode::RepeatAll: setMode(Mode::RepeatOne); break;
    case Mode::RepeatOne: setMode(Mode::Shuffle);   break;
    case Mode::Shuffle:   setMode(Mode::Linear);    break;
    }
    return m_mode;
}

std::optional<int> PlaybackModeStateMachine::resolveNext(int playlistSize, int currentIndex)
{
    if (playlistSize <= 0) return std::nullopt;

    switch (m_mode) {
    case Mode::Linear:
        if (currentIndex + 1 < playlistSize)
            return currentIndex + 1;
        return std::nullopt;

    case Mode::RepeatAll:
        if (currentIndex < 0) return 0;
        return (currentIndex + 1) % playlistSize;

    case Mode::RepeatOne:
        if (currentIndex < 0 || currentIndex >= playlistSize) return std::nullopt;
        return currentIndex;

    case Mode::Shuffle: {
        int idx = m_sequencer ? m_sequencer->next(playlistSize, currentIndex) : -1;
        if (idx < 0) return std::nullopt;
        return idx;
    }
    }
    return std::nullopt;
}

std::optional<int> PlaybackModeStateMachine::resolvePrevious(int playlistSize, int currentIndex)
{
    if (playlistSize <= 0) return std::nullopt;

    switch (m_mode) {
    case Mode::Linear:
        if (currentIndex > 0 && currentIndex <= playlistSize)
            return currentIndex - 1;
        return std::nullopt;

    case Mode::RepeatAll:
        if (currentIndex <= 0 || currentIndex > playlistSize)
            return playlistSize - 1;
        return currentIndex - 1;

    case Mode::RepeatOne:
        if (currentIndex < 0 || currentIndex >= playlistSize) return std::nullopt;
        return currentIndex;

    case Mode::Shuffle: {
        int idx = m_sequencer ? m_sequencer->previous(playlistSize, currentIndex) : -1;
        if (idx < 0) return std::nullopt;
        return idx;
    }
    }
    return std::nullopt;
}

std::optional<int> PlaybackModeStateMachine::peekNext(int playlistSize, int currentIndex) const
{
    if (playlistSize <= 0) return std::nullopt;

    switch (m_mode) {
    case Mode::Linear:
        if (currentIndex + 1 < playlistSize)
            return currentIndex + 1;
        return std::nullopt;
    case Mode::RepeatAll:
        return currentIndex < 0 ? 0 : (currentIndex + 1) % playlistSize;
    case Mode::RepeatOne:
        if (currentIndex < 0 || currentIndex >= playlistSize) return std::nullopt;
        return currentIndex;
    case Mode::Shuffle:
        return std::nullopt;
    }
    return std::nullopt;
}

QString PlaybackModeStateMachine::modeName(Mode mode)
{
    switch (mode) {
    case Mode::Linear:    return QStringLiteral("linear");
    case Mode::RepeatAll: return QStringLiteral("repeat-all");
    case Mode::RepeatOne: return QStringLiteral("repeat-one");
    case Mode::Shuffle:   return QStringLiteral("shuffle");
    }
    return QStringLiteral("linear");
}

std::optional<PlaybackModeStateMachine::Mode> PlaybackModeStateMachine::modeFromName(const QString& name)
{
    if (name == QLatin1String("linear"))     return Mode::Linear;
    if (name == QLatin1String("repeat-all")) return Mode::RepeatAll;
    if (name == QLatin1String("repeat-one")) return Mode::RepeatOne;
    if (name == QLatin1String("shuffle"))    return Mode::Shuffle;
    return std::nullopt;
}
