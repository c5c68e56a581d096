#pragma once

#include <QObject>
#include <QString>
#include <optional>

class ShuffleSequencer;

// Owns the active playback mode and answers "which index plays next /
// previous" for it.  Manual next/previous and auto-advance both resolve
// through resolveNext()/resolvePrevious() so they cannot diverge.
class PlaybackModeStateMachine : public QObject {
    Q_OBJECT
public:
    enum class Mode { Linear, RepeatAll, RepeatOne, Shuffle };
    Q_ENUM(Mode)

    explicit PlaybackModeStateMachine(ShuffleSequencer* sequencer, QObject* parent = nullptr);

    Mode mode() const { return m_mode; }
    void setMode(Mode mode);
    Mode cycle();

    // nullopt: nothing to move to (Linear at a playlist boundary, or an
    // empty playlist).
    std::optional<int> resolveNext(int playlistSize, int currentIndex);
    std::optional<int> resolvePrevious(int playlistSize, int currentIndex);

    // Non-mutating preview of resolveNext.  Shuffle has no preview.
    std::optional<int> peekNext(int playlistSize, int currentIndex) const;

    // Persisted names: "linear", "repeat-all", "repeat-one", "shuffle"
    static QString modeName(Mode mode);
    static std::optional<Mode> modeFromName(const QString& name);

signals:
    void modeChanged(PlaybackModeStateMachine::Mode mode);

private:
    ShuffleSequencer* m_sequencer;
    Mode m_mode = Mode::Linear;
};

using PlaybackMode = PlaybackModeStateMachine::Mode;
