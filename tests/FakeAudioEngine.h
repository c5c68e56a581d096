#pragma once
// Scripted IAudioEngine for tests.
//
// Immediate delivery runs each reply before the command returns.
// Manual delivery queues replies so a test can release them one at a
// time and in any order.

#include <QHash>
#include <QSet>
#include <QStringList>
#include <QVector>
#include <functional>
#include <optional>
#include "MusicData.h"
#include "audio/IAudioEngine.h"

class FakeAudioEngine : public IAudioEngine {
public:
    enum class Delivery { Immediate, Manual };

    Delivery delivery = Delivery::Immediate;

    // ── Scripted behaviour ───────────────────────────────────────
    QHash<QString, double> durations;       // reported by loadAndPlay
    QSet<QString> rejectedPaths;            // PlaybackRejected
    QHash<QString, AlbumArtwork> artwork;
    bool unavailable = false;               // every command fails
    bool rejectSeek = false;
    bool rejectVolume = false;
    bool rejectPause = false;
    std::optional<double> seekSnapTo;       // where a seek actually lands
    double position = 0.0;                  // authoritative position

    // ── Recorded traffic ─────────────────────────────────────────
    QStringList commands;
    QStringList playedPaths;
    QVector<double> seekTargets;
    QVector<double> volumes;

    // ── Manual delivery ──────────────────────────────────────────
    int pendingCount() const { return m_pending.size(); }

    QStringList pendingLabels() const
    {
        QStringList labels;
        for (const auto& p : m_pending)
            labels << p.label;
        return labels;
    }

    // Runs the first pending reply whose label starts with prefix.
    bool deliver(const QString& prefix)
    {
        for (int i = 0; i < m_pending.size(); ++i) {
            if (m_pending.at(i).label.startsWith(prefix)) {
                auto fn = m_pending.takeAt(i).fn;
                fn();
                return true;
            }
        }
        return false;
    }

    void deliverAll()
    {
        while (!m_pending.isEmpty()) {
            auto fn = m_pending.takeFirst().fn;
            fn();
        }
    }

    void dropAll() { m_pending.clear(); }

    // Simulates the engine's push notification at natural track end.
    void finishTrack()
    {
        if (m_finishedHandler)
            m_finishedHandler();
    }

    bool hasFinishedHandler() const { return bool(m_finishedHandler); }

    int count(const QString& prefix) const
    {
        int n = 0;
        for (const QString& c : commands)
            if (c.startsWith(prefix)) ++n;
        return n;
    }

    // ── IAudioEngine ─────────────────────────────────────────────
    void loadAndPlay(const QString& path, ReplyCallback done) override
    {
        commands << QStringLiteral("loadAndPlay:") + path;
        respond(QStringLiteral("loadAndPlay:") + path, [this, path, done]() {
            if (unavailable) {
                done(EngineReply::failure(EngineError::EngineUnavailable, QStringLiteral("engine offline")));
                return;
            }
            if (rejectedPaths.contains(path)) {
                done(EngineReply::failure(EngineError::PlaybackRejected, QStringLiteral("unsupported file")));
                return;
            }
            playedPaths << path;
            position = 0.0;
            done(EngineReply::success(durations.value(path, 0.0)));
        });
    }

    void pause(ReplyCallback done) override
    {
        commands << QStringLiteral("pause");
        respond(QStringLiteral("pause"), [this, done]() {
            if (unavailable || rejectPause)
                done(EngineReply::failure(EngineError::EngineUnavailable, QStringLiteral("pause failed")));
            else
                done(EngineReply::success());
        });
    }

    void resume(ReplyCallback done) override
    {
        commands << QStringLiteral("resume");
        respond(QStringLiteral("resume"), [this, done]() {
            if (unavailable)
                done(EngineReply::failure(EngineError::EngineUnavailable, QStringLiteral("engine offline")));
            else
                done(EngineReply::success());
        });
    }

    void stop(ReplyCallback done) override
    {
        commands << QStringLiteral("stop");
        respond(QStringLiteral("stop"), [this, done]() {
            if (unavailable)
                done(EngineReply::failure(EngineError::EngineUnavailable, QStringLiteral("engine offline")));
            else
                done(EngineReply::success());
        });
    }

    void seekTo(double seconds, ReplyCallback done) override
    {
        commands << QStringLiteral("seekTo:%1").arg(seconds);
        seekTargets << seconds;
        respond(QStringLiteral("seekTo:%1").arg(seconds), [this, seconds, done]() {
            if (unavailable || rejectSeek) {
                done(EngineReply::failure(EngineError::SeekRejected, QStringLiteral("engine busy")));
                return;
            }
            position = seekSnapTo ? *seekSnapTo : seconds;
            done(EngineReply::success());
        });
    }

    void currentPosition(ReplyCallback done) override
    {
        commands << QStringLiteral("position");
        respond(QStringLiteral("position"), [this, done]() {
            if (unavailable)
                done(EngineReply::failure(EngineError::EngineUnavailable, QStringLiteral("engine offline")));
            else
                done(EngineReply::success(position));
        });
    }

    void setVolume(double fraction, ReplyCallback done) override
    {
        commands << QStringLiteral("setVolume:%1").arg(fraction);
        volumes << fraction;
        respond(QStringLiteral("setVolume"), [this, done]() {
            if (unavailable || rejectVolume)
                done(EngineReply::failure(EngineError::VolumeRejected, QStringLiteral("mixer locked")));
            else
                done(EngineReply::success());
        });
    }

    void albumArtwork(const QString& path, ArtworkCallback done) override
    {
        commands << QStringLiteral("artwork:") + path;
        respond(QStringLiteral("artwork:") + path, [this, path, done]() {
            if (artwork.contains(path))
                done(artwork.value(path));
            else
                done(std::nullopt);
        });
    }

    void setTrackFinishedHandler(std::function<void()> handler) override
    {
        m_finishedHandler = std::move(handler);
    }

private:
    struct Pending {
        QString label;
        std::function<void()> fn;
    };

    void respond(const QString& label, std::function<void()> fn)
    {
        if (delivery == Delivery::Immediate)
            fn();
        else
            m_pending.append({label, std::move(fn)});
    }

    QVector<Pending> m_pending;
    std::function<void()> m_finishedHandler;
};

// ── Track helpers ───────────────────────────────────────────────────
inline Track makeTrack(const QString& name, double durationSeconds = 0.0,
                       bool hasArtwork = false)
{
    Track t;
    t.path = QStringLiteral("/music/") + name + QStringLiteral(".flac");
    t.displayName = name;
    if (durationSeconds > 0.0 || hasArtwork) {
        TrackMetadata m;
        m.title = name;
        m.durationSeconds = durationSeconds;
        m.hasArtwork = hasArtwork;
        t.metadata = m;
    }
    return t;
}

inline QVector<Track> makeTracks(int count, double durationSeconds = 180.0)
{
    QVector<Track> v;
    for (int i = 1; i <= count; ++i)
        v.append(makeTrack(QString::number(i), durationSeconds));
    return v;
}
