#pragma once

#include <QObject>
#include <QSettings>
#include <QString>

// Timing knobs for the transport, bundled so the controller does not
// read QSettings on every tick.
struct TransportConfig {
    int    pollIntervalMs = 100;  // authoritative position poll cadence
    int    seekSettleMs = 100;    // delay before re-reading position after a seek
    double endEpsilon = 0.1;      // seconds; absorbs timing jitter at track end
};

class Settings : public QObject {
    Q_OBJECT

public:
    static Settings* instance();

    // Tests point this at a scratch file
    explicit Settings(const QString& iniPath, QObject* parent = nullptr);

    // ── Playback ─────────────────────────────────────────────────────
    int pollIntervalMs() const;
    void setPollIntervalMs(int ms);

    int seekSettleMs() const;
    void setSeekSettleMs(int ms);

    double endEpsilon() const;
    void setEndEpsilon(double seconds);

    // Default step for skip forward / backward
    int skipSeconds() const;
    void setSkipSeconds(int seconds);

    TransportConfig transportConfig() const;

    // ── Generic access ───────────────────────────────────────────────
    QVariant value(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);
    void sync() { m_settings.sync(); }
    QString fileName() const { return m_settings.fileName(); }

    // INI file path, for local QSettings(IniFormat) instances
    static QString settingsPath();

signals:
    void transportConfigChanged();
    void skipSecondsChanged(int seconds);

private:
    QSettings m_settings;
};
