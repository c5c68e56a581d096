#include "Settings.h"
#include <QDebug>
#include <QDir>
#include <QStandardPaths>
#include <QtGlobal>

// ── Settings INI path ───────────────────────────────────────────────
// <GenericDataLocation>/Cadenza/settings.ini
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
             + QStringLiteral("/Cadenza"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

// ── Singleton ───────────────────────────────────────────────────────
Settings* Settings::instance()
{
    static Settings s(settingsPath());
    return &s;
}

// ── Constructor ─────────────────────────────────────────────────────
Settings::Settings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

// ── Poll interval ───────────────────────────────────────────────────
int Settings::pollIntervalMs() const
{
    int ms = m_settings.value(QStringLiteral("playback/pollIntervalMs"), 100).toInt();
    return qBound(10, ms, 1000);
}

void Settings::setPollIntervalMs(int ms)
{
    m_settings.setValue(QStringLiteral("playback/pollIntervalMs"), qBound(10, ms, 1000));
    emit transportConfigChanged();
}

// ── Seek settle delay ───────────────────────────────────────────────
int Settings::seekSettleMs() const
{
    int ms = m_settings.value(QStringLiteral("playback/seekSettleMs"), 100).toInt();
    return qBound(0, ms, 2000);
}

void Settings::setSeekSettleMs(int ms)
{
    m_settings.setValue(QStringLiteral("playback/seekSettleMs"), qBound(0, ms, 2000));
    emit transportConfigChanged();
}

// ── End-of-track tolerance ──────────────────────────────────────────
double Settings::endEpsilon() const
{
    double eps = m_settings.value(QStringLiteral("playback/endEpsilon"), 0.1).toDouble();
    return qBound(0.0, eps, 2.0);
}

void Settings::setEndEpsilon(double seconds)
{
    m_settings.setValue(QStringLiteral("playback/endEpsilon"), qBound(0.0, seconds, 2.0));
    emit transportConfigChanged();
}

// ── Skip step ───────────────────────────────────────────────────────
int Settings::skipSeconds() const
{
    int secs = m_settings.value(QStringLiteral("playback/skipSeconds"), 10).toInt();
    return secs > 0 ? secs : 10;
}

void Settings::setSkipSeconds(int seconds)
{
    m_settings.setValue(QStringLiteral("playback/skipSeconds"), seconds);
    emit skipSecondsChanged(skipSeconds());
}

TransportConfig Settings::transportConfig() const
{
    TransportConfig cfg;
    cfg.pollIntervalMs = pollIntervalMs();
    cfg.seekSettleMs = seekSettleMs();
    cfg.endEpsilon = endEpsilon();
    return cfg;
}

// ── Generic access ──────────────────────────────────────────────────
QVariant Settings::value(const QString& key, const QVariant& defaultValue) const
{
    return m_settings.value(key, defaultValue);
}

void Settings::setValue(const QString& key, const QVariant& value)
{
    m_settings.setValue(key, value);
}
