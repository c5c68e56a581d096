#include "MusicData.h"

#include <QFileInfo>
#include <QtGlobal>

double Track::declaredDuration() const
{
    if (metadata && metadata->durationSeconds > 0.0)
        return metadata->durationSeconds;
    return 0.0;
}

QString Track::displayTitle() const
{
    if (metadata && !metadata->title.isEmpty())
        return metadata->title;
    if (!displayName.isEmpty())
        return displayName;
    return QFileInfo(path).fileName();
}

// ── formatDuration ──────────────────────────────────────────────────
QString formatDuration(int seconds)
{
    if (seconds < 0) seconds = 0;
    int h = seconds / 3600;
    int m = (seconds % 3600) / 60;
    int s = seconds % 60;
    if (h > 0)
        return QStringLiteral("%1:%2:%3")
            .arg(h)
            .arg(m, 2, 10, QLatin1Char('0'))
            .arg(s, 2, 10, QLatin1Char('0'));
    return QStringLiteral("%1:%2").arg(m).arg(s, 2, 10, QLatin1Char('0'));
}

int clampRating(int rating)
{
    return qBound(0, rating, 5);
}
