#include "IAudioEngine.h"

QString engineErrorName(EngineError error)
{
    switch (error) {
    case EngineError::None:              return QStringLiteral("None");
    case EngineError::EngineUnavailable: return QStringLiteral("EngineUnavailable");
    case EngineError::PlaybackRejected:  return QStringLiteral("PlaybackRejected");
    case EngineError::SeekRejected:      return QStringLiteral("SeekRejected");
    case EngineError::VolumeRejected:    return QStringLiteral("VolumeRejected");
    }
    return QStringLiteral("Unknown");
}

EngineReply EngineReply::success(double value)
{
    EngineReply r;
    r.value = value;
    return r;
}

EngineReply EngineReply::failure(EngineError error, const QString& message)
{
    EngineReply r;
    r.error = error;
    r.message = message;
    return r;
}
