#ifndef DICTATIONSTATUS_H
#define DICTATIONSTATUS_H

#include <QString>

enum class DictationStatus
{
    Idle,
    Recording,
    ModelLoading,
    Transcribing
};

// Recording wins over loading, loading over transcribing.
inline DictationStatus deriveStatus(bool recording, bool modelLoading, int transcriptionsInFlight)
{
    if (recording) return DictationStatus::Recording;
    if (modelLoading) return DictationStatus::ModelLoading;
    if (transcriptionsInFlight > 0) return DictationStatus::Transcribing;
    return DictationStatus::Idle;
}

inline QString statusLabel(DictationStatus status)
{
    switch (status) {
    case DictationStatus::Recording:    return QStringLiteral("Recording");
    case DictationStatus::ModelLoading: return QStringLiteral("Loading Model");
    case DictationStatus::Transcribing: return QStringLiteral("Transcribing");
    case DictationStatus::Idle:         break;
    }
    return QStringLiteral("Idle");
}

#endif // DICTATIONSTATUS_H
