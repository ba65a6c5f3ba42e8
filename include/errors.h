#ifndef ERRORS_H
#define ERRORS_H

#include <QString>
#include <stdexcept>

class DictlyError : public std::runtime_error
{
public:
    explicit DictlyError(const QString &message)
        : std::runtime_error(message.toStdString()) {}

    QString message() const { return QString::fromStdString(what()); }
};

// Device busy, format rejected, file not writable.
class CaptureError : public DictlyError
{
public:
    using DictlyError::DictlyError;
};

// Download or load failure. The model stays unloaded; the next request retries.
class ModelUnavailableError : public DictlyError
{
public:
    using DictlyError::DictlyError;
};

// Inference failure or unreadable audio.
class TranscriptionError : public DictlyError
{
public:
    using DictlyError::DictlyError;
};

// Missing credential/model, HTTP failure, empty or malformed response.
class PostprocessError : public DictlyError
{
public:
    using DictlyError::DictlyError;
};

// The global key listener could not be installed. Retry start() later.
class HotkeyPermissionError : public DictlyError
{
public:
    using DictlyError::DictlyError;
};

#endif // ERRORS_H
