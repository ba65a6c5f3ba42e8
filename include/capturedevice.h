#ifndef CAPTUREDEVICE_H
#define CAPTUREDEVICE_H

#include <QString>

// Microphone recording to a file: start() and stop() are the whole contract.
class CaptureDevice
{
public:
    virtual ~CaptureDevice() = default;

    // Opens a new recording and returns its path. Throws CaptureError when
    // already active or when the device rejects the format.
    virtual QString start() = 0;

    // Finalizes the file and returns its path. When inactive, returns the last
    // path without error.
    virtual QString stop() = 0;

    virtual bool isActive() const = 0;
};

#endif // CAPTUREDEVICE_H
