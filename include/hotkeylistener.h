#ifndef HOTKEYLISTENER_H
#define HOTKEYLISTENER_H

#include <QObject>
#include "hotkey.h"

// Source of hotkey toggles. toggled() may be emitted from any thread.
class HotkeyListener : public QObject
{
    Q_OBJECT
public:
    explicit HotkeyListener(QObject *parent = nullptr) : QObject(parent) {}

    virtual void registerHotkey(const Hotkey &hotkey) = 0;
    virtual Hotkey hotkey() const = 0;

    // Throws HotkeyPermissionError when keyboard events cannot be observed.
    // The listener stays inactive until start() is called again.
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool isActive() const = 0;

signals:
    void toggled();
};

#endif // HOTKEYLISTENER_H
