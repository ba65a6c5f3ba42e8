#include "globalshortcut.h"
#include "errors.h"

// 1. Include ALL Qt headers first
#include <QDebug>
#include <QElapsedTimer>
#include <QMutexLocker>

// 2. Include X11 headers
#include <X11/Xlib.h>
#include <X11/XKBlib.h>
#include <X11/keysym.h>

// 3. Undefine X11 macros that conflict with Qt/Standard C++
#undef None
#undef Bool
#undef Success
#undef Status
#undef CursorShape
#undef KeyPress
#undef KeyRelease
#undef FocusIn
#undef FocusOut
#undef FontChange

#include <array>
#include <cstring>

namespace {

quint32 modifierForKeysym(KeySym sym)
{
    switch (sym) {
    case XK_Control_L: case XK_Control_R: return ModControl;
    case XK_Alt_L: case XK_Alt_R:
    case XK_Meta_L: case XK_Meta_R:       return ModAlt;
    case XK_Shift_L: case XK_Shift_R:     return ModShift;
    case XK_Super_L: case XK_Super_R:     return ModSuper;
    case XK_Hyper_L: case XK_Hyper_R:     return ModFunction;
    default:                              return 0;
    }
}

bool isDown(const char *keys, int keycode)
{
    return (keys[keycode / 8] >> (keycode % 8)) & 1;
}

}

GlobalShortcut::GlobalShortcut(QObject *parent) : HotkeyListener(parent)
{
}

GlobalShortcut::~GlobalShortcut()
{
    stop();
}

void GlobalShortcut::registerHotkey(const Hotkey &hotkey)
{
    QMutexLocker locker(&m_mutex);
    m_matcher.setHotkey(hotkey);
    qInfo() << "Hotkey registered:" << hotkey.toString();
}

Hotkey GlobalShortcut::hotkey() const
{
    QMutexLocker locker(&m_mutex);
    return m_matcher.hotkey();
}

void GlobalShortcut::start()
{
    if (m_running.load()) return;

    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        qCritical() << "X11 ERROR: Could not open display! Global hotkey listener is inactive.";
        throw HotkeyPermissionError("Failed to open the X display for the global key listener.");
    }

    m_running.store(true);
    m_thread = QThread::create([this]() { run(); });
    m_thread->setObjectName("hotkey-listener");
    m_thread->start();
    qInfo() << "Global hotkey listener started.";
}

void GlobalShortcut::stop()
{
    if (!m_running.exchange(false)) return;

    if (m_thread) {
        m_thread->wait();
        delete m_thread;
        m_thread = nullptr;
    }
    if (m_display) {
        XCloseDisplay(static_cast<Display*>(m_display));
        m_display = nullptr;
    }
    qInfo() << "Global hotkey listener stopped.";
}

void GlobalShortcut::dispatch(const KeyEvent &event)
{
    bool fire = false;
    {
        QMutexLocker locker(&m_mutex);
        fire = m_matcher.feed(event);
    }
    if (fire) {
        emit toggled();
    }
}

void GlobalShortcut::run()
{
    Display *dpy = static_cast<Display*>(m_display);

    // Keycode -> modifier bit, resolved once from the current layout.
    std::array<quint32, 256> modifierOf{};
    int minKeycode = 0;
    int maxKeycode = 0;
    XDisplayKeycodes(dpy, &minKeycode, &maxKeycode);
    for (int code = minKeycode; code <= maxKeycode && code < 256; ++code) {
        modifierOf[code] = modifierForKeysym(XkbKeycodeToKeysym(dpy, static_cast<KeyCode>(code), 0, 0));
    }

    QElapsedTimer clock;
    clock.start();

    char previous[32];
    char current[32];
    XQueryKeymap(dpy, previous);

    while (m_running.load()) {
        XQueryKeymap(dpy, current);

        if (std::memcmp(previous, current, sizeof(current)) != 0) {
            quint32 held = 0;
            for (int code = 0; code < 256; ++code) {
                if (isDown(current, code)) held |= modifierOf[code];
            }

            for (int code = 0; code < 256; ++code) {
                const bool was = isDown(previous, code);
                const bool now = isDown(current, code);
                if (was == now) continue;

                KeyEvent event;
                event.keycode = static_cast<quint32>(code);
                event.modifiers = held;
                event.timestampMs = clock.elapsed();
                if (modifierOf[code] != 0) {
                    event.type = KeyEvent::FlagsChanged;
                } else {
                    event.type = now ? KeyEvent::KeyDown : KeyEvent::KeyUp;
                }
                dispatch(event);
            }
            std::memcpy(previous, current, sizeof(current));
        }

        QThread::msleep(kPollIntervalMs);
    }
}
