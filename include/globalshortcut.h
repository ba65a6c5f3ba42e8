#ifndef GLOBALSHORTCUT_H
#define GLOBALSHORTCUT_H

#include <QMutex>
#include <QThread>
#include <atomic>
#include "hotkeylistener.h"

// Global keyboard listener. Watches the whole X server keymap from a
// dedicated thread (listen-only, nothing is grabbed) and emits toggled()
// once per qualifying press of the registered hotkey.
class GlobalShortcut : public HotkeyListener
{
    Q_OBJECT
public:
    static constexpr int kPollIntervalMs = 10;

    explicit GlobalShortcut(QObject *parent = nullptr);
    ~GlobalShortcut();

    // Replaces the active binding. Safe while the listener runs.
    void registerHotkey(const Hotkey &hotkey) override;
    Hotkey hotkey() const override;

    // Throws HotkeyPermissionError when the display cannot be opened.
    void start() override;
    void stop() override;
    bool isActive() const override { return m_running.load(); }

    // Feeds one event through the matcher; used by the listener thread.
    void dispatch(const KeyEvent &event);

private:
    void run();

    void* m_display = nullptr;
    QThread *m_thread = nullptr;
    std::atomic<bool> m_running{false};

    mutable QMutex m_mutex;
    HotkeyMatcher m_matcher;
};

#endif // GLOBALSHORTCUT_H
