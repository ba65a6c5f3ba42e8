#include "hotkey.h"

#include <QStringList>

QString Hotkey::toString() const
{
    QStringList names;
    if (modifiers & ModControl) names << "Ctrl";
    if (modifiers & ModAlt) names << "Alt";
    if (modifiers & ModShift) names << "Shift";
    if (modifiers & ModSuper) names << "Super";
    if (modifiers & ModFunction) names << "Fn";

    if (!keycode) {
        return names.isEmpty() ? QStringLiteral("None") : names.join('+');
    }
    names << (label.isEmpty() ? QString("Key%1").arg(*keycode) : label);
    return names.join('+');
}

void HotkeyMatcher::setHotkey(const Hotkey &hotkey)
{
    m_hotkey = hotkey;
    m_hotkeyDown = false;
    m_functionDown = false;
    m_lastFunctionPress.reset();
}

bool HotkeyMatcher::feed(const KeyEvent &event)
{
    const quint32 flags = event.modifiers & kModifierMask;

    if (m_hotkey.isModifierOnly()) {
        if (event.type != KeyEvent::FlagsChanged) return false;

        if (m_hotkey.modifiers == ModFunction) {
            return feedDoubleTap(event);
        }

        const bool matchesNow = (flags == m_hotkey.modifiers);
        if (matchesNow && !m_hotkeyDown) {
            m_hotkeyDown = true;
            return true;
        }
        if (!matchesNow && m_hotkeyDown) {
            m_hotkeyDown = false;
        }
        return false;
    }

    if (event.keycode != *m_hotkey.keycode) return false;

    if (event.type == KeyEvent::KeyUp) {
        m_hotkeyDown = false;
        return false;
    }
    if (event.type == KeyEvent::KeyDown && flags == m_hotkey.modifiers && !m_hotkeyDown) {
        m_hotkeyDown = true;
        return true;
    }
    return false;
}

bool HotkeyMatcher::feedDoubleTap(const KeyEvent &event)
{
    const bool functionNow = (event.modifiers & ModFunction) != 0;

    if (functionNow && !m_functionDown) {
        m_functionDown = true;
        if (m_lastFunctionPress
            && event.timestampMs - *m_lastFunctionPress <= kDoubleTapWindowMs) {
            // The second tap consumes the window.
            m_lastFunctionPress.reset();
            return true;
        }
        m_lastFunctionPress = event.timestampMs;
        return false;
    }
    if (!functionNow && m_functionDown) {
        m_functionDown = false;
    }
    return false;
}
