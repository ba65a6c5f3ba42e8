#ifndef HOTKEY_H
#define HOTKEY_H

#include <QString>
#include <QtGlobal>
#include <optional>

enum ModifierFlag : quint32 {
    ModControl  = 1u << 0,
    ModAlt      = 1u << 1,
    ModShift    = 1u << 2,
    ModSuper    = 1u << 3,
    ModFunction = 1u << 4   // double-tap modifier (Hyper on X11)
};

constexpr quint32 kModifierMask = ModControl | ModAlt | ModShift | ModSuper | ModFunction;

struct Hotkey
{
    quint32 modifiers = ModControl | ModSuper;
    std::optional<quint32> keycode;
    QString label;

    bool isModifierOnly() const { return !keycode.has_value(); }
    QString toString() const;

    bool operator==(const Hotkey &other) const
    {
        return modifiers == other.modifiers && keycode == other.keycode && label == other.label;
    }
    bool operator!=(const Hotkey &other) const { return !(*this == other); }
};

struct KeyEvent
{
    enum Type {
        FlagsChanged,
        KeyDown,
        KeyUp
    };

    Type type = FlagsChanged;
    quint32 modifiers = 0;   // modifiers held after this event
    quint32 keycode = 0;
    qint64 timestampMs = 0;  // monotonic
};

// Turns raw keyboard events into toggle decisions for one binding.
//
// Key bindings fire on key-down when the held modifiers equal the bound mask
// exactly; the key must be released before it can fire again. Modifier-only
// bindings fire on the transition into the bound mask, except a lone Function
// binding, which needs two presses within kDoubleTapWindowMs.
class HotkeyMatcher
{
public:
    static constexpr qint64 kDoubleTapWindowMs = 200;

    void setHotkey(const Hotkey &hotkey);
    const Hotkey &hotkey() const { return m_hotkey; }

    // Returns true when the event should toggle recording.
    bool feed(const KeyEvent &event);

private:
    bool feedDoubleTap(const KeyEvent &event);

    Hotkey m_hotkey;
    bool m_hotkeyDown = false;
    bool m_functionDown = false;
    std::optional<qint64> m_lastFunctionPress;
};

#endif // HOTKEY_H
