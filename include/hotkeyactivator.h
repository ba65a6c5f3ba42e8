#ifndef HOTKEYACTIVATOR_H
#define HOTKEYACTIVATOR_H

#include <QObject>
#include <QString>

class HotkeyListener;
class QTimer;

// Brings the hotkey listener up and keeps trying until it runs, e.g. when
// the app starts before the X session accepts connections.
class HotkeyActivator : public QObject
{
    Q_OBJECT
public:
    static constexpr int kRetryIntervalMs = 1000;

    explicit HotkeyActivator(HotkeyListener *listener, QObject *parent = nullptr);

    void setRetryInterval(int ms);
    bool isRetrying() const;

public slots:
    void activate();

signals:
    void listenerActive();
    // Emitted once per outage, not on every retry.
    void listenerUnavailable(const QString &reason);

private slots:
    void tryStart();

private:
    HotkeyListener *m_listener;
    QTimer *m_retryTimer;
    bool m_reported = false;
};

#endif // HOTKEYACTIVATOR_H
