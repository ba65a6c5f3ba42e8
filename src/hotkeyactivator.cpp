#include "hotkeyactivator.h"
#include "errors.h"
#include "hotkeylistener.h"

#include <QDebug>
#include <QTimer>

HotkeyActivator::HotkeyActivator(HotkeyListener *listener, QObject *parent)
    : QObject(parent), m_listener(listener)
{
    m_retryTimer = new QTimer(this);
    m_retryTimer->setInterval(kRetryIntervalMs);
    connect(m_retryTimer, &QTimer::timeout, this, &HotkeyActivator::tryStart);
}

void HotkeyActivator::setRetryInterval(int ms)
{
    m_retryTimer->setInterval(ms);
}

bool HotkeyActivator::isRetrying() const
{
    return m_retryTimer->isActive();
}

void HotkeyActivator::activate()
{
    tryStart();
}

void HotkeyActivator::tryStart()
{
    if (m_listener->isActive()) {
        m_retryTimer->stop();
        return;
    }

    try {
        m_listener->start();
    } catch (const HotkeyPermissionError &e) {
        if (!m_reported) {
            m_reported = true;
            qWarning() << "Hotkey listener unavailable, retrying:" << e.what();
            emit listenerUnavailable(e.message());
        }
        if (!m_retryTimer->isActive()) {
            m_retryTimer->start();
        }
        return;
    }

    m_retryTimer->stop();
    if (m_reported) {
        qInfo() << "Hotkey listener recovered.";
    }
    m_reported = false;
    emit listenerActive();
}
