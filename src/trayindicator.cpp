#include "trayindicator.h"

#include <QIcon>

namespace {

QIcon iconFor(DictationStatus status)
{
    switch (status) {
    case DictationStatus::Recording:
        return QIcon::fromTheme("media-record", QIcon::fromTheme("audio-input-microphone"));
    case DictationStatus::ModelLoading:
        return QIcon::fromTheme("emblem-downloads", QIcon::fromTheme("view-refresh"));
    case DictationStatus::Transcribing:
        return QIcon::fromTheme("document-edit", QIcon::fromTheme("accessories-text-editor"));
    case DictationStatus::Idle:
        break;
    }
    // Use QIcon::fromTheme so StatusNotifierItem hosts can resolve it
    return QIcon::fromTheme("com.dictly.app", QIcon::fromTheme("audio-input-microphone"));
}

}

TrayIndicator::TrayIndicator(QObject *parent) : QObject(parent)
{
    trayIcon = new QSystemTrayIcon(this);
    trayIcon->setIcon(iconFor(m_status));

    // Tray Menu
    menu = new QMenu();
    toggleAction = menu->addAction("Start Recording");
    connect(toggleAction, &QAction::triggered, this, &TrayIndicator::toggleRequested);

    loadingAction = menu->addAction("Loading Model…");
    loadingAction->setEnabled(false);
    loadingAction->setVisible(false);

    menu->addSeparator();

    QAction *quitAction = menu->addAction("Quit");
    connect(quitAction, &QAction::triggered, this, &TrayIndicator::quitRequested);

    trayIcon->setContextMenu(menu);

    // Toggle on click
    connect(trayIcon, &QSystemTrayIcon::activated, this, [this](QSystemTrayIcon::ActivationReason reason) {
        if (reason == QSystemTrayIcon::Trigger) {
            emit toggleRequested();
        }
    });

    updateToolTip();
}

TrayIndicator::~TrayIndicator()
{
    delete menu;
}

void TrayIndicator::show()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qWarning("System tray not available; running without an indicator.");
        return;
    }
    trayIcon->show();
}

void TrayIndicator::setStatus(DictationStatus status)
{
    m_status = status;
    trayIcon->setIcon(iconFor(status));
    toggleAction->setText(status == DictationStatus::Recording ? "Stop Recording" : "Start Recording");
    loadingAction->setVisible(status == DictationStatus::ModelLoading);
    updateToolTip();
}

void TrayIndicator::setHotkeyLabel(const QString &label)
{
    m_hotkeyLabel = label;
    updateToolTip();
}

void TrayIndicator::showMessage(const QString &title, const QString &message)
{
    trayIcon->showMessage(title, message, QSystemTrayIcon::Warning);
}

void TrayIndicator::updateToolTip()
{
    QString tip = QString("Dictly - %1").arg(statusLabel(m_status));
    if (!m_hotkeyLabel.isEmpty()) tip += QString(" (%1)").arg(m_hotkeyLabel);
    trayIcon->setToolTip(tip);
}
