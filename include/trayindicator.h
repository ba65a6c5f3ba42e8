#ifndef TRAYINDICATOR_H
#define TRAYINDICATOR_H

#include <QObject>
#include <QSystemTrayIcon>
#include <QMenu>
#include <QAction>
#include "dictationstatus.h"

class TrayIndicator : public QObject
{
    Q_OBJECT
public:
    explicit TrayIndicator(QObject *parent = nullptr);
    ~TrayIndicator();

    void show();
    void setStatus(DictationStatus status);
    void setHotkeyLabel(const QString &label);
    void showMessage(const QString &title, const QString &message);

signals:
    void toggleRequested();
    void quitRequested();

private:
    void updateToolTip();

    QSystemTrayIcon *trayIcon;
    QMenu *menu;
    QAction *toggleAction;
    QAction *loadingAction;
    DictationStatus m_status = DictationStatus::Idle;
    QString m_hotkeyLabel;
};

#endif // TRAYINDICATOR_H
