#include "textpaster.h"

#include <QClipboard>
#include <QDebug>
#include <QGuiApplication>
#include <QProcess>
#include <QTimer>

TextPaster::TextPaster(QObject *parent) : QObject(parent)
{
}

void TextPaster::copy(const QString &text)
{
    QGuiApplication::clipboard()->setText(text);
    qDebug() << "Transcription synced to clipboard:" << text.size() << "chars";
}

void TextPaster::paste(const QString &text)
{
    if (text.isEmpty()) return;
    copy(text);

    // Give the clipboard owner a moment before the target reads it.
    QTimer::singleShot(kPasteDelayMs, this, []() {
        // Detached so a slow xdotool never blocks the event loop
        if (!QProcess::startDetached("xdotool", QStringList() << "key" << "--clearmodifiers" << "ctrl+v")) {
            qWarning() << "xdotool not available, text left on the clipboard.";
        }
    });
}
