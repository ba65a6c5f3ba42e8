#ifndef TEXTPASTER_H
#define TEXTPASTER_H

#include <QObject>
#include <QString>

// Delivers text to the focused window: clipboard, then a synthetic Ctrl+V.
// GUI thread only.
class TextPaster : public QObject
{
    Q_OBJECT
public:
    static constexpr int kPasteDelayMs = 50;

    explicit TextPaster(QObject *parent = nullptr);

    void copy(const QString &text);
    void paste(const QString &text);
};

#endif // TEXTPASTER_H
