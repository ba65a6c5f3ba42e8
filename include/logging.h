#ifndef LOGGING_H
#define LOGGING_H

#include <QString>
#include <QtGlobal>

// Routes qDebug/qInfo/qWarning/qCritical to stderr and to the given file as
// "LEVEL category: message" lines.
bool installLogHandler(const QString &logPath);

QString formatLogLine(QtMsgType type, const char *category, const QString &message);

#endif // LOGGING_H
