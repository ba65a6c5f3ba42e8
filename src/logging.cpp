#include "logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <cstdio>

namespace {

QMutex s_logMutex;
QFile *s_logFile = nullptr;

const char *levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:    return "DEBUG";
    case QtInfoMsg:     return "INFO";
    case QtWarningMsg:  return "WARNING";
    case QtCriticalMsg: return "CRITICAL";
    case QtFatalMsg:    return "FATAL";
    }
    return "INFO";
}

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    const QByteArray line = formatLogLine(type, context.category, message).toUtf8() + '\n';

    QMutexLocker locker(&s_logMutex);
    std::fwrite(line.constData(), 1, line.size(), stderr);
    std::fflush(stderr);
    if (s_logFile) {
        s_logFile->write(line);
        s_logFile->flush();
    }
}

}

QString formatLogLine(QtMsgType type, const char *category, const QString &message)
{
    const QString name = (category && *category) ? QString::fromUtf8(category) : QStringLiteral("default");
    return QString("%1 %2: %3").arg(QString::fromLatin1(levelName(type)), name, message);
}

bool installLogHandler(const QString &logPath)
{
    QDir().mkpath(QFileInfo(logPath).absolutePath());

    auto *file = new QFile(logPath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "Cannot open log file %s\n", qPrintable(logPath));
        delete file;
        qInstallMessageHandler(messageHandler);
        return false;
    }

    {
        QMutexLocker locker(&s_logMutex);
        delete s_logFile;
        s_logFile = file;
    }
    qInstallMessageHandler(messageHandler);
    return true;
}
