/* PhysioLog Logger module implementation
 *
 * Copyright (c) 2022 The OSCAR Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include "logger.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>
#include <cstdlib>

LogSink * logger = nullptr;
const int LogSink::MaxBufferedLines;

void MyOutputHandler(QtMsgType type, const QMessageLogContext &context, const QString &msgtxt)
{
    Q_UNUSED(context)

    if (!logger) {
        fprintf(stderr, "Pre/Post: %s\n", msgtxt.toLocal8Bit().constData());
        return;
    }
    if (type == QtDebugMsg && !logger->showDebug()) {
        return;
    }

    logger->append(type, msgtxt);

    if (type == QtFatalMsg) {
        abort();
    }
}

void initializeLogger(bool showDebug)
{
    if (logger) {
        return;
    }
    logger = new LogSink(showDebug);
    qInstallMessageHandler(MyOutputHandler);
    qDebug() << "Started logging";
}

bool logToFile(const QString & filePath, int maxPrevious)
{
    if (!logger) {
        qWarning() << "logToFile called before initializeLogger";
        return false;
    }
    if (!logger->logFileName().isEmpty()) {
        qWarning().noquote() << "Already logging to" << logger->logFileName();
        return false;
    }

    rotateLogs(filePath, maxPrevious);  // keep a limited set of previous logs

    if (!logger->openFile(filePath)) {
        qWarning().noquote() << "Unable to open" << filePath;
        return false;
    }
    qDebug().noquote() << "Logging to" << filePath;
    return true;
}

void shutdownLogger()
{
    if (logger) {
        qDebug() << "Shutting down logging";
        qInstallMessageHandler(0);  // Remove our logger.
        delete logger;
        logger = nullptr;
    }
}

LogSink::LogSink(bool showDebug)
    : m_showDebug(showDebug), m_logFile(nullptr), m_logStream(nullptr)
{
    logtime.start();
}

LogSink::~LogSink()
{
    QMutexLocker lock(&strlock);

    if (m_logStream) {
        m_logStream->flush();
        delete m_logStream;
        m_logStream = nullptr;
        Q_ASSERT(m_logFile);
        delete m_logFile;
        m_logFile = nullptr;
    }
}

bool LogSink::openFile(const QString & filePath)
{
    QMutexLocker lock(&strlock);

    QFile * file = new QFile(filePath);
    if (!file->open(QFile::WriteOnly | QFile::Append | QFile::Text)) {
        delete file;
        return false;
    }
    m_logFile = file;
    m_logStream = new QTextStream(m_logFile);
    return true;
}

QString LogSink::logFileName() const
{
    QMutexLocker lock(&strlock);
    if (!m_logFile) {
        return "";
    }
    return m_logFile->fileName();
}

QStringList LogSink::buffer() const
{
    QMutexLocker lock(&strlock);
    return m_buffer;
}

void LogSink::append(QtMsgType type, const QString & msg)
{
    QString typestr;

    switch (type) {
    case QtWarningMsg:
        typestr = QString("Warning: ");
        break;

    case QtFatalMsg:
        typestr = QString("Fatal: ");
        break;

    case QtCriticalMsg:
        typestr = QString("Critical: ");
        break;

    case QtInfoMsg:
        typestr = QString("Info: ");
        break;

    default:
        typestr = QString("Debug: ");
        break;
    }

    QString tmp = QString("%1: %2%3").arg(logtime.elapsed(), 5, 10, QChar('0')).arg(typestr).arg(msg);
    appendClean(tmp);
}

void LogSink::appendClean(const QString & msg)
{
    fprintf(stderr, "%s\n", msg.toLocal8Bit().constData());

    QMutexLocker lock(&strlock);
    m_buffer.append(msg);
    while (m_buffer.size() > MaxBufferedLines) {
        m_buffer.removeFirst();
    }
    if (m_logStream) {
        *m_logStream << msg << "\n";
        m_logStream->flush();
    }
}


void rotateLogs(const QString & filePath, int maxPrevious)
{
    if (maxPrevious < 0) {
        maxPrevious = 0;
    }

    // Build the list of rotated logs for this filePath.
    QFileInfo info(filePath);
    QString path = QDir(info.absolutePath()).canonicalPath();
    QString base = info.baseName();
    QString ext = info.completeSuffix();
    if (!ext.isEmpty()) {
        ext = "." + ext;
    }
    if (path.isEmpty()) {
        qWarning() << "Skipping log rotation, directory does not exist:" << info.absoluteFilePath();
        return;
    }

    QStringList logs;
    logs.append(filePath);
    for (int i = 0; i < maxPrevious; i++) {
        logs.append(QString("%1/%2.%3%4").arg(path).arg(base).arg(i).arg(ext));
    }

    // Remove the expired log.
    QFileInfo expired(logs[maxPrevious]);
    if (expired.exists()) {
        QFile file(expired.canonicalFilePath());
        if (!file.remove()) {
            qWarning() << "Unable to delete expired log file" << file.fileName();
        }
    }

    // Rotate the remaining logs.
    for (int i = maxPrevious; i > 0; i--) {
        QFileInfo from(logs[i-1]);
        QFileInfo to(logs[i]);
        if (from.exists()) {
            if (to.exists()) {
                qWarning() << "Unable to rotate log:" << to.absoluteFilePath() << "exists";
                continue;
            }
            if (!QFile::rename(from.absoluteFilePath(), to.absoluteFilePath())) {
                qWarning() << "Unable to rename" << from.absoluteFilePath() << "to" << to.absoluteFilePath();
            }
        }
    }
}
