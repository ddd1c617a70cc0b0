#ifndef LOGGER_H
#define LOGGER_H

#include <QDebug>
#include <QElapsedTimer>
#include <QMutex>
#include <QStringList>

void initializeLogger(bool showDebug = true);
void shutdownLogger();

//! \brief Rotates any previous logs and starts appending to filePath as well as stderr
bool logToFile(const QString & filePath, int maxPrevious = 4);

void rotateLogs(const QString & filePath, int maxPrevious = 4);

void MyOutputHandler(QtMsgType type, const QMessageLogContext &context, const QString &msgtxt);

class LogSink
{
public:
    explicit LogSink(bool showDebug);
    virtual ~LogSink();

    void append(QtMsgType type, const QString & msg);
    void appendClean(const QString & msg);
    bool openFile(const QString & filePath);
    QString logFileName() const;
    bool showDebug() const { return m_showDebug; }

    //! \brief The most recent lines appended, at most MaxBufferedLines of them
    QStringList buffer() const;

    static const int MaxBufferedLines = 1000;

protected:
    mutable QMutex strlock;
    QStringList m_buffer;
    QElapsedTimer logtime;
    bool m_showDebug;
    class QFile* m_logFile;
    class QTextStream* m_logStream;
};

extern LogSink * logger;

#endif // LOGGER_H
