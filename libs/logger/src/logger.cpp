#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

Logger* Logger::instance() {
    // Never destroyed: the engine thread may still log while statics are torn down
    static Logger* s_instance = new Logger();
    return s_instance;
}

Logger::LogLevel Logger::levelFromString(const QString& name, bool* ok) {
    const QString level = name.trimmed().toLower();
    bool known = true;
    LogLevel result = Info;

    if (level == "debug") {
        result = Debug;
    } else if (level == "info") {
        result = Info;
    } else if (level == "warning" || level == "warn") {
        result = Warning;
    } else if (level == "error") {
        result = Error;
    } else if (level == "fatal") {
        result = Fatal;
    } else {
        known = false;
    }

    if (ok) {
        *ok = known;
    }
    return result;
}

QString Logger::levelToString(LogLevel level) {
    switch (level) {
        case Debug:   return "DEBUG";
        case Info:    return "INFO";
        case Warning: return "WARNING";
        case Error:   return "ERROR";
        case Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

Logger::Logger(QObject* parent)
    : QObject(parent)
    , m_logLevel(Info)
    , m_consoleOutput(true)
{
    // Default log file location, replaced by setLogFile() once config is read
    QString logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (logDir.isEmpty()) {
        logDir = QDir::tempPath() + "/SoundIdle";
    }
    QDir().mkpath(logDir);

    m_logFilePath = logDir + "/soundidle.log";
    m_logFile.setFileName(m_logFilePath);

    if (m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        m_logStream.setDevice(&m_logFile);
    } else {
        qWarning() << "Failed to open log file:" << m_logFilePath;
    }
}

Logger::~Logger() {
    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }
}

bool Logger::setLogFile(const QString& filePath) {
    QMutexLocker locker(&m_mutex);

    if (filePath == m_logFilePath && m_logFile.isOpen()) {
        return true;
    }

    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logFile.close();
    }

    QDir().mkpath(QFileInfo(filePath).absolutePath());

    m_logFilePath = filePath;
    m_logFile.setFileName(filePath);
    bool opened = m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);

    if (opened) {
        m_logStream.setDevice(&m_logFile);
        writeToLog(formatLogMessage(Info, QString("Log file opened: %1").arg(filePath), QString(), -1));
    } else {
        qWarning() << "Failed to open log file:" << filePath << m_logFile.errorString();
    }
    return opened;
}

void Logger::setLogLevel(LogLevel level) {
    QMutexLocker locker(&m_mutex);
    m_logLevel = level;
    writeToLog(formatLogMessage(Info, QString("Log level set to: %1").arg(levelToString(level)), QString(), -1));
}

void Logger::enableConsoleOutput(bool enable) {
    QMutexLocker locker(&m_mutex);
    m_consoleOutput = enable;
}

void Logger::debug(const QString& message, const QString& source, int line) {
    log(Debug, message, source, line);
}

void Logger::info(const QString& message, const QString& source, int line) {
    log(Info, message, source, line);
}

void Logger::warning(const QString& message, const QString& source, int line) {
    log(Warning, message, source, line);
}

void Logger::error(const QString& message, const QString& source, int line) {
    log(Error, message, source, line);
}

void Logger::fatal(const QString& message, const QString& source, int line) {
    log(Fatal, message, source, line);
}

void Logger::log(LogLevel level, const QString& message, const QString& source, int line) {
    if (level < logLevel()) {
        return;
    }

    // Format outside the lock to keep the engine thread's critical section short
    QString formattedMessage = formatLogMessage(level, message, source, line);

    QMutexLocker locker(&m_mutex);
    writeToLog(formattedMessage);

    if (m_consoleOutput) {
        switch (level) {
            case Debug:
                qDebug().noquote() << formattedMessage;
                break;
            case Info:
                qInfo().noquote() << formattedMessage;
                break;
            case Warning:
                qWarning().noquote() << formattedMessage;
                break;
            case Error:
            case Fatal:
                qCritical().noquote() << formattedMessage;
                break;
        }
    }
}

QString Logger::formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) const {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    QString pid = QString::number(QCoreApplication::applicationPid());
    QString threadId = QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()));
    QString levelStr = levelToString(level);

    if (source.isEmpty()) {
        return QString("[%1] [%2] [PID:%3] [TID:%4] %5")
            .arg(timestamp, levelStr, pid, threadId, message);
    }

    // Q_FUNC_INFO carries the full signature; keep "Class::method"
    QString sourceInfo = source;
    int parenPos = sourceInfo.indexOf('(');
    if (parenPos > 0) {
        sourceInfo = sourceInfo.left(parenPos);
    }
    int spacePos = sourceInfo.lastIndexOf(' ');
    if (spacePos >= 0) {
        sourceInfo = sourceInfo.mid(spacePos + 1);
    }
    sourceInfo.remove("__cdecl");

    if (line >= 0) {
        sourceInfo += QString(":%1").arg(line);
    }

    return QString("[%1] [%2] [PID:%3] [TID:%4] [%5] %6")
        .arg(timestamp, levelStr, pid, threadId, sourceInfo, message);
}

void Logger::writeToLog(const QString& message) {
    if (m_logFile.isOpen()) {
        m_logStream << message << Qt::endl;
        m_logStream.flush();
    }
}

Logger::LogLevel Logger::logLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

QString Logger::logFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}
