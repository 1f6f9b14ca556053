#pragma once

#include <QObject>
#include <QString>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QMutex>
#include <QDebug>
#include <QThread>

// Export/import macro for the shared build of the logger
#if defined(_MSC_VER) || defined(WIN64) || defined(_WIN64) || defined(__WIN64__) || defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
#  define SOUNDIDLE_DECL_EXPORT __declspec(dllexport)
#  define SOUNDIDLE_DECL_IMPORT __declspec(dllimport)
#else
#  define SOUNDIDLE_DECL_EXPORT     __attribute__((visibility("default")))
#  define SOUNDIDLE_DECL_IMPORT     __attribute__((visibility("default")))
#endif

#if defined(SOUNDIDLE_LOGGER_STATIC)
#  define SOUNDIDLE_LOGGER_EXPORT
#elif defined(SOUNDIDLE_LOGGER_LIBRARY)
#  define SOUNDIDLE_LOGGER_EXPORT SOUNDIDLE_DECL_EXPORT
#else
#  define SOUNDIDLE_LOGGER_EXPORT SOUNDIDLE_DECL_IMPORT
#endif

/**
 * @brief Process-wide logger shared by the engine thread and the shell
 *
 * Lines are written to a log file and mirrored to the Qt message handlers.
 * Every public method may be called from any thread.
 */
class SOUNDIDLE_LOGGER_EXPORT Logger : public QObject {
    Q_OBJECT
public:
    /**
     * @brief Log levels supported by the logger
     */
    enum LogLevel {
        Debug,    ///< Detailed debugging information
        Info,     ///< General informational messages
        Warning,  ///< Warning messages for potentially harmful situations
        Error,    ///< Error messages for serious problems
        Fatal     ///< Critical errors, the monitor cannot continue
    };

    /**
     * @brief Gets the singleton instance of the logger
     * @return Pointer to the Logger instance
     */
    static Logger* instance();

    /**
     * @brief Parses a level name as used in config files and on the command line
     * @param name One of debug, info, warning, error, fatal (case insensitive)
     * @param ok Set to false when the name is not recognised
     * @return The parsed level, Info when the name is unknown
     */
    static LogLevel levelFromString(const QString& name, bool* ok = nullptr);
    static QString levelToString(LogLevel level);

    /**
     * @brief Sets the output log file path
     * @param filePath The full path to the log file
     * @return True when the file could be opened for appending
     */
    bool setLogFile(const QString& filePath);
    void setLogLevel(LogLevel level);
    void enableConsoleOutput(bool enable);

    void debug(const QString& message, const QString& source = QString(), int line = -1);
    void info(const QString& message, const QString& source = QString(), int line = -1);
    void warning(const QString& message, const QString& source = QString(), int line = -1);
    void error(const QString& message, const QString& source = QString(), int line = -1);
    void fatal(const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs a message at the given level
     * @param level The log level
     * @param message The log message
     * @param source The source function or class name
     * @param line The source line, -1 when unknown
     */
    void log(LogLevel level, const QString& message, const QString& source = QString(), int line = -1);

    LogLevel logLevel() const;
    QString logFilePath() const;

private:
    explicit Logger(QObject* parent = nullptr);
    ~Logger() override;

    QFile m_logFile;
    QTextStream m_logStream;
    LogLevel m_logLevel;
    bool m_consoleOutput;
    mutable QMutex m_mutex;
    QString m_logFilePath;

    /**
     * @brief Formats a log message with timestamp and metadata
     * @param level The log level for the message
     * @param message The message to format
     * @param source The source of the message
     * @param line The source line, -1 when unknown
     * @return Formatted log message string
     */
    QString formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) const;
    // Caller must hold m_mutex
    void writeToLog(const QString& message);
};

// Convenience macros
#define LOG_DEBUG(msg) Logger::instance()->debug(msg, Q_FUNC_INFO, __LINE__)
#define LOG_INFO(msg) Logger::instance()->info(msg, Q_FUNC_INFO, __LINE__)
#define LOG_WARNING(msg) Logger::instance()->warning(msg, Q_FUNC_INFO, __LINE__)
#define LOG_ERROR(msg) Logger::instance()->error(msg, Q_FUNC_INFO, __LINE__)
#define LOG_FATAL(msg) Logger::instance()->fatal(msg, Q_FUNC_INFO, __LINE__)
