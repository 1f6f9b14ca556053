// ConfigManager.h
#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QString>
#include <QSettings>
#include <QMutex>

/**
 * @brief Startup settings of the monitor
 *
 * Values come from built-in defaults, then an optional INI file, then the
 * command line. The file is only read: changes made while the process runs
 * are not written back.
 */
class ConfigManager : public QObject
{
    Q_OBJECT
public:
    static constexpr quint64 DefaultTimeoutMinutes = 5;

    explicit ConfigManager(QObject *parent = nullptr);
    ~ConfigManager() override;

    /**
     * @brief Reads the INI file, if any
     * @param configPath Explicit file; empty falls back to $SOUNDIDLE_CONFIG,
     *        then to <config dir>/SoundIdle/soundidle.conf
     * @return False only when an existing file cannot be parsed
     */
    bool loadLocalConfig(const QString &configPath = QString());

    // Applies log level, log file and console output to the Logger
    void applyLogSettings() const;

    // Getters
    quint64 inactivityTimeoutMinutes() const;
    QString logLevel() const;
    QString logFilePath() const;
    bool consoleOutput() const;
    QString configFilePath() const;

    // Setters
    bool setInactivityTimeoutMinutes(quint64 minutes);
    void setLogLevel(const QString &level);
    void setLogFilePath(const QString &path);
    void setConsoleOutput(bool enabled);

signals:
    void configChanged();
    void inactivityTimeoutChanged(quint64 minutes);

private:
    void loadDefaults();
    QString defaultConfigFilePath() const;

    mutable QMutex m_mutex;

    quint64 m_inactivityTimeoutMinutes;
    QString m_logLevel;
    QString m_logFilePath;
    bool m_consoleOutput;
    QString m_configFilePath;
};

#endif // CONFIGMANAGER_H
