#include "ConfigManager.h"
#include "logger/logger.h"
#include <QFileInfo>
#include <QStandardPaths>

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    loadDefaults();
}

ConfigManager::~ConfigManager()
{
}

void ConfigManager::loadDefaults()
{
    m_inactivityTimeoutMinutes = DefaultTimeoutMinutes;
    m_logLevel = "info";
    m_logFilePath = "";
    m_consoleOutput = true;
    m_configFilePath = "";
}

QString ConfigManager::defaultConfigFilePath() const
{
    QString configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return configDir + "/SoundIdle/soundidle.conf";
}

bool ConfigManager::loadLocalConfig(const QString &configPath)
{
    QString path = configPath;
    if (path.isEmpty()) {
        path = qEnvironmentVariable("SOUNDIDLE_CONFIG");
    }
    if (path.isEmpty()) {
        path = defaultConfigFilePath();
    }

    {
        QMutexLocker locker(&m_mutex);
        m_configFilePath = path;
    }

    if (!QFileInfo::exists(path)) {
        LOG_INFO("Configuration file not found, using defaults: " + path);
        return true;
    }

    LOG_INFO("Loading configuration from: " + path);

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        LOG_ERROR("Error reading configuration file, status: " + QString::number(settings.status()));
        return false;
    }

    {
        QMutexLocker locker(&m_mutex);

        bool ok = false;
        const QString timeoutValue = settings.value("InactivityTimeoutMinutes").toString();
        if (!timeoutValue.isEmpty()) {
            quint64 minutes = timeoutValue.toULongLong(&ok);
            if (ok && minutes > 0) {
                m_inactivityTimeoutMinutes = minutes;
            } else {
                LOG_WARNING("Invalid InactivityTimeoutMinutes '" + timeoutValue + "' corrected to " +
                            QString::number(DefaultTimeoutMinutes));
                m_inactivityTimeoutMinutes = DefaultTimeoutMinutes;
            }
        }

        m_logLevel = settings.value("LogLevel", m_logLevel).toString().toLower();
        m_logFilePath = settings.value("LogFilePath", m_logFilePath).toString();
        m_consoleOutput = settings.value("ConsoleOutput", m_consoleOutput).toBool();

        Logger::levelFromString(m_logLevel, &ok);
        if (!ok) {
            LOG_WARNING("Invalid LogLevel '" + m_logLevel + "' corrected to info");
            m_logLevel = "info";
        }
    }

    LOG_INFO("Local configuration loaded successfully");
    emit configChanged();
    return true;
}

void ConfigManager::applyLogSettings() const
{
    Logger::instance()->setLogLevel(Logger::levelFromString(logLevel()));
    Logger::instance()->enableConsoleOutput(consoleOutput());

    const QString path = logFilePath();
    if (!path.isEmpty()) {
        Logger::instance()->setLogFile(path);
    }
}

quint64 ConfigManager::inactivityTimeoutMinutes() const
{
    QMutexLocker locker(&m_mutex);
    return m_inactivityTimeoutMinutes;
}

QString ConfigManager::logLevel() const
{
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

QString ConfigManager::logFilePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}

bool ConfigManager::consoleOutput() const
{
    QMutexLocker locker(&m_mutex);
    return m_consoleOutput;
}

QString ConfigManager::configFilePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_configFilePath;
}

bool ConfigManager::setInactivityTimeoutMinutes(quint64 minutes)
{
    if (minutes == 0) {
        return false;
    }

    {
        QMutexLocker locker(&m_mutex);
        if (m_inactivityTimeoutMinutes == minutes) {
            return true;
        }
        m_inactivityTimeoutMinutes = minutes;
    }

    emit inactivityTimeoutChanged(minutes);
    emit configChanged();
    return true;
}

void ConfigManager::setLogLevel(const QString &level)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_logLevel == level) {
            return;
        }
        m_logLevel = level;
    }
    emit configChanged();
}

void ConfigManager::setLogFilePath(const QString &path)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_logFilePath == path) {
            return;
        }
        m_logFilePath = path;
    }
    emit configChanged();
}

void ConfigManager::setConsoleOutput(bool enabled)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_consoleOutput == enabled) {
            return;
        }
        m_consoleOutput = enabled;
    }
    emit configChanged();
}
