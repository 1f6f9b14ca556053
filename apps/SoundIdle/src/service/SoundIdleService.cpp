// SoundIdleService.cpp
#include "SoundIdleService.h"
#include "../core/Saturating.h"
#include "../monitors/PlatformBackend.h"
#include "logger/logger.h"
#include <QThread>

SoundIdleService::SoundIdleService(QObject *parent)
    : SoundIdleService(createPlatformBackend(), InactivityEngine::DefaultPollIntervalMs, parent)
{
}

SoundIdleService::SoundIdleService(std::unique_ptr<PlatformBackend> backend, int pollIntervalMs, QObject *parent)
    : QObject(parent)
    , m_configManager(new ConfigManager(this))
    , m_engine(new InactivityEngine(std::move(backend), pollIntervalMs))
    , m_initThread(nullptr)
    , m_initialized(false)
{
    connect(m_configManager, &ConfigManager::inactivityTimeoutChanged,
            this, &SoundIdleService::onInactivityTimeoutChanged);
    connect(m_configManager, &ConfigManager::configChanged,
            this, &SoundIdleService::onConfigChanged);
}

SoundIdleService::~SoundIdleService()
{
    stop();

    // The init thread runs on m_engine, it must be gone before the engine is
    if (m_initThread) {
        m_initThread->wait();
        delete m_initThread;
        m_initThread = nullptr;
    }
}

bool SoundIdleService::initialize(const QString &configPath)
{
    if (m_initialized) {
        LOG_WARNING("SoundIdleService already initialized");
        return true;
    }

    LOG_INFO("Initializing SoundIdleService");

    if (!m_configManager->loadLocalConfig(configPath)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }
    m_configManager->applyLogSettings();
    LOG_INFO("Log file: " + Logger::instance()->logFilePath());

    if (m_engine->isSupported()) {
        QString error;
        if (!setInactivityTimeout(m_configManager->inactivityTimeoutMinutes(), &error)) {
            LOG_WARNING("Configured inactivity timeout not applied: " + error);
        }
    } else {
        LOG_WARNING("Sound inactivity monitoring is unsupported on this platform");
    }

    m_initialized = true;
    LOG_INFO("SoundIdleService initialized successfully");
    return true;
}

bool SoundIdleService::startMonitor()
{
    LOG_INFO("Starting sound inactivity monitoring...");

    EngineError error = m_engine->start();
    if (error.isError()) {
        LOG_ERROR("Failed to start sound inactivity monitoring: " + error.toString());
        return false;
    }
    return true;
}

void SoundIdleService::startMonitorAsync()
{
    if (m_initThread) {
        LOG_WARNING("Monitor startup already requested");
        return;
    }

    m_initThread = QThread::create([this]() {
        startMonitor();
    });
    m_initThread->setObjectName("sound-inactive-init");
    m_initThread->start();
}

bool SoundIdleService::waitForStartup(unsigned long timeoutMs)
{
    if (!m_initThread) {
        return true;
    }
    return m_initThread->wait(timeoutMs);
}

bool SoundIdleService::setInactivityTimeout(const std::optional<quint64> &minutes, QString *errorMessage)
{
    const quint64 value = minutes.value_or(ConfigManager::DefaultTimeoutMinutes);

    if (value == 0) {
        if (errorMessage) {
            *errorMessage = tr("The inactivity timeout must be greater than zero.");
        }
        return false;
    }

    if (!m_engine->isSupported()) {
        if (errorMessage) {
            *errorMessage = tr("Sound inactivity monitoring is only available on Windows and Linux.");
        }
        return false;
    }

    EngineError error;
    if (!m_engine->setThresholdSeconds(Saturating::mul(value, 60), &error)) {
        if (errorMessage) {
            *errorMessage = error.toString();
        }
        return false;
    }

    return true;
}

void SoundIdleService::stop()
{
    if (!m_engine) {
        return;
    }

    if (m_engine->isRunning()) {
        LOG_INFO("Stopping sound inactivity monitoring");
    }
    m_engine->requestStop();

    // A start still in progress spawns a loop that sees the stop request and exits
    if (m_initThread) {
        m_initThread->wait();
    }
}

void SoundIdleService::onConfigChanged()
{
    m_configManager->applyLogSettings();
}

void SoundIdleService::onInactivityTimeoutChanged(quint64 minutes)
{
    QString error;
    if (!setInactivityTimeout(minutes, &error)) {
        LOG_WARNING("Inactivity timeout not applied: " + error);
    }
}
