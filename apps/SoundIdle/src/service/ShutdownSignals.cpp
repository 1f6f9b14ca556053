#include "ShutdownSignals.h"
#include "logger/logger.h"

volatile std::sig_atomic_t ShutdownSignals::s_pendingSignal = 0;
ShutdownSignals* ShutdownSignals::s_installed = nullptr;

ShutdownSignals::ShutdownSignals(QObject *parent)
    : QObject(parent)
    , m_installed(false)
    , m_previousInt(SIG_DFL)
    , m_previousTerm(SIG_DFL)
{
    connect(&m_pollTimer, &QTimer::timeout, this, &ShutdownSignals::checkPending);
}

ShutdownSignals::~ShutdownSignals()
{
    uninstall();
}

bool ShutdownSignals::install(int pollIntervalMs)
{
    if (m_installed) {
        return true;
    }

    if (s_installed) {
        LOG_ERROR("Shutdown signal handlers are already installed");
        return false;
    }

    s_pendingSignal = 0;
    m_previousInt = std::signal(SIGINT, &ShutdownSignals::handleSignal);
    m_previousTerm = std::signal(SIGTERM, &ShutdownSignals::handleSignal);

    if (m_previousInt == SIG_ERR || m_previousTerm == SIG_ERR) {
        LOG_ERROR("Failed to install shutdown signal handlers");
        if (m_previousInt != SIG_ERR) {
            std::signal(SIGINT, m_previousInt);
        }
        if (m_previousTerm != SIG_ERR) {
            std::signal(SIGTERM, m_previousTerm);
        }
        return false;
    }

    s_installed = this;
    m_installed = true;
    m_pollTimer.start(pollIntervalMs);
    return true;
}

void ShutdownSignals::uninstall()
{
    if (!m_installed) {
        return;
    }

    m_pollTimer.stop();
    std::signal(SIGINT, m_previousInt);
    std::signal(SIGTERM, m_previousTerm);
    s_installed = nullptr;
    m_installed = false;
}

void ShutdownSignals::checkPending()
{
    const int signal = s_pendingSignal;
    if (signal == 0) {
        return;
    }

    s_pendingSignal = 0;
    LOG_INFO(QString("Received signal: %1").arg(signal));
    emit shutdownRequested(signal);
}

void ShutdownSignals::handleSignal(int signal)
{
    s_pendingSignal = signal;
#ifdef Q_OS_WIN
    // The CRT resets the handler to SIG_DFL before calling it
    std::signal(signal, &ShutdownSignals::handleSignal);
#endif
}
