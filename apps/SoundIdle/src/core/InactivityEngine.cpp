#include "InactivityEngine.h"
#include "MuteStateMachine.h"
#include "../monitors/PlatformBackend.h"
#include "logger/logger.h"

#include <QDeadlineTimer>
#include <system_error>

InactivityEngine::InactivityEngine(std::unique_ptr<PlatformBackend> backend, int pollIntervalMs)
    : m_backend(std::move(backend))
    , m_pollIntervalMs(pollIntervalMs > 0 ? pollIntervalMs : DefaultPollIntervalMs)
    , m_started(false)
    , m_running(false)
    , m_stopRequested(false)
{
}

InactivityEngine::~InactivityEngine()
{
    requestStop();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

EngineError InactivityEngine::start()
{
    LOG_INFO(QString("Starting sound inactivity monitor (current threshold: %1 seconds)")
                 .arg(m_threshold.seconds()));

    std::call_once(m_startOnce, [this]() {
        if (!m_backend || !m_backend->isSupported()) {
            m_startResult = PlatformBackend::unsupportedError("Failed to start monitoring");
            return;
        }

        m_running.store(true);
        try {
            m_thread = std::thread([this]() { run(); });
        } catch (const std::system_error &e) {
            m_running.store(false);
            m_startResult = EngineError(EngineError::Spawn, "Failed to start monitoring",
                                        QString::fromLocal8Bit(e.what()), e.code().value());
            return;
        }

        m_started.store(true);
    });

    if (m_startResult.isError()) {
        LOG_ERROR(m_startResult.toString());
    }
    return m_startResult;
}

bool InactivityEngine::setThreshold(qint64 milliseconds, EngineError *error)
{
    if (!m_threshold.set(milliseconds, error)) {
        LOG_WARNING(QString("Rejected inactivity threshold of %1 ms").arg(milliseconds));
        return false;
    }

    LOG_INFO(QString("Inactivity threshold updated to %1 second(s)").arg(m_threshold.seconds()));
    return true;
}

bool InactivityEngine::setThresholdSeconds(quint64 seconds, EngineError *error)
{
    if (!m_threshold.setSeconds(seconds, error)) {
        LOG_WARNING("Rejected inactivity threshold of 0 seconds");
        return false;
    }

    LOG_INFO(QString("Inactivity threshold updated to %1 second(s)").arg(m_threshold.seconds()));
    return true;
}

quint64 InactivityEngine::thresholdSeconds() const
{
    return m_threshold.seconds();
}

bool InactivityEngine::isSupported() const
{
    return m_backend && m_backend->isSupported();
}

bool InactivityEngine::isStarted() const
{
    return m_started.load();
}

bool InactivityEngine::isRunning() const
{
    return m_running.load();
}

EngineError InactivityEngine::lastLoopError() const
{
    QMutexLocker locker(&m_mutex);
    return m_loopError;
}

void InactivityEngine::requestStop()
{
    QMutexLocker locker(&m_mutex);
    m_stopRequested = true;
    m_wakeup.wakeAll();
}

void InactivityEngine::run()
{
    LOG_INFO(QString("Sound inactivity monitor running on %1, polling every %2 ms")
                 .arg(m_backend->platformName())
                 .arg(m_pollIntervalMs));

    EngineError error = monitor();

    if (error.isError()) {
        LOG_ERROR(QString("Sound inactivity monitor stopped with error: %1").arg(error.toString()));
    } else {
        LOG_INFO("Sound inactivity monitor stopped");
    }

    {
        QMutexLocker locker(&m_mutex);
        m_loopError = error;
    }
    m_running.store(false);
}

EngineError InactivityEngine::monitor()
{
    if (stopRequested()) {
        return EngineError();
    }

    // Declared first so it is released last, after the endpoint handles
    std::unique_ptr<PlatformSession> session = m_backend->openSession();
    if (!session || !session->isOpen()) {
        return session ? session->lastError()
                       : EngineError(EngineError::PlatformSession, "Failed to open platform session");
    }

    std::unique_ptr<IdleTimeSampler> sampler = m_backend->createIdleTimeSampler(*session);
    std::unique_ptr<AudioController> controller = m_backend->createAudioController(*session);

    if (!controller->initialize()) {
        return controller->lastError();
    }
    LOG_INFO("Controlling audio endpoint: " + controller->endpointName());

    MuteStateMachine machine(*controller);

    do {
        const quint64 thresholdMs = m_threshold.milliseconds();

        quint64 idleMs = 0;
        if (!sampler->idleTime(idleMs)) {
            return sampler->lastError();
        }

        const MuteStateMachine::State before = machine.state();
        if (!machine.update(idleMs, thresholdMs)) {
            return machine.lastError();
        }

        if (machine.state() != before) {
            LOG_DEBUG(QString("State %1 -> %2")
                          .arg(MuteStateMachine::stateName(before),
                               MuteStateMachine::stateName(machine.state())));
        }
    } while (waitForNextTick());

    // Leaving on a stop request: give the user their audio back
    if (!machine.restore()) {
        return machine.lastError();
    }
    return EngineError();
}

bool InactivityEngine::waitForNextTick()
{
    QMutexLocker locker(&m_mutex);
    QDeadlineTimer deadline(m_pollIntervalMs);

    while (!m_stopRequested) {
        if (!m_wakeup.wait(&m_mutex, deadline)) {
            break;
        }
    }
    return !m_stopRequested;
}

bool InactivityEngine::stopRequested() const
{
    QMutexLocker locker(&m_mutex);
    return m_stopRequested;
}
