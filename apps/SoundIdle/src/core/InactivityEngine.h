#ifndef INACTIVITYENGINE_H
#define INACTIVITYENGINE_H

#include <QMutex>
#include <QWaitCondition>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

#include "EngineError.h"
#include "InactivityThreshold.h"

class PlatformBackend;

/**
 * @brief Background monitor that silences the default output while the user is away
 *
 * One engine exists per process. start() spawns the poll loop at most once;
 * every later or concurrent call returns the outcome of that first attempt.
 * The loop owns the platform session and the audio endpoint, samples idle
 * time every poll interval and drives a MuteStateMachine.
 *
 * Any platform failure ends the loop for good: it is logged, kept in
 * lastLoopError() and never retried.
 *
 * setThreshold() may be called from any thread at any time; the loop picks
 * the new value up on its next tick without being woken.
 */
class InactivityEngine
{
public:
    static constexpr int DefaultPollIntervalMs = 5000;

    explicit InactivityEngine(std::unique_ptr<PlatformBackend> backend,
                              int pollIntervalMs = DefaultPollIntervalMs);
    ~InactivityEngine();

    InactivityEngine(const InactivityEngine &) = delete;
    InactivityEngine &operator=(const InactivityEngine &) = delete;

    /**
     * @brief Starts the monitor loop, once per engine
     * @return NoError on success, UnsupportedPlatform or Spawn otherwise; the
     *         same value for every call
     */
    EngineError start();

    /**
     * @brief Changes the inactivity threshold
     * @param milliseconds Rounded down to whole seconds, at least one second
     * @param error Receives InvalidThreshold for zero or negative values
     * @return False when rejected; the previous threshold stays in effect
     */
    bool setThreshold(qint64 milliseconds, EngineError *error = nullptr);
    bool setThresholdSeconds(quint64 seconds, EngineError *error = nullptr);
    quint64 thresholdSeconds() const;

    bool isSupported() const;
    bool isStarted() const;
    bool isRunning() const;
    int pollInterval() const { return m_pollIntervalMs; }

    // Failure that ended the loop, NoError while it runs or after a clean stop
    EngineError lastLoopError() const;

    /**
     * @brief Asks the loop to restore the audio state and exit
     *
     * Interrupts the sleep between ticks. Returns immediately; the destructor
     * waits for the loop thread.
     */
    void requestStop();

private:
    void run();
    EngineError monitor();
    // False once a stop was requested
    bool waitForNextTick();
    bool stopRequested() const;

    std::unique_ptr<PlatformBackend> m_backend;
    const int m_pollIntervalMs;
    InactivityThreshold m_threshold;

    std::once_flag m_startOnce;
    EngineError m_startResult;
    std::atomic<bool> m_started;
    std::atomic<bool> m_running;
    std::thread m_thread;

    mutable QMutex m_mutex;
    QWaitCondition m_wakeup;
    bool m_stopRequested;
    EngineError m_loopError;
};

#endif // INACTIVITYENGINE_H
