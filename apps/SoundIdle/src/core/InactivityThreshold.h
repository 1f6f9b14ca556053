#ifndef INACTIVITYTHRESHOLD_H
#define INACTIVITYTHRESHOLD_H

#include <QtGlobal>
#include <atomic>

class EngineError;

/**
 * @brief Idle duration after which the default output is silenced
 *
 * Shared between the threads that reconfigure the monitor and the engine
 * loop. Stored as whole seconds in one atomic word, so a reader never sees a
 * partially written value. Always at least one second.
 */
class InactivityThreshold
{
public:
    static constexpr quint64 DefaultSeconds = 5 * 60;
    static constexpr quint64 MinimumSeconds = 1;

    explicit InactivityThreshold(quint64 seconds = DefaultSeconds);

    /**
     * @brief Stores a new threshold
     * @param milliseconds Requested duration, rounded down to whole seconds
     *        with a floor of one second
     * @param error Receives InvalidThreshold when the request is rejected
     * @return False when milliseconds is zero or negative; the stored value
     *         is left unchanged
     */
    bool set(qint64 milliseconds, EngineError *error = nullptr);
    // Whole-second variant, zero is rejected
    bool setSeconds(quint64 seconds, EngineError *error = nullptr);

    quint64 seconds() const;
    // seconds() * 1000, saturated
    quint64 milliseconds() const;

private:
    std::atomic<quint64> m_seconds;
};

#endif // INACTIVITYTHRESHOLD_H
