#ifndef IDLETIMESAMPLER_H
#define IDLETIMESAMPLER_H

#include <QtGlobal>
#include "../core/EngineError.h"

/**
 * @brief Reports how long the system has gone without keyboard or mouse input
 *
 * Created and used on the engine thread only. Not a QObject: it never
 * signals, the engine polls it once per tick.
 */
class IdleTimeSampler
{
public:
    IdleTimeSampler();
    virtual ~IdleTimeSampler();

    /**
     * @brief Reads the system-wide input idle time
     * @param milliseconds Receives the idle duration, never negative
     * @return False on a failed OS query, details in lastError()
     */
    virtual bool idleTime(quint64 &milliseconds) = 0;

    EngineError lastError() const;

    /**
     * @brief Milliseconds between the last input and now on the same tick clock
     *
     * A counter that wrapped or was reset leaves now below lastInput; the
     * result then clamps to zero rather than wrapping around.
     */
    static quint64 elapsedSince(quint64 nowTick, quint64 lastInputTick);

protected:
    void setLastError(const EngineError &error);

private:
    EngineError m_lastError;
};

#endif // IDLETIMESAMPLER_H
