#include "InactivityThreshold.h"
#include "EngineError.h"
#include "Saturating.h"

#include <algorithm>

InactivityThreshold::InactivityThreshold(quint64 seconds)
    : m_seconds(std::max(seconds, MinimumSeconds))
{
}

bool InactivityThreshold::set(qint64 milliseconds, EngineError *error)
{
    if (milliseconds <= 0) {
        if (error) {
            *error = EngineError(EngineError::InvalidThreshold,
                                 "Inactivity timeout must be greater than zero");
        }
        return false;
    }

    // Positive sub-second requests become the one second floor
    const quint64 seconds = static_cast<quint64>(milliseconds) / 1000;
    m_seconds.store(std::max(seconds, MinimumSeconds), std::memory_order_relaxed);
    return true;
}

bool InactivityThreshold::setSeconds(quint64 seconds, EngineError *error)
{
    if (seconds == 0) {
        if (error) {
            *error = EngineError(EngineError::InvalidThreshold,
                                 "Inactivity timeout must be greater than zero");
        }
        return false;
    }

    m_seconds.store(seconds, std::memory_order_relaxed);
    return true;
}

quint64 InactivityThreshold::seconds() const
{
    return std::max(m_seconds.load(std::memory_order_relaxed), MinimumSeconds);
}

quint64 InactivityThreshold::milliseconds() const
{
    return Saturating::mul(seconds(), 1000);
}
