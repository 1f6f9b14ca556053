#include "IdleTimeSampler.h"
#include "../core/Saturating.h"

IdleTimeSampler::IdleTimeSampler()
{
}

IdleTimeSampler::~IdleTimeSampler()
{
}

EngineError IdleTimeSampler::lastError() const
{
    return m_lastError;
}

quint64 IdleTimeSampler::elapsedSince(quint64 nowTick, quint64 lastInputTick)
{
    return Saturating::sub(nowTick, lastInputTick);
}

void IdleTimeSampler::setLastError(const EngineError &error)
{
    m_lastError = error;
}
