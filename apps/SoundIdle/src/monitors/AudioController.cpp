#include "AudioController.h"

#include <cmath>

AudioController::AudioController()
{
}

AudioController::~AudioController()
{
}

bool AudioController::setVolume(float level)
{
    return applyVolume(clampLevel(level));
}

EngineError AudioController::lastError() const
{
    return m_lastError;
}

float AudioController::clampLevel(float level)
{
    if (std::isnan(level)) {
        return 0.0f;
    }
    return qBound(0.0f, level, 1.0f);
}

void AudioController::setLastError(const EngineError &error)
{
    m_lastError = error;
}
