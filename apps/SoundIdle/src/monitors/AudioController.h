#ifndef AUDIOCONTROLLER_H
#define AUDIOCONTROLLER_H

#include <QString>
#include "../core/EngineError.h"

/**
 * @brief Volume and mute access to the default audio render endpoint
 *
 * initialize() resolves the endpoint once; a later change of the OS default
 * output is not followed. Owned by the engine thread for its whole lifetime,
 * so implementations need no locking.
 *
 * Queries fail with AudioQuery, commands with AudioCommand, both reported
 * through lastError().
 */
class AudioController
{
public:
    AudioController();
    virtual ~AudioController();

    virtual bool initialize() = 0;

    // Human readable endpoint name, empty until initialize() succeeded
    virtual QString endpointName() const = 0;

    virtual bool currentVolume(float &level) = 0;  // 0..1
    virtual bool currentMute(bool &muted) = 0;

    /**
     * @brief Applies a master volume level
     * @param level Scalar level, clamped to [0, 1] before it reaches the platform
     */
    bool setVolume(float level);
    virtual bool setMute(bool muted) = 0;

    EngineError lastError() const;

    static float clampLevel(float level);

protected:
    // Receives a level already clamped to [0, 1]
    virtual bool applyVolume(float level) = 0;
    void setLastError(const EngineError &error);

private:
    EngineError m_lastError;
};

#endif // AUDIOCONTROLLER_H
