#ifndef PLATFORMBACKEND_H
#define PLATFORMBACKEND_H

#include <QString>
#include <memory>
#include "../core/EngineError.h"
#include "IdleTimeSampler.h"
#include "AudioController.h"

/**
 * @brief Per-thread platform session needed before audio calls are made
 *
 * The constructor of a concrete session acquires the resource (COM apartment,
 * sound server connection) and the destructor releases it, so every exit of
 * the engine loop gives it back.
 */
class PlatformSession
{
public:
    PlatformSession();
    virtual ~PlatformSession();

    PlatformSession(const PlatformSession &) = delete;
    PlatformSession &operator=(const PlatformSession &) = delete;

    virtual bool isOpen() const = 0;
    EngineError lastError() const;

protected:
    void setLastError(const EngineError &error);

private:
    EngineError m_lastError;
};

/**
 * @brief Factory for the adapters the inactivity engine drives
 *
 * One implementation per supported OS, chosen by createPlatformBackend().
 * All create* calls are made from the engine thread after openSession().
 */
class PlatformBackend
{
public:
    PlatformBackend();
    virtual ~PlatformBackend();

    virtual bool isSupported() const = 0;
    virtual QString platformName() const = 0;

    virtual std::unique_ptr<PlatformSession> openSession() = 0;
    virtual std::unique_ptr<IdleTimeSampler> createIdleTimeSampler(PlatformSession &session) = 0;
    virtual std::unique_ptr<AudioController> createAudioController(PlatformSession &session) = 0;

    static EngineError unsupportedError(const QString &context);
};

// Backend for the platform this binary was built for
std::unique_ptr<PlatformBackend> createPlatformBackend();

#endif // PLATFORMBACKEND_H
