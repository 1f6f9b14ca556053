#include "PlatformBackendLinux.h"
#include "PulseSession.h"
#include "AudioControllerLinux.h"
#include "IdleTimeSamplerLinux.h"

PlatformBackendLinux::PlatformBackendLinux()
{
}

PlatformBackendLinux::~PlatformBackendLinux()
{
}

bool PlatformBackendLinux::isSupported() const
{
    return true;
}

QString PlatformBackendLinux::platformName() const
{
    return "Linux (X11, PulseAudio)";
}

std::unique_ptr<PlatformSession> PlatformBackendLinux::openSession()
{
    return std::unique_ptr<PlatformSession>(new PulseSession());
}

std::unique_ptr<IdleTimeSampler> PlatformBackendLinux::createIdleTimeSampler(PlatformSession &)
{
    return std::unique_ptr<IdleTimeSampler>(new IdleTimeSamplerLinux());
}

std::unique_ptr<AudioController> PlatformBackendLinux::createAudioController(PlatformSession &session)
{
    // openSession() on this backend only ever hands out PulseSession
    return std::unique_ptr<AudioController>(
        new AudioControllerLinux(static_cast<PulseSession&>(session)));
}
