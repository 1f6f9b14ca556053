#include "PlatformBackendWin.h"
#include "ComSession.h"
#include "IdleTimeSamplerWin.h"
#include "AudioControllerWin.h"

PlatformBackendWin::PlatformBackendWin()
{
}

PlatformBackendWin::~PlatformBackendWin()
{
}

bool PlatformBackendWin::isSupported() const
{
    return true;
}

QString PlatformBackendWin::platformName() const
{
    return "Windows (Core Audio)";
}

std::unique_ptr<PlatformSession> PlatformBackendWin::openSession()
{
    return std::unique_ptr<PlatformSession>(new ComSession());
}

std::unique_ptr<IdleTimeSampler> PlatformBackendWin::createIdleTimeSampler(PlatformSession &)
{
    return std::unique_ptr<IdleTimeSampler>(new IdleTimeSamplerWin());
}

std::unique_ptr<AudioController> PlatformBackendWin::createAudioController(PlatformSession &)
{
    return std::unique_ptr<AudioController>(new AudioControllerWin());
}
