// PlatformBackendLinux.h
#ifndef PLATFORMBACKENDLINUX_H
#define PLATFORMBACKENDLINUX_H

#include "../PlatformBackend.h"

// X11 for idle time, PulseAudio (or pipewire-pulse) for the default sink
class PlatformBackendLinux : public PlatformBackend
{
public:
    PlatformBackendLinux();
    ~PlatformBackendLinux() override;

    bool isSupported() const override;
    QString platformName() const override;

    std::unique_ptr<PlatformSession> openSession() override;
    std::unique_ptr<IdleTimeSampler> createIdleTimeSampler(PlatformSession &session) override;
    std::unique_ptr<AudioController> createAudioController(PlatformSession &session) override;
};

#endif // PLATFORMBACKENDLINUX_H
