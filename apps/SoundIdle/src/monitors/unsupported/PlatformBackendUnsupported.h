#ifndef PLATFORMBACKENDUNSUPPORTED_H
#define PLATFORMBACKENDUNSUPPORTED_H

#include "../PlatformBackend.h"

// Every operation fails with UnsupportedPlatform
class PlatformBackendUnsupported : public PlatformBackend
{
public:
    PlatformBackendUnsupported();
    ~PlatformBackendUnsupported() override;

    bool isSupported() const override;
    QString platformName() const override;

    std::unique_ptr<PlatformSession> openSession() override;
    std::unique_ptr<IdleTimeSampler> createIdleTimeSampler(PlatformSession &session) override;
    std::unique_ptr<AudioController> createAudioController(PlatformSession &session) override;
};

#endif // PLATFORMBACKENDUNSUPPORTED_H
