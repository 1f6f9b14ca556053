// PlatformBackendWin.h
#ifndef PLATFORMBACKENDWIN_H
#define PLATFORMBACKENDWIN_H

#include "../PlatformBackend.h"

class PlatformBackendWin : public PlatformBackend
{
public:
    PlatformBackendWin();
    ~PlatformBackendWin() override;

    bool isSupported() const override;
    QString platformName() const override;

    std::unique_ptr<PlatformSession> openSession() override;
    std::unique_ptr<IdleTimeSampler> createIdleTimeSampler(PlatformSession &session) override;
    std::unique_ptr<AudioController> createAudioController(PlatformSession &session) override;
};

#endif // PLATFORMBACKENDWIN_H
