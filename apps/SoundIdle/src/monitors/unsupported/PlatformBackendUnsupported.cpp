#include "PlatformBackendUnsupported.h"
#include <QSysInfo>

namespace {

class UnsupportedSession : public PlatformSession
{
public:
    UnsupportedSession()
    {
        setLastError(PlatformBackend::unsupportedError("Failed to open platform session"));
    }

    bool isOpen() const override { return false; }
};

class UnsupportedIdleTimeSampler : public IdleTimeSampler
{
public:
    bool idleTime(quint64 &milliseconds) override
    {
        milliseconds = 0;
        setLastError(PlatformBackend::unsupportedError("Failed to read idle time"));
        return false;
    }
};

class UnsupportedAudioController : public AudioController
{
public:
    bool initialize() override { return fail("Failed to resolve default audio endpoint"); }
    QString endpointName() const override { return QString(); }
    bool currentVolume(float &level) override { level = 0.0f; return fail("Failed to read volume"); }
    bool currentMute(bool &muted) override { muted = false; return fail("Failed to read mute state"); }
    bool setMute(bool) override { return fail("Failed to change mute state"); }

protected:
    bool applyVolume(float) override { return fail("Failed to change volume"); }

private:
    bool fail(const QString &context)
    {
        setLastError(PlatformBackend::unsupportedError(context));
        return false;
    }
};

} // namespace

PlatformBackendUnsupported::PlatformBackendUnsupported()
{
}

PlatformBackendUnsupported::~PlatformBackendUnsupported()
{
}

bool PlatformBackendUnsupported::isSupported() const
{
    return false;
}

QString PlatformBackendUnsupported::platformName() const
{
    return QSysInfo::prettyProductName();
}

std::unique_ptr<PlatformSession> PlatformBackendUnsupported::openSession()
{
    return std::unique_ptr<PlatformSession>(new UnsupportedSession());
}

std::unique_ptr<IdleTimeSampler> PlatformBackendUnsupported::createIdleTimeSampler(PlatformSession &)
{
    return std::unique_ptr<IdleTimeSampler>(new UnsupportedIdleTimeSampler());
}

std::unique_ptr<AudioController> PlatformBackendUnsupported::createAudioController(PlatformSession &)
{
    return std::unique_ptr<AudioController>(new UnsupportedAudioController());
}
