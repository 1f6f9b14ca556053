// IdleTimeSamplerLinux.h
#ifndef IDLETIMESAMPLERLINUX_H
#define IDLETIMESAMPLERLINUX_H

#include "../IdleTimeSampler.h"
#include <X11/Xlib.h>
#include <X11/extensions/scrnsaver.h>

// X11 screensaver extension idle counter of the default display
class IdleTimeSamplerLinux : public IdleTimeSampler
{
public:
    IdleTimeSamplerLinux();
    ~IdleTimeSamplerLinux() override;

    bool idleTime(quint64 &milliseconds) override;

private:
    Display* m_display;
    XScreenSaverInfo* m_info;

    bool initializeX11();
    void cleanupX11();
};

#endif // IDLETIMESAMPLERLINUX_H
