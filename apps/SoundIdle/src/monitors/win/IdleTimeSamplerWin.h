// IdleTimeSamplerWin.h
#ifndef IDLETIMESAMPLERWIN_H
#define IDLETIMESAMPLERWIN_H

#include "../IdleTimeSampler.h"

// GetLastInputInfo() against GetTickCount(), both on the 32-bit tick clock
class IdleTimeSamplerWin : public IdleTimeSampler
{
public:
    IdleTimeSamplerWin();
    ~IdleTimeSamplerWin() override;

    bool idleTime(quint64 &milliseconds) override;
};

#endif // IDLETIMESAMPLERWIN_H
