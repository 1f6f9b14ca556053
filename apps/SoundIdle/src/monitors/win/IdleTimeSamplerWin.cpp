#include "IdleTimeSamplerWin.h"
#include "ComSession.h"
#include <Windows.h>

IdleTimeSamplerWin::IdleTimeSamplerWin()
{
}

IdleTimeSamplerWin::~IdleTimeSamplerWin()
{
}

bool IdleTimeSamplerWin::idleTime(quint64 &milliseconds)
{
    LASTINPUTINFO lii;
    lii.cbSize = sizeof(LASTINPUTINFO);
    lii.dwTime = 0;

    if (!GetLastInputInfo(&lii)) {
        DWORD code = GetLastError();
        setLastError(EngineError(EngineError::PlatformQuery, "Failed to read last input time",
                                 ComSession::systemMessage(code), code));
        return false;
    }

    // dwTime is a GetTickCount() value; compare on that clock, not GetTickCount64()
    DWORD tickCount = GetTickCount();
    milliseconds = elapsedSince(tickCount, lii.dwTime);
    return true;
}
