// Qt headers first: Xlib defines macros such as KeyPress and CursorShape
#include "logger/logger.h"
#include "IdleTimeSamplerLinux.h"
#include <cstdlib>

IdleTimeSamplerLinux::IdleTimeSamplerLinux()
    : m_display(nullptr)
    , m_info(nullptr)
{
}

IdleTimeSamplerLinux::~IdleTimeSamplerLinux()
{
    cleanupX11();
}

bool IdleTimeSamplerLinux::idleTime(quint64 &milliseconds)
{
    if (!m_display && !initializeX11()) {
        return false;
    }

    if (!XScreenSaverQueryInfo(m_display, DefaultRootWindow(m_display), m_info)) {
        setLastError(EngineError(EngineError::PlatformQuery, "Failed to read last input time",
                                 "XScreenSaverQueryInfo failed"));
        return false;
    }

    milliseconds = static_cast<quint64>(m_info->idle);
    return true;
}

bool IdleTimeSamplerLinux::initializeX11()
{
    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        const char *name = std::getenv("DISPLAY");
        setLastError(EngineError(EngineError::PlatformQuery, "Failed to open X display",
                                 QString("Cannot connect to display '%1'")
                                     .arg(name ? QString::fromLocal8Bit(name) : QString())));
        return false;
    }

    int eventBase = 0;
    int errorBase = 0;
    if (!XScreenSaverQueryExtension(m_display, &eventBase, &errorBase)) {
        setLastError(EngineError(EngineError::PlatformQuery, "Failed to read last input time",
                                 "MIT-SCREEN-SAVER extension is not available"));
        cleanupX11();
        return false;
    }

    m_info = XScreenSaverAllocInfo();
    if (!m_info) {
        setLastError(EngineError(EngineError::PlatformQuery, "Failed to read last input time",
                                 "Could not allocate XScreenSaverInfo"));
        cleanupX11();
        return false;
    }

    LOG_DEBUG(QString("Using X11 screensaver idle counter on %1")
                  .arg(QString::fromLocal8Bit(DisplayString(m_display))));
    return true;
}

void IdleTimeSamplerLinux::cleanupX11()
{
    if (m_info) {
        XFree(m_info);
        m_info = nullptr;
    }

    if (m_display) {
        XCloseDisplay(m_display);
        m_display = nullptr;
    }
}
