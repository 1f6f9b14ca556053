#include "PlatformBackend.h"

// Include platform-specific implementations based on compiler defines
#ifdef Q_OS_WIN
#include "win/PlatformBackendWin.h"
#elif defined(Q_OS_LINUX)
#include "linux/PlatformBackendLinux.h"
#else
#include "unsupported/PlatformBackendUnsupported.h"
#endif

PlatformSession::PlatformSession()
{
}

PlatformSession::~PlatformSession()
{
}

EngineError PlatformSession::lastError() const
{
    return m_lastError;
}

void PlatformSession::setLastError(const EngineError &error)
{
    m_lastError = error;
}

PlatformBackend::PlatformBackend()
{
}

PlatformBackend::~PlatformBackend()
{
}

EngineError PlatformBackend::unsupportedError(const QString &context)
{
    return EngineError(EngineError::UnsupportedPlatform, context,
                       "Sound inactivity monitoring is unsupported on this platform");
}

std::unique_ptr<PlatformBackend> createPlatformBackend()
{
#ifdef Q_OS_WIN
    return std::unique_ptr<PlatformBackend>(new PlatformBackendWin());
#elif defined(Q_OS_LINUX)
    return std::unique_ptr<PlatformBackend>(new PlatformBackendLinux());
#else
    return std::unique_ptr<PlatformBackend>(new PlatformBackendUnsupported());
#endif
}
