#include "ComSession.h"
#include "logger/logger.h"
#include <objbase.h>

ComSession::ComSession()
    : m_shouldUninitialize(false)
{
    HRESULT hr = CoInitializeEx(NULL, COINIT_APARTMENTTHREADED);

    if (FAILED(hr)) {
        setLastError(hresultError(EngineError::PlatformSession, "Failed to initialize COM", hr));
        return;
    }

    // S_FALSE means the apartment already existed, it still needs a balancing uninit
    m_shouldUninitialize = true;
    LOG_DEBUG("COM apartment initialized");
}

ComSession::~ComSession()
{
    if (m_shouldUninitialize) {
        CoUninitialize();
        LOG_DEBUG("COM apartment released");
    }
}

bool ComSession::isOpen() const
{
    return m_shouldUninitialize;
}

QString ComSession::systemMessage(DWORD code)
{
    LPWSTR buffer = NULL;
    DWORD length = FormatMessageW(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                                  FORMAT_MESSAGE_IGNORE_INSERTS,
                                  NULL, code, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                                  reinterpret_cast<LPWSTR>(&buffer), 0, NULL);

    QString message;
    if (length > 0 && buffer) {
        message = QString::fromWCharArray(buffer, static_cast<int>(length)).trimmed();
    }
    if (buffer) {
        LocalFree(buffer);
    }
    return message;
}

EngineError ComSession::hresultError(EngineError::Kind kind, const QString &context, HRESULT hr)
{
    return EngineError(kind, context, systemMessage(static_cast<DWORD>(hr)),
                       static_cast<qint64>(static_cast<quint32>(hr)));
}
