// ComSession.h
#ifndef COMSESSION_H
#define COMSESSION_H

#include "../PlatformBackend.h"
#include <Windows.h>

/**
 * @brief Single-threaded COM apartment for the engine thread
 *
 * CoInitializeEx() in the constructor, CoUninitialize() in the destructor
 * when initialization succeeded. Must be destroyed on the thread that
 * created it.
 */
class ComSession : public PlatformSession
{
public:
    ComSession();
    ~ComSession() override;

    bool isOpen() const override;

    // FormatMessage text for an HRESULT / Win32 error, empty when none exists
    static QString systemMessage(DWORD code);
    static EngineError hresultError(EngineError::Kind kind, const QString &context, HRESULT hr);

private:
    bool m_shouldUninitialize;
};

#endif // COMSESSION_H
