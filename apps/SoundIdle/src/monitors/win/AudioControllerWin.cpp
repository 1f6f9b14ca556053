#include "AudioControllerWin.h"
#include "ComSession.h"
#include "logger/logger.h"

AudioControllerWin::AudioControllerWin()
    : m_enumerator(NULL)
    , m_device(NULL)
    , m_endpointVolume(NULL)
{
}

AudioControllerWin::~AudioControllerWin()
{
    release();
}

bool AudioControllerWin::initialize()
{
    LOG_INFO("Resolving default audio render endpoint");

    HRESULT hr = CoCreateInstance(__uuidof(MMDeviceEnumerator), NULL, CLSCTX_ALL,
                                  __uuidof(IMMDeviceEnumerator),
                                  reinterpret_cast<void**>(&m_enumerator));
    if (FAILED(hr)) {
        return fail(EngineError::PlatformSession, "Failed to create device enumerator", hr);
    }

    hr = m_enumerator->GetDefaultAudioEndpoint(eRender, eConsole, &m_device);
    if (FAILED(hr)) {
        return fail(EngineError::PlatformSession, "Failed to get default audio device", hr);
    }

    hr = m_device->Activate(__uuidof(IAudioEndpointVolume), CLSCTX_ALL, NULL,
                            reinterpret_cast<void**>(&m_endpointVolume));
    if (FAILED(hr)) {
        return fail(EngineError::PlatformSession, "Failed to activate volume control", hr);
    }

    LPWSTR deviceId = NULL;
    if (SUCCEEDED(m_device->GetId(&deviceId)) && deviceId) {
        m_endpointId = QString::fromWCharArray(deviceId);
        CoTaskMemFree(deviceId);
    }

    LOG_INFO(QString("Default audio endpoint: %1").arg(m_endpointId));
    return true;
}

QString AudioControllerWin::endpointName() const
{
    return m_endpointId;
}

bool AudioControllerWin::currentVolume(float &level)
{
    HRESULT hr = m_endpointVolume->GetMasterVolumeLevelScalar(&level);
    if (FAILED(hr)) {
        return fail(EngineError::AudioQuery, "Failed to read master volume", hr);
    }
    return true;
}

bool AudioControllerWin::currentMute(bool &muted)
{
    BOOL value = FALSE;
    HRESULT hr = m_endpointVolume->GetMute(&value);
    if (FAILED(hr)) {
        return fail(EngineError::AudioQuery, "Failed to read mute state", hr);
    }
    muted = (value != FALSE);
    return true;
}

bool AudioControllerWin::setMute(bool muted)
{
    HRESULT hr = m_endpointVolume->SetMute(muted ? TRUE : FALSE, NULL);
    if (FAILED(hr)) {
        return fail(EngineError::AudioCommand, "Failed to change mute state", hr);
    }
    return true;
}

bool AudioControllerWin::applyVolume(float level)
{
    HRESULT hr = m_endpointVolume->SetMasterVolumeLevelScalar(level, NULL);
    if (FAILED(hr)) {
        return fail(EngineError::AudioCommand, "Failed to change master volume", hr);
    }
    return true;
}

bool AudioControllerWin::fail(EngineError::Kind kind, const QString &context, HRESULT hr)
{
    setLastError(ComSession::hresultError(kind, context, hr));
    return false;
}

void AudioControllerWin::release()
{
    if (m_endpointVolume) {
        m_endpointVolume->Release();
        m_endpointVolume = NULL;
    }
    if (m_device) {
        m_device->Release();
        m_device = NULL;
    }
    if (m_enumerator) {
        m_enumerator->Release();
        m_enumerator = NULL;
    }
}
