// AudioControllerWin.h
#ifndef AUDIOCONTROLLERWIN_H
#define AUDIOCONTROLLERWIN_H

#include "../AudioController.h"
#include <Windows.h>
#include <mmdeviceapi.h>
#include <endpointvolume.h>

#pragma comment(lib, "ole32.lib")

/**
 * @brief IAudioEndpointVolume of the default console render device
 *
 * Requires a ComSession on the calling thread for its whole lifetime.
 */
class AudioControllerWin : public AudioController
{
public:
    AudioControllerWin();
    ~AudioControllerWin() override;

    bool initialize() override;
    QString endpointName() const override;

    bool currentVolume(float &level) override;
    bool currentMute(bool &muted) override;
    bool setMute(bool muted) override;

protected:
    bool applyVolume(float level) override;

private:
    IMMDeviceEnumerator* m_enumerator;
    IMMDevice* m_device;
    IAudioEndpointVolume* m_endpointVolume;
    QString m_endpointId;

    bool fail(EngineError::Kind kind, const QString &context, HRESULT hr);
    void release();
};

#endif // AUDIOCONTROLLERWIN_H
