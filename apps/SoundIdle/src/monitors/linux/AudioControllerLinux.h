// AudioControllerLinux.h
#ifndef AUDIOCONTROLLERLINUX_H
#define AUDIOCONTROLLERLINUX_H

#include "../AudioController.h"
#include "PulseSession.h"
#include <QByteArray>

/**
 * @brief Master volume and mute of the PulseAudio default sink
 *
 * The sink name is taken from the server's default once, in initialize().
 * Volume is the channel average relative to PA_VOLUME_NORM; levels above
 * 100% are reported as 1.0. The per-channel balance of the last read is kept
 * and reapplied when a level is set, so a saved level restores every channel.
 */
class AudioControllerLinux : public AudioController
{
public:
    explicit AudioControllerLinux(PulseSession &session);
    ~AudioControllerLinux() override;

    bool initialize() override;
    QString endpointName() const override;

    bool currentVolume(float &level) override;
    bool currentMute(bool &muted) override;
    bool setMute(bool muted) override;

    /**
     * @brief Per-channel volumes for a master level
     * @param balance Channel volumes whose ratios are kept; an invalid or
     *        silent balance gives the same value on every channel
     * @param channels Channel count used when balance is unusable
     * @param level Target channel average, 0..1
     */
    static pa_cvolume channelVolumes(const pa_cvolume &balance, quint8 channels, float level);

protected:
    bool applyVolume(float level) override;

private:
    struct SinkState {
        bool found = false;
        pa_cvolume volume;
        bool muted = false;
        QString description;
    };

    PulseSession &m_session;
    QByteArray m_sinkName;
    QString m_description;
    quint8 m_channels;
    pa_cvolume m_balance;

    bool querySink(SinkState &state, const QString &context);
    bool fail(EngineError::Kind kind, const QString &context);
};

#endif // AUDIOCONTROLLERLINUX_H
