#include "AudioControllerLinux.h"
#include "logger/logger.h"

#include <cmath>

namespace {

struct ServerInfoRequest {
    QByteArray defaultSink;
    bool done = false;
};

struct SuccessRequest {
    bool success = false;
};

void onSuccess(pa_context*, int success, void *userdata)
{
    static_cast<SuccessRequest*>(userdata)->success = (success != 0);
}

} // namespace

AudioControllerLinux::AudioControllerLinux(PulseSession &session)
    : m_session(session)
    , m_channels(0)
{
    pa_cvolume_init(&m_balance);
}

AudioControllerLinux::~AudioControllerLinux()
{
}

bool AudioControllerLinux::initialize()
{
    LOG_INFO("Resolving default PulseAudio sink");

    ServerInfoRequest request;
    pa_operation *op = pa_context_get_server_info(m_session.context(),
        [](pa_context*, const pa_server_info *info, void *userdata) {
            auto *req = static_cast<ServerInfoRequest*>(userdata);
            if (info && info->default_sink_name) {
                req->defaultSink = QByteArray(info->default_sink_name);
            }
            req->done = true;
        }, &request);

    if (!m_session.waitFor(op) || !request.done) {
        return fail(EngineError::PlatformSession, "Failed to query PulseAudio server info");
    }

    if (request.defaultSink.isEmpty()) {
        setLastError(EngineError(EngineError::PlatformSession, "Failed to get default audio device",
                                 "No default sink is configured"));
        return false;
    }

    m_sinkName = request.defaultSink;

    SinkState state;
    if (!querySink(state, "Failed to read default sink")) {
        // Missing sink at startup is a session failure, not a query failure
        EngineError error = lastError();
        setLastError(EngineError(EngineError::PlatformSession, error.context(), error.message(), error.code()));
        return false;
    }

    m_channels = state.volume.channels;
    m_balance = state.volume;
    m_description = state.description;

    LOG_INFO(QString("Default audio endpoint: %1 (%2, %3 channels)")
                 .arg(m_description, QString::fromUtf8(m_sinkName))
                 .arg(m_channels));
    return true;
}

QString AudioControllerLinux::endpointName() const
{
    return m_description.isEmpty() ? QString::fromUtf8(m_sinkName) : m_description;
}

bool AudioControllerLinux::currentVolume(float &level)
{
    SinkState state;
    if (!querySink(state, "Failed to read master volume")) {
        return false;
    }

    // Silent reads carry no balance, keep the last audible one
    if (pa_cvolume_avg(&state.volume) > PA_VOLUME_MUTED) {
        m_balance = state.volume;
    }

    level = clampLevel(static_cast<float>(pa_cvolume_avg(&state.volume)) /
                       static_cast<float>(PA_VOLUME_NORM));
    return true;
}

bool AudioControllerLinux::currentMute(bool &muted)
{
    SinkState state;
    if (!querySink(state, "Failed to read mute state")) {
        return false;
    }

    muted = state.muted;
    return true;
}

bool AudioControllerLinux::setMute(bool muted)
{
    SuccessRequest request;
    pa_operation *op = pa_context_set_sink_mute_by_name(m_session.context(), m_sinkName.constData(),
                                                        muted ? 1 : 0, onSuccess, &request);

    if (!m_session.waitFor(op) || !request.success) {
        return fail(EngineError::AudioCommand, "Failed to change mute state");
    }
    return true;
}

bool AudioControllerLinux::applyVolume(float level)
{
    pa_cvolume volume = channelVolumes(m_balance, m_channels, level);

    SuccessRequest request;
    pa_operation *op = pa_context_set_sink_volume_by_name(m_session.context(), m_sinkName.constData(),
                                                          &volume, onSuccess, &request);

    if (!m_session.waitFor(op) || !request.success) {
        return fail(EngineError::AudioCommand, "Failed to change master volume");
    }
    return true;
}

pa_cvolume AudioControllerLinux::channelVolumes(const pa_cvolume &balance, quint8 channels, float level)
{
    const double target = std::round(static_cast<double>(clampLevel(level)) * PA_VOLUME_NORM);

    pa_cvolume volume;
    pa_cvolume_init(&volume);

    if (!pa_cvolume_valid(&balance) || pa_cvolume_avg(&balance) == PA_VOLUME_MUTED) {
        pa_cvolume_set(&volume, channels > 0 ? channels : 2, static_cast<pa_volume_t>(target));
        return volume;
    }

    const double average = static_cast<double>(pa_cvolume_avg(&balance));
    volume.channels = balance.channels;
    for (quint8 i = 0; i < balance.channels; ++i) {
        double value = std::round(static_cast<double>(balance.values[i]) * target / average);
        if (value > PA_VOLUME_MAX) {
            value = PA_VOLUME_MAX;
        }
        volume.values[i] = static_cast<pa_volume_t>(value);
    }
    return volume;
}

bool AudioControllerLinux::querySink(SinkState &state, const QString &context)
{
    pa_cvolume_init(&state.volume);

    pa_operation *op = pa_context_get_sink_info_by_name(m_session.context(), m_sinkName.constData(),
        [](pa_context*, const pa_sink_info *info, int eol, void *userdata) {
            if (eol || !info) {
                return;
            }
            auto *sink = static_cast<SinkState*>(userdata);
            sink->found = true;
            sink->volume = info->volume;
            sink->muted = (info->mute != 0);
            sink->description = QString::fromUtf8(info->description);
        }, &state);

    if (!m_session.waitFor(op)) {
        return fail(EngineError::AudioQuery, context);
    }

    if (!state.found) {
        setLastError(EngineError(EngineError::AudioQuery, context,
                                 QString("Sink %1 no longer exists").arg(QString::fromUtf8(m_sinkName))));
        return false;
    }
    return true;
}

bool AudioControllerLinux::fail(EngineError::Kind kind, const QString &context)
{
    setLastError(m_session.contextError(kind, context));
    return false;
}
