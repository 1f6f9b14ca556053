#include "PulseSession.h"
#include "logger/logger.h"

PulseSession::PulseSession()
    : m_mainloop(nullptr)
    , m_context(nullptr)
    , m_ready(false)
{
    m_mainloop = pa_mainloop_new();
    if (!m_mainloop) {
        setLastError(EngineError(EngineError::PlatformSession, "Failed to create PulseAudio main loop"));
        return;
    }

    m_context = pa_context_new(pa_mainloop_get_api(m_mainloop), "soundidle");
    if (!m_context) {
        setLastError(EngineError(EngineError::PlatformSession, "Failed to create PulseAudio context"));
        return;
    }

    if (pa_context_connect(m_context, nullptr, PA_CONTEXT_NOFLAGS, nullptr) < 0) {
        setLastError(contextError(EngineError::PlatformSession, "Failed to connect to PulseAudio"));
        return;
    }

    if (!waitReady()) {
        setLastError(contextError(EngineError::PlatformSession, "PulseAudio connection failed"));
        return;
    }

    m_ready = true;
    LOG_DEBUG(QString("Connected to PulseAudio server %1")
                  .arg(QString::fromUtf8(pa_context_get_server(m_context))));
}

PulseSession::~PulseSession()
{
    if (m_context) {
        if (m_ready) {
            pa_context_disconnect(m_context);
        }
        pa_context_unref(m_context);
        m_context = nullptr;
    }

    if (m_mainloop) {
        pa_mainloop_free(m_mainloop);
        m_mainloop = nullptr;
    }

    if (m_ready) {
        LOG_DEBUG("PulseAudio session released");
    }
}

bool PulseSession::isOpen() const
{
    return m_ready;
}

bool PulseSession::waitReady()
{
    while (true) {
        if (pa_mainloop_iterate(m_mainloop, 1, nullptr) < 0) {
            return false;
        }
        pa_context_state_t state = pa_context_get_state(m_context);
        if (state == PA_CONTEXT_READY) {
            return true;
        }
        if (!PA_CONTEXT_IS_GOOD(state)) {
            return false;
        }
    }
}

bool PulseSession::waitFor(pa_operation *op)
{
    if (!op) {
        return false;
    }

    bool ok = true;
    while (pa_operation_get_state(op) == PA_OPERATION_RUNNING) {
        if (pa_mainloop_iterate(m_mainloop, 1, nullptr) < 0 ||
            !PA_CONTEXT_IS_GOOD(pa_context_get_state(m_context))) {
            pa_operation_cancel(op);
            ok = false;
            break;
        }
    }

    pa_operation_unref(op);
    return ok;
}

EngineError PulseSession::contextError(EngineError::Kind kind, const QString &context) const
{
    if (!m_context) {
        return EngineError(kind, context);
    }

    int code = pa_context_errno(m_context);
    return EngineError(kind, context, QString::fromUtf8(pa_strerror(code)), code);
}
