// PulseSession.h
#ifndef PULSESESSION_H
#define PULSESESSION_H

#include "../PlatformBackend.h"
#include <pulse/pulseaudio.h>

/**
 * @brief Blocking PulseAudio connection owned by the engine thread
 *
 * Connects a context on a private pa_mainloop in the constructor and
 * disconnects and frees both in the destructor. Operations are driven to
 * completion with waitFor(), so callers see a synchronous API.
 */
class PulseSession : public PlatformSession
{
public:
    PulseSession();
    ~PulseSession() override;

    bool isOpen() const override;

    pa_context* context() const { return m_context; }

    /**
     * @brief Iterates the main loop until the operation is done
     * @param op Operation returned by a pa_context_* call; unreferenced here
     * @return False when op is null or the context failed meanwhile
     */
    bool waitFor(pa_operation *op);

    // Error built from pa_context_errno()
    EngineError contextError(EngineError::Kind kind, const QString &context) const;

private:
    pa_mainloop* m_mainloop;
    pa_context* m_context;
    bool m_ready;

    bool waitReady();
};

#endif // PULSESESSION_H
