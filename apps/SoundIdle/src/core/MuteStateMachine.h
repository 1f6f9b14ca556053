#ifndef MUTESTATEMACHINE_H
#define MUTESTATEMACHINE_H

#include <QtGlobal>
#include "EngineError.h"

class AudioController;

/**
 * @brief Audio state captured when the output is lowered
 */
struct AudioSnapshot
{
    float volume = 1.0f;
    bool muted = false;
};

/**
 * @brief Two-state machine that silences the default output while idle
 *
 * Normal -> Lowered once idle time reaches the threshold: the current volume
 * and mute flag are saved, the endpoint is muted and brought to the quiet
 * level. Lowered -> Normal once input is seen again: the saved volume comes
 * back, and mute is cleared only if the user had not muted it themselves.
 *
 * Platform calls happen only on a transition. A failed call aborts the
 * transition, leaves the state unchanged and is reported by lastError().
 */
class MuteStateMachine
{
public:
    enum State {
        Normal = 0,
        Lowered = 1
    };

    static constexpr float QuietLevel = 0.0f;
    // Volumes this close to QuietLevel are already quiet, no command is sent
    static constexpr float VolumeTolerance = 0.02f;

    explicit MuteStateMachine(AudioController &controller);

    /**
     * @brief Evaluates one tick
     * @param idleMilliseconds Current input idle time
     * @param thresholdMilliseconds Idle time at which the output is lowered
     * @return False when a platform call failed
     */
    bool update(quint64 idleMilliseconds, quint64 thresholdMilliseconds);

    // Brings a lowered output back to the snapshot; no-op in Normal
    bool restore();

    State state() const { return m_state; }
    AudioSnapshot snapshot() const { return m_snapshot; }
    EngineError lastError() const { return m_lastError; }

    static QString stateName(State state);

private:
    bool lower();
    bool fail();

    AudioController &m_controller;
    State m_state;
    AudioSnapshot m_snapshot;
    EngineError m_lastError;
};

#endif // MUTESTATEMACHINE_H
