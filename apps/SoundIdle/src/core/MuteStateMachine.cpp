#include "MuteStateMachine.h"
#include "../monitors/AudioController.h"
#include "logger/logger.h"

#include <cmath>

MuteStateMachine::MuteStateMachine(AudioController &controller)
    : m_controller(controller)
    , m_state(Normal)
{
}

bool MuteStateMachine::update(quint64 idleMilliseconds, quint64 thresholdMilliseconds)
{
    const bool idle = idleMilliseconds >= thresholdMilliseconds;

    if (idle && m_state == Normal) {
        LOG_INFO(QString("No input for %1 s (threshold %2 s), lowering audio")
                     .arg(idleMilliseconds / 1000)
                     .arg(thresholdMilliseconds / 1000));
        return lower();
    }

    if (!idle && m_state == Lowered) {
        LOG_INFO(QString("Input detected after %1 ms idle, restoring audio").arg(idleMilliseconds));
        return restore();
    }

    return true;
}

bool MuteStateMachine::lower()
{
    AudioSnapshot snapshot;
    if (!m_controller.currentVolume(snapshot.volume)) {
        return fail();
    }
    if (!m_controller.currentMute(snapshot.muted)) {
        return fail();
    }

    m_snapshot = snapshot;
    LOG_DEBUG(QString("Saved audio state: volume %1, muted %2")
                  .arg(static_cast<double>(snapshot.volume), 0, 'f', 2)
                  .arg(snapshot.muted ? "yes" : "no"));

    if (!snapshot.muted && !m_controller.setMute(true)) {
        return fail();
    }

    if (std::fabs(snapshot.volume - QuietLevel) > VolumeTolerance &&
        !m_controller.setVolume(QuietLevel)) {
        return fail();
    }

    m_state = Lowered;
    LOG_INFO("Audio lowered");
    return true;
}

bool MuteStateMachine::restore()
{
    if (m_state != Lowered) {
        return true;
    }

    if (!m_controller.setVolume(m_snapshot.volume)) {
        return fail();
    }

    // A session the user muted before we stepped in stays muted
    if (!m_snapshot.muted && !m_controller.setMute(false)) {
        return fail();
    }

    m_state = Normal;
    LOG_INFO(QString("Audio restored: volume %1, muted %2")
                 .arg(static_cast<double>(m_snapshot.volume), 0, 'f', 2)
                 .arg(m_snapshot.muted ? "yes" : "no"));
    return true;
}

bool MuteStateMachine::fail()
{
    m_lastError = m_controller.lastError();
    return false;
}

QString MuteStateMachine::stateName(State state)
{
    return state == Lowered ? "LOWERED" : "NORMAL";
}
