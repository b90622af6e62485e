#include "AnimationTimer.hpp"

namespace Neon
{
    AnimationTimer::AnimationTimer(sf::Time duration)
        : m_duration(duration), m_state(STATE_RUNNING), m_reason(STOP_NONE)
    {
    }

    RunState AnimationTimer::update(sf::Time elapsed)
    {
        if (m_state == STATE_RUNNING && elapsed >= m_duration)
        {
            m_state = STATE_STOPPED;
            m_reason = STOP_TIME_LIMIT;
        }
        return m_state;
    }

    void AnimationTimer::requestStop()
    {
        if (m_state == STATE_STOPPED)
            return;

        m_state = STATE_STOPPED;
        m_reason = STOP_USER;
    }

    sf::Time AnimationTimer::remaining(sf::Time elapsed) const
    {
        if (elapsed >= m_duration)
            return sf::Time::Zero;
        return m_duration - elapsed;
    }

    const char* stopReasonName(StopReason reason)
    {
        switch (reason)
        {
        case STOP_TIME_LIMIT: return "time limit";
        case STOP_USER:       return "user exit";
        default:              return "running";
        }
    }
}
