#ifndef NEONPENDULUM_ANIMATIONTIMER_HPP
#define NEONPENDULUM_ANIMATIONTIMER_HPP

#include <SFML/System/Time.hpp>

namespace Neon
{
    enum RunState
    {
        STATE_RUNNING,
        STATE_STOPPED
    };

    enum StopReason
    {
        STOP_NONE,
        STOP_TIME_LIMIT,
        STOP_USER
    };

    /**
     * @brief RUNNING -> STOPPED, one way.
     *
     * Stops once elapsed time reaches the duration, or on requestStop().
     */
    class AnimationTimer
    {
    public:
        explicit AnimationTimer(sf::Time duration);

        RunState update(sf::Time elapsed);
        void requestStop();

        RunState   state() const { return m_state; }
        StopReason reason() const { return m_reason; }
        bool       isRunning() const { return m_state == STATE_RUNNING; }
        sf::Time   duration() const { return m_duration; }
        sf::Time   remaining(sf::Time elapsed) const;

    private:
        sf::Time   m_duration;
        RunState   m_state;
        StopReason m_reason;
    };

    const char* stopReasonName(StopReason reason);
}

#endif // NEONPENDULUM_ANIMATIONTIMER_HPP
