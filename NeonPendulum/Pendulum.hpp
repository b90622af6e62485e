#ifndef NEONPENDULUM_PENDULUM_HPP
#define NEONPENDULUM_PENDULUM_HPP

#include <SFML/System/Vector2.hpp>

namespace Neon
{
    /**
     * @brief Simple damped pendulum, integrated once per frame.
     *
     * Units are per frame: angularVelocity in rad/frame, gravity in px/frame^2.
     * angle = 0 hangs straight down from the pivot.
     */
    struct PendulumState
    {
        float        angle;
        float        angularVelocity;
        float        angularAcceleration;
        sf::Vector2f pivot;
        float        length;
        float        gravity;
        float        damping;   // velocity multiplier, 0 < damping < 1
    };

    PendulumState makePendulum();
    PendulumState makePendulum(float angle, float angularVelocity);

    // a = -(g / L) * sin(theta);  v += a;  v *= damping;  theta += v
    PendulumState stepPendulum(const PendulumState& s);

    sf::Vector2f bobPosition(const PendulumState& s);

    // Linear speed of the bob in px/frame
    float bobSpeed(const PendulumState& s);
}

#endif // NEONPENDULUM_PENDULUM_HPP
