#include "Pendulum.hpp"

#include <cmath>

#include "Config.hpp"

namespace Neon
{
    PendulumState makePendulum()
    {
        return makePendulum(INITIAL_ANGLE, 0.0f);
    }

    PendulumState makePendulum(float angle, float angularVelocity)
    {
        PendulumState s;
        s.angle = angle;
        s.angularVelocity = angularVelocity;
        s.angularAcceleration = 0.0f;
        s.pivot = sf::Vector2f(PIVOT_X, PIVOT_Y);
        s.length = PENDULUM_LENGTH;
        s.gravity = GRAVITY;
        s.damping = DAMPING;
        return s;
    }

    PendulumState stepPendulum(const PendulumState& s)
    {
        PendulumState next = s;
        next.angularAcceleration = -(s.gravity / s.length) * std::sin(s.angle);
        next.angularVelocity += next.angularAcceleration;
        next.angularVelocity *= s.damping;
        next.angle += next.angularVelocity;
        return next;
    }

    sf::Vector2f bobPosition(const PendulumState& s)
    {
        return sf::Vector2f(s.pivot.x + s.length * std::sin(s.angle),
            s.pivot.y + s.length * std::cos(s.angle));
    }

    float bobSpeed(const PendulumState& s)
    {
        return std::abs(s.angularVelocity) * s.length;
    }
}
