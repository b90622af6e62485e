#include "Vortex.hpp"

#include <cmath>
#include <random>

#include "Config.hpp"

namespace Neon
{
    float VortexParticle::radius() const
    {
        return baseRadius + wobbleAmplitude * std::sin(wobblePhase);
    }

    VortexField::VortexField(sf::Vector2f center, size_t count, unsigned int seed)
        : m_center(center)
    {
        std::default_random_engine rng(seed);
        std::uniform_real_distribution<float> angleDist(0.0f, TWO_PI);
        std::uniform_real_distribution<float> radiusDist(VORTEX_RADIUS_MIN, VORTEX_RADIUS_MAX);
        std::uniform_real_distribution<float> wobbleDist(0.0f, VORTEX_WOBBLE_MAX);

        m_particles.reserve(count);
        for (size_t i = 0; i < count; ++i)
        {
            VortexParticle p;
            p.angle = std::fmod(angleDist(rng), TWO_PI);
            p.baseRadius = radiusDist(rng);
            p.angularSpeed = VORTEX_ROTATION_SPEED;
            p.wobbleAmplitude = wobbleDist(rng);
            p.wobblePhase = std::fmod(angleDist(rng), TWO_PI);
            m_particles.push_back(p);
        }
    }

    void VortexField::advance()
    {
        for (VortexParticle& p : m_particles)
        {
            p.angle = std::fmod(p.angle + p.angularSpeed, TWO_PI);
            p.wobblePhase = std::fmod(p.wobblePhase + VORTEX_WOBBLE_SPEED, TWO_PI);
        }
    }

    sf::Vector2f VortexField::position(size_t i) const
    {
        const VortexParticle& p = m_particles[i];
        float r = p.radius();
        return sf::Vector2f(m_center.x + r * std::cos(p.angle),
            m_center.y + r * std::sin(p.angle));
    }
}
