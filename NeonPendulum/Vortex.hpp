#ifndef NEONPENDULUM_VORTEX_HPP
#define NEONPENDULUM_VORTEX_HPP

#include <SFML/System/Vector2.hpp>

#include <cstddef>
#include <vector>

namespace Neon
{
    struct VortexParticle
    {
        float baseRadius;
        float angle;            // [0, 2pi)
        float angularSpeed;     // rad / frame
        float wobbleAmplitude;  // px
        float wobblePhase;

        float radius() const;
    };

    /**
     * @brief Background particles orbiting a fixed centre.
     *
     * The particle count is fixed at construction. The same seed always
     * produces the same field.
     */
    class VortexField
    {
    public:
        VortexField(sf::Vector2f center, size_t count, unsigned int seed);

        void advance();

        sf::Vector2f center() const { return m_center; }
        size_t size() const { return m_particles.size(); }
        const VortexParticle& operator[](size_t i) const { return m_particles[i]; }
        sf::Vector2f position(size_t i) const;

    private:
        sf::Vector2f m_center;
        std::vector<VortexParticle> m_particles;
    };
}

#endif // NEONPENDULUM_VORTEX_HPP
