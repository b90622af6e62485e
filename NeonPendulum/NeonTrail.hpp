#ifndef NEONPENDULUM_NEONTRAIL_HPP
#define NEONPENDULUM_NEONTRAIL_HPP

#include <SFML/Config.hpp>
#include <SFML/System/Vector2.hpp>

#include <cstddef>
#include <vector>

#include "Config.hpp"

namespace Neon
{
    /**
     * @brief Bounded history of bob positions, oldest first.
     *
     * Pushing past capacity drops entries from the front, so index 0 is
     * always the oldest point and index size()-1 the newest.
     */
    class TrailBuffer
    {
    public:
        explicit TrailBuffer(size_t capacity = TRAIL_LENGTH);

        void push(const sf::Vector2f& p);
        void clear() { m_points.clear(); }

        size_t size() const { return m_points.size(); }
        size_t capacity() const { return m_capacity; }
        bool   empty() const { return m_points.empty(); }

        const sf::Vector2f& operator[](size_t i) const { return m_points[i]; }
        const sf::Vector2f& newest() const { return m_points.back(); }
        const std::vector<sf::Vector2f>& points() const { return m_points; }

    private:
        size_t m_capacity;
        std::vector<sf::Vector2f> m_points;
    };

    // Linear blend, t clamped to [0, 1]
    Rgb interpolateColor(const Rgb& c1, const Rgb& c2, float t);

    // Age parameter: 0 for the oldest point, 1 for the newest
    float trailAge(size_t index, size_t count);

    // Purple (oldest) -> cyan (newest)
    Rgb       trailColor(size_t index, size_t count);
    sf::Uint8 trailAlpha(size_t index, size_t count);
    int       trailWidth(size_t index, size_t count);
}

#endif // NEONPENDULUM_NEONTRAIL_HPP
