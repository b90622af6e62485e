#include "NeonTrail.hpp"

#include <algorithm>
#include <cmath>

namespace Neon
{
    TrailBuffer::TrailBuffer(size_t capacity) : m_capacity(capacity)
    {
        m_points.reserve(capacity + 1);
    }

    void TrailBuffer::push(const sf::Vector2f& p)
    {
        if (m_capacity == 0)
            return;

        m_points.push_back(p);
        if (m_points.size() > m_capacity)
        {
            const size_t removeCount = m_points.size() - m_capacity;
            m_points.erase(m_points.begin(), m_points.begin() + removeCount);
        }
    }

    Rgb interpolateColor(const Rgb& c1, const Rgb& c2, float t)
    {
        t = std::max(0.0f, std::min(1.0f, t));
        Rgb c = {
            (sf::Uint8)((float)c1.r * (1.0f - t) + (float)c2.r * t),
            (sf::Uint8)((float)c1.g * (1.0f - t) + (float)c2.g * t),
            (sf::Uint8)((float)c1.b * (1.0f - t) + (float)c2.b * t)
        };
        return c;
    }

    float trailAge(size_t index, size_t count)
    {
        if (count <= 1)
            return 1.0f;
        return (float)index / (float)(count - 1);
    }

    Rgb trailColor(size_t index, size_t count)
    {
        return interpolateColor(PURPLE, CYAN, trailAge(index, count));
    }

    // Newer segments more opaque
    sf::Uint8 trailAlpha(size_t index, size_t count)
    {
        if (count == 0)
            return 0;
        size_t i = std::min(index, count - 1);
        return (sf::Uint8)(255u * (i + 1) / count);
    }

    int trailWidth(size_t index, size_t count)
    {
        return 1 + (int)std::lround(trailAge(index, count) * (float)(TRAIL_MAX_WIDTH - 1));
    }
}
