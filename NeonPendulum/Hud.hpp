#ifndef NEONPENDULUM_HUD_HPP
#define NEONPENDULUM_HUD_HPP

#include <SFML/Graphics.hpp>

#include "Pendulum.hpp"

namespace Neon
{
    // Text overlay drawn on top of the blitted frame. Disabled if the font is missing.
    class Hud
    {
    public:
        explicit Hud(const char* fontPath);

        bool enabled() const { return m_fontLoaded; }
        void draw(sf::RenderWindow& window, const PendulumState& pendulum,
            sf::Time remaining);

    private:
        void drawLine(sf::RenderWindow& window, const char* str, unsigned int size,
            sf::Color color, float x, float y);

        sf::Font m_font;
        bool     m_fontLoaded;
    };
}

#endif // NEONPENDULUM_HUD_HPP
