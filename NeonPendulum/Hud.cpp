#include "Hud.hpp"

#include <cstdio>
#include <iostream>

#include "Config.hpp"

namespace Neon
{
    Hud::Hud(const char* fontPath) : m_fontLoaded(false)
    {
        if (!m_font.loadFromFile(fontPath))
        {
            std::cout << "Warning: Could not load font " << fontPath << ". HUD disabled.\n";
        }
        else
        {
            m_fontLoaded = true;
        }
    }

    void Hud::drawLine(sf::RenderWindow& window, const char* str, unsigned int size,
        sf::Color color, float x, float y)
    {
        sf::Text t;
        t.setFont(m_font);
        t.setString(str);
        t.setCharacterSize(size);
        t.setFillColor(color);
        t.setPosition(x, y);
        window.draw(t);
    }

    void Hud::draw(sf::RenderWindow& window, const PendulumState& pendulum, sf::Time remaining)
    {
        if (!m_fontLoaded)
            return;

        drawLine(window, "NEON PENDULUM", 11, sf::Color(70, 70, 90),
            (float)WIN_W * 0.5f - 45.0f, 10.0f);

        char buf[128];
        std::snprintf(buf, sizeof(buf), "theta: %.1f deg   omega: %.4f   speed: %.2f px/f",
            pendulum.angle * RAD2DEG, pendulum.angularVelocity, bobSpeed(pendulum));
        drawLine(window, buf, 13, sf::Color(0, 200, 200), 14.0f, (float)(WIN_H - 38));

        std::snprintf(buf, sizeof(buf), "time left: %.1fs", remaining.asSeconds());
        drawLine(window, buf, 13, sf::Color(150, 60, 150), 14.0f, (float)(WIN_H - 18));

        drawLine(window, "Esc to quit", 10, sf::Color(40, 40, 55),
            (float)WIN_W - 80.0f, (float)(WIN_H - 18));
    }
}
