#ifndef NEONPENDULUM_PIXELCANVAS_HPP
#define NEONPENDULUM_PIXELCANVAS_HPP

#include <SFML/Config.hpp>
#include <SFML/System/Vector2.hpp>

#include <vector>

#include "Config.hpp"

namespace Neon
{
    /**
     * @brief Raw RGBA frame buffer. Every pixel is written manually.
     *
     * Blit path: pixels() -> sf::Image::create -> sf::Texture -> draw.
     * Writes outside the buffer are clipped silently.
     */
    class PixelCanvas
    {
    public:
        PixelCanvas(unsigned int width, unsigned int height);

        unsigned int width() const { return m_width; }
        unsigned int height() const { return m_height; }
        const sf::Uint8* pixels() const { return m_pixels.data(); }

        void clear(const Rgb& c);

        // Alpha-blend onto existing pixel
        void setPixel(int x, int y, const Rgb& c, sf::Uint8 a = 255);
        Rgb  pixelAt(int x, int y) const;
        sf::Uint8 alphaAt(int x, int y) const;

        void line(int x0, int y0, int x1, int y1, const Rgb& c, sf::Uint8 a = 255);
        void thickLine(int x0, int y0, int x1, int y1, int thickness,
            const Rgb& c, sf::Uint8 a = 255);

        void circle(int cx, int cy, int radius, const Rgb& c, sf::Uint8 a = 255);
        void fillCircle(int cx, int cy, int radius, const Rgb& c, sf::Uint8 a = 255);
        void glowRing(int cx, int cy, int radius, const Rgb& c, float peakAlpha);

        // Even-odd scanline fill; vertices in any winding order
        void fillPolygon(const std::vector<sf::Vector2f>& vertices,
            const Rgb& c, sf::Uint8 a = 255);

    private:
        bool inside(int x, int y) const
        {
            return x >= 0 && y >= 0 && x < (int)m_width && y < (int)m_height;
        }

        unsigned int m_width;
        unsigned int m_height;
        std::vector<sf::Uint8> m_pixels;
    };
}

#endif // NEONPENDULUM_PIXELCANVAS_HPP
