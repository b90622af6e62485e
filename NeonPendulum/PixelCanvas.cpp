#include "PixelCanvas.hpp"

#include <algorithm>
#include <cmath>

namespace Neon
{
    PixelCanvas::PixelCanvas(unsigned int width, unsigned int height)
        : m_width(width), m_height(height), m_pixels(width * height * 4u, 0)
    {
    }

    void PixelCanvas::clear(const Rgb& c)
    {
        unsigned int total = m_width * m_height;
        for (unsigned int i = 0; i < total; ++i)
        {
            unsigned int base = i * 4u;
            m_pixels[base + 0] = c.r;
            m_pixels[base + 1] = c.g;
            m_pixels[base + 2] = c.b;
            m_pixels[base + 3] = 255;
        }
    }

    void PixelCanvas::setPixel(int x, int y, const Rgb& c, sf::Uint8 a)
    {
        if (!inside(x, y) || a == 0)
            return;

        unsigned int idx = ((unsigned int)y * m_width + (unsigned int)x) * 4u;

        if (a == 255)
        {
            m_pixels[idx + 0] = c.r;
            m_pixels[idx + 1] = c.g;
            m_pixels[idx + 2] = c.b;
            m_pixels[idx + 3] = 255;
        }
        else
        {
            float fa = (float)a / 255.0f;
            float fb = ((float)m_pixels[idx + 3] / 255.0f) * (1.0f - fa);

            m_pixels[idx + 0] = (sf::Uint8)((float)c.r * fa + (float)m_pixels[idx + 0] * fb);
            m_pixels[idx + 1] = (sf::Uint8)((float)c.g * fa + (float)m_pixels[idx + 1] * fb);
            m_pixels[idx + 2] = (sf::Uint8)((float)c.b * fa + (float)m_pixels[idx + 2] * fb);
            m_pixels[idx + 3] = (sf::Uint8)((fa + fb) * 255.0f);
        }
    }

    Rgb PixelCanvas::pixelAt(int x, int y) const
    {
        if (!inside(x, y))
            return BLACK;

        unsigned int idx = ((unsigned int)y * m_width + (unsigned int)x) * 4u;
        Rgb c = { m_pixels[idx + 0], m_pixels[idx + 1], m_pixels[idx + 2] };
        return c;
    }

    sf::Uint8 PixelCanvas::alphaAt(int x, int y) const
    {
        if (!inside(x, y))
            return 0;
        return m_pixels[((unsigned int)y * m_width + (unsigned int)x) * 4u + 3];
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  BRESENHAM LINE
    // ════════════════════════════════════════════════════════════════════════════
    void PixelCanvas::line(int x0, int y0, int x1, int y1, const Rgb& c, sf::Uint8 a)
    {
        int dx = std::abs(x1 - x0);
        int dy = -std::abs(y1 - y0);
        int sx = (x0 < x1) ? 1 : -1;
        int sy = (y0 < y1) ? 1 : -1;
        int err = dx + dy;

        for (;;)
        {
            setPixel(x0, y0, c, a);
            if (x0 == x1 && y0 == y1) break;

            int e2 = 2 * err;
            if (e2 >= dy) { err += dy; x0 += sx; }
            if (e2 <= dx) { err += dx; y0 += sy; }
        }
    }

    // Thick line: N offset copies along the perpendicular
    void PixelCanvas::thickLine(int x0, int y0, int x1, int y1, int thickness,
        const Rgb& c, sf::Uint8 a)
    {
        float dx = (float)(x1 - x0);
        float dy = (float)(y1 - y0);
        float len = std::sqrt(dx * dx + dy * dy);

        if (len < 0.001f)
        {
            setPixel(x0, y0, c, a);
            return;
        }

        float px = -dy / len;
        float py = dx / len;

        float half = (float)(thickness - 1) * 0.5f;
        for (float i = -half; i <= half; i += 1.0f)
        {
            line((int)std::lround((float)x0 + px * i), (int)std::lround((float)y0 + py * i),
                (int)std::lround((float)x1 + px * i), (int)std::lround((float)y1 + py * i),
                c, a);
        }
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  MIDPOINT CIRCLE  (outline, all 8 octants)
    // ════════════════════════════════════════════════════════════════════════════
    void PixelCanvas::circle(int cx, int cy, int radius, const Rgb& c, sf::Uint8 a)
    {
        if (radius <= 0)
        {
            setPixel(cx, cy, c, a);
            return;
        }

        int x = radius;
        int y = 0;
        int p = 1 - radius;

        while (x >= y)
        {
            setPixel(cx + x, cy + y, c, a);
            setPixel(cx - x, cy + y, c, a);
            setPixel(cx + x, cy - y, c, a);
            setPixel(cx - x, cy - y, c, a);
            if (x != y)
            {
                setPixel(cx + y, cy + x, c, a);
                setPixel(cx - y, cy + x, c, a);
                setPixel(cx + y, cy - x, c, a);
                setPixel(cx - y, cy - x, c, a);
            }

            ++y;
            if (p < 0)
            {
                p += 2 * y + 1;
            }
            else
            {
                --x;
                p += 2 * (y - x) + 1;
            }
        }
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  SCANLINE CIRCLE FILLS
    // ════════════════════════════════════════════════════════════════════════════
    void PixelCanvas::fillCircle(int cx, int cy, int radius, const Rgb& c, sf::Uint8 a)
    {
        if (radius <= 0)
        {
            setPixel(cx, cy, c, a);
            return;
        }

        for (int y = cy - radius; y <= cy + radius; ++y)
        {
            float dy = (float)(y - cy);
            float disc = (float)(radius * radius) - dy * dy;
            if (disc < 0.0f) continue;

            float sqD = std::sqrt(disc);
            int   xLeft = (int)((float)cx - sqD);
            int   xRight = (int)((float)cx + sqD);

            for (int x = xLeft; x <= xRight; ++x)
                setPixel(x, y, c, a);
        }
    }

    // Outer glow: alpha fades from peakAlpha at the centre to 0 at the edge
    void PixelCanvas::glowRing(int cx, int cy, int radius, const Rgb& c, float peakAlpha)
    {
        if (radius <= 0)
            return;

        float invR = 1.0f / (float)radius;

        for (int y = cy - radius; y <= cy + radius; ++y)
        {
            float dy = (float)(y - cy);
            float disc = (float)(radius * radius) - dy * dy;
            if (disc < 0.0f) continue;

            float sqD = std::sqrt(disc);
            int   xLeft = (int)((float)cx - sqD);
            int   xRight = (int)((float)cx + sqD);

            for (int x = xLeft; x <= xRight; ++x)
            {
                float dx = (float)(x - cx);
                float dist = std::sqrt(dx * dx + dy * dy) * invR;

                float alpha = (1.0f - dist) * peakAlpha;
                if (alpha < 1.0f) continue;

                setPixel(x, y, c, (sf::Uint8)std::min(alpha, 255.0f));
            }
        }
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  SCANLINE POLYGON FILL
    //  Sample each row at its pixel centre, collect edge crossings, fill pairs.
    // ════════════════════════════════════════════════════════════════════════════
    void PixelCanvas::fillPolygon(const std::vector<sf::Vector2f>& vertices,
        const Rgb& c, sf::Uint8 a)
    {
        const size_t n = vertices.size();
        if (n < 3)
            return;

        float minY = vertices[0].y;
        float maxY = vertices[0].y;
        for (size_t i = 1; i < n; ++i)
        {
            minY = std::min(minY, vertices[i].y);
            maxY = std::max(maxY, vertices[i].y);
        }

        int yStart = std::max(0, (int)std::floor(minY));
        int yEnd = std::min((int)m_height - 1, (int)std::ceil(maxY));

        std::vector<float> crossings;
        crossings.reserve(n);

        for (int y = yStart; y <= yEnd; ++y)
        {
            float sampleY = (float)y + 0.5f;
            crossings.clear();

            for (size_t i = 0; i < n; ++i)
            {
                const sf::Vector2f& p0 = vertices[i];
                const sf::Vector2f& p1 = vertices[(i + 1) % n];

                // Half-open rule so shared vertices are counted once
                bool spans = (p0.y <= sampleY && p1.y > sampleY) ||
                    (p1.y <= sampleY && p0.y > sampleY);
                if (!spans) continue;

                float t = (sampleY - p0.y) / (p1.y - p0.y);
                crossings.push_back(p0.x + t * (p1.x - p0.x));
            }

            std::sort(crossings.begin(), crossings.end());

            for (size_t k = 0; k + 1 < crossings.size(); k += 2)
            {
                int xLeft = (int)std::ceil(crossings[k] - 0.5f);
                int xRight = (int)std::floor(crossings[k + 1] - 0.5f);
                for (int x = xLeft; x <= xRight; ++x)
                    setPixel(x, y, c, a);
            }
        }
    }
}
