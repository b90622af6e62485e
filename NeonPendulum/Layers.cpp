#include "Layers.hpp"

#include <algorithm>
#include <cmath>

namespace Neon
{
    static int px(float v)
    {
        return (int)std::lround(v);
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  GEOMETRY
    // ════════════════════════════════════════════════════════════════════════════
    sf::Vector2f warpGridPoint(sf::Vector2f point, sf::Vector2f warpCenter, float warpRadius)
    {
        float dx = point.x - warpCenter.x;
        float dy = point.y - warpCenter.y;
        float r = std::hypot(dx, dy);

        if (r >= warpRadius || r == 0.0f)
            return point;

        float spacing = (float)GRID_SPACING;
        float ringR = std::round(r / spacing) * spacing;
        float falloff = 1.0f - r / warpRadius;
        float newR = r + (ringR - r) * falloff;

        float theta = std::atan2(dy, dx);
        return sf::Vector2f(warpCenter.x + newR * std::cos(theta),
            warpCenter.y + newR * std::sin(theta));
    }

    bool lightBeamsActive(float speed)
    {
        return speed > LIGHT_BEAM_THRESHOLD;
    }

    int beamCount(float speed)
    {
        if (!lightBeamsActive(speed))
            return 0;

        float ratio = speed / LIGHT_BEAM_THRESHOLD;
        int count = (int)std::lround((float)BEAM_COUNT * ratio);
        return std::max(BEAM_COUNT, std::min(BEAM_COUNT_MAX, count));
    }

    float beamLength(float speed)
    {
        if (!lightBeamsActive(speed))
            return 0.0f;

        float ratio = speed / LIGHT_BEAM_THRESHOLD;
        return std::max(BEAM_LENGTH, std::min(BEAM_LENGTH_MAX, BEAM_LENGTH * ratio));
    }

    std::vector<std::vector<sf::Vector2f>> lightBeamPolygons(sf::Vector2f center, float speed)
    {
        std::vector<std::vector<sf::Vector2f>> beams;

        const int count = beamCount(speed);
        const float length = beamLength(speed);
        const float halfSpread = LIGHT_BEAM_SPREAD * 0.5f;

        beams.reserve((size_t)count);
        for (int i = 0; i < count; ++i)
        {
            float central = (float)i * (TWO_PI / (float)count);
            float a1 = central - halfSpread;
            float a2 = central + halfSpread;

            std::vector<sf::Vector2f> tri;
            tri.push_back(center);
            tri.push_back(sf::Vector2f(center.x + length * std::cos(a1),
                center.y + length * std::sin(a1)));
            tri.push_back(sf::Vector2f(center.x + length * std::cos(a2),
                center.y + length * std::sin(a2)));
            beams.push_back(tri);
        }
        return beams;
    }

    std::vector<sf::Vector2f> hexagonVertices(sf::Vector2f center, float angle, float side)
    {
        std::vector<sf::Vector2f> pts;
        pts.reserve(6);
        for (int i = 0; i < 6; ++i)
        {
            float theta = (float)(60 * i) * DEG2RAD + angle;
            pts.push_back(sf::Vector2f(center.x + side * std::cos(theta),
                center.y + side * std::sin(theta)));
        }
        return pts;
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  VORTEX   (small glowing dots)
    // ════════════════════════════════════════════════════════════════════════════
    void drawVortex(PixelCanvas& canvas, const VortexField& vortex)
    {
        for (size_t i = 0; i < vortex.size(); ++i)
        {
            sf::Vector2f p = vortex.position(i);
            canvas.glowRing(px(p.x), px(p.y), 3, WHITE, 60.0f);
            canvas.fillCircle(px(p.x), px(p.y), 1, WHITE);
        }
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  WARPED GRID
    // ════════════════════════════════════════════════════════════════════════════
    void drawWarpedGrid(PixelCanvas& canvas, sf::Vector2f warpCenter)
    {
        for (int x = 0; x < (int)canvas.width(); x += GRID_SPACING)
        {
            for (int y = 0; y < (int)canvas.height(); y += GRID_SPACING)
            {
                sf::Vector2f p((float)x, (float)y);
                float r = std::hypot(p.x - warpCenter.x, p.y - warpCenter.y);

                if (r < GRID_WARP_RADIUS && r != 0.0f)
                {
                    sf::Vector2f w = warpGridPoint(p, warpCenter);
                    canvas.fillCircle(px(w.x), px(w.y), 2, GRID_GREY, GRID_ALPHA);
                }
                else
                {
                    canvas.fillCircle(x, y, 1, GRID_GREY, GRID_ALPHA);
                }
            }
        }
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  NEON TRAIL   (purple, oldest -> cyan, newest)
    // ════════════════════════════════════════════════════════════════════════════
    void drawNeonTrail(PixelCanvas& canvas, const TrailBuffer& trail)
    {
        const size_t n = trail.size();
        if (n < 2)
            return;

        for (size_t i = 0; i + 1 < n; ++i)
        {
            const sf::Vector2f& a = trail[i];
            const sf::Vector2f& b = trail[i + 1];
            canvas.thickLine(px(a.x), px(a.y), px(b.x), px(b.y),
                trailWidth(i, n), trailColor(i, n), trailAlpha(i, n));
        }

        // Halo per point
        for (size_t i = 0; i < n; ++i)
        {
            const sf::Vector2f& p = trail[i];
            canvas.glowRing(px(p.x), px(p.y), 4 + 2 * trailWidth(i, n),
                trailColor(i, n), (float)trailAlpha(i, n) * 0.4f);
        }
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  LIGHT BEAMS
    // ════════════════════════════════════════════════════════════════════════════
    void drawLightBeams(PixelCanvas& canvas, sf::Vector2f center, float speed)
    {
        std::vector<std::vector<sf::Vector2f>> beams = lightBeamPolygons(center, speed);
        for (size_t i = 0; i < beams.size(); ++i)
            canvas.fillPolygon(beams[i], WHITE, BEAM_ALPHA);
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  ARM + PIVOT
    // ════════════════════════════════════════════════════════════════════════════
    void drawArm(PixelCanvas& canvas, sf::Vector2f pivot, sf::Vector2f bob)
    {
        canvas.thickLine(px(pivot.x), px(pivot.y), px(bob.x), px(bob.y), 2, CYAN);

        canvas.glowRing(px(pivot.x), px(pivot.y), 6, CYAN, 60.0f);
        canvas.circle(px(pivot.x), px(pivot.y), 3, CYAN);
    }

    // ════════════════════════════════════════════════════════════════════════════
    //  HEXAGON BOB   (glow + scanline fill + outline)
    // ════════════════════════════════════════════════════════════════════════════
    void drawHexagon(PixelCanvas& canvas, sf::Vector2f center, float angle)
    {
        std::vector<sf::Vector2f> pts = hexagonVertices(center, angle);

        canvas.glowRing(px(center.x), px(center.y), (int)HEXAGON_SIDE + 10, CYAN, 90.0f);
        canvas.fillPolygon(pts, CYAN);

        for (size_t i = 0; i < pts.size(); ++i)
        {
            const sf::Vector2f& a = pts[i];
            const sf::Vector2f& b = pts[(i + 1) % pts.size()];
            canvas.line(px(a.x), px(a.y), px(b.x), px(b.y), WHITE, 160);
        }
    }
}
