#ifndef NEONPENDULUM_LAYERS_HPP
#define NEONPENDULUM_LAYERS_HPP

#include <SFML/System/Vector2.hpp>

#include <vector>

#include "Config.hpp"
#include "NeonTrail.hpp"
#include "PixelCanvas.hpp"
#include "Vortex.hpp"

namespace Neon
{
    // ════════════════════════════════════════════════════════════════════════════
    //  GEOMETRY  (pure, no drawing)
    // ════════════════════════════════════════════════════════════════════════════

    /**
     * @brief Pull a grid point toward the nearest concentric ring around warpCenter.
     *
     * Rings are GRID_SPACING apart. The pull is full strength at the centre and
     * fades linearly to zero at warpRadius; points at or beyond it, and the centre
     * itself, are returned unchanged.
     */
    sf::Vector2f warpGridPoint(sf::Vector2f point, sf::Vector2f warpCenter,
        float warpRadius = GRID_WARP_RADIUS);

    bool lightBeamsActive(float speed);
    int  beamCount(float speed);
    float beamLength(float speed);

    // Triangles (bob, edge1, edge2), one per beam
    std::vector<std::vector<sf::Vector2f>> lightBeamPolygons(sf::Vector2f center, float speed);

    std::vector<sf::Vector2f> hexagonVertices(sf::Vector2f center, float angle,
        float side = HEXAGON_SIDE);

    // ════════════════════════════════════════════════════════════════════════════
    //  LAYERS  (back-to-front)
    // ════════════════════════════════════════════════════════════════════════════
    void drawVortex(PixelCanvas& canvas, const VortexField& vortex);
    void drawWarpedGrid(PixelCanvas& canvas, sf::Vector2f warpCenter);
    void drawNeonTrail(PixelCanvas& canvas, const TrailBuffer& trail);
    void drawLightBeams(PixelCanvas& canvas, sf::Vector2f center, float speed);
    void drawArm(PixelCanvas& canvas, sf::Vector2f pivot, sf::Vector2f bob);
    void drawHexagon(PixelCanvas& canvas, sf::Vector2f center, float angle);
}

#endif // NEONPENDULUM_LAYERS_HPP
