#include "Scene.hpp"

#include "Config.hpp"
#include "Layers.hpp"

namespace Neon
{
    Scene::Scene(unsigned int seed) : Scene(makePendulum(), seed)
    {
    }

    Scene::Scene(const PendulumState& initial, unsigned int seed)
        : pendulum(initial),
        bob(bobPosition(initial)),
        trail(TRAIL_LENGTH),
        vortex(sf::Vector2f(VORTEX_CENTER_X, VORTEX_CENTER_Y), NUM_VORTEX_PARTICLES, seed),
        hexagonAngle(0.0f),
        tick(0)
    {
    }

    void updateScene(Scene& scene)
    {
        scene.pendulum = stepPendulum(scene.pendulum);
        scene.bob = bobPosition(scene.pendulum);
        scene.trail.push(scene.bob);

        // Constant spin, not coupled to the pendulum angle
        scene.hexagonAngle += HEXAGON_ROTATION_SPEED;

        scene.vortex.advance();
        ++scene.tick;
    }

    void renderScene(const Scene& scene, PixelCanvas& canvas)
    {
        canvas.clear(BLACK);

        drawVortex(canvas, scene.vortex);
        drawWarpedGrid(canvas, scene.bob);
        drawNeonTrail(canvas, scene.trail);

        float speed = bobSpeed(scene.pendulum);
        if (lightBeamsActive(speed))
            drawLightBeams(canvas, scene.bob, speed);

        drawArm(canvas, scene.pendulum.pivot, scene.bob);
        drawHexagon(canvas, scene.bob, scene.hexagonAngle);
    }
}
