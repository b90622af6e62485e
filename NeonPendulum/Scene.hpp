#ifndef NEONPENDULUM_SCENE_HPP
#define NEONPENDULUM_SCENE_HPP

#include <SFML/System/Vector2.hpp>

#include "NeonTrail.hpp"
#include "Pendulum.hpp"
#include "PixelCanvas.hpp"
#include "Vortex.hpp"

namespace Neon
{
    /**
     * @brief Everything the animation mutates from one frame to the next.
     */
    struct Scene
    {
        PendulumState pendulum;
        sf::Vector2f  bob;
        TrailBuffer   trail;
        VortexField   vortex;
        float         hexagonAngle;
        unsigned long tick;

        explicit Scene(unsigned int seed);
        Scene(const PendulumState& initial, unsigned int seed);
    };

    // One fixed tick: physics, bob, trail, hexagon spin, vortex swirl
    void updateScene(Scene& scene);

    // Composite all layers back-to-front
    void renderScene(const Scene& scene, PixelCanvas& canvas);
}

#endif // NEONPENDULUM_SCENE_HPP
