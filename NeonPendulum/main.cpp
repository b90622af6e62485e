/*
 * ============================================================
 *  NEON PENDULUM
 *  Damped pendulum + manual rasterization — C++ / SFML 2.6
 * ============================================================
 *  Layers (back to front):
 *      - Vortex particles orbiting the window centre
 *      - Grid warped into concentric rings around the bob
 *      - Neon trail, purple (old) -> cyan (new)
 *      - Light beams while the bob moves fast
 *      - Pendulum arm + rotating hexagon bob
 *
 *  Physics (per frame):
 *      a = -(g / L) * sin(theta);  omega += a;  omega *= damping
 *
 *  Runs for 10 seconds at 60 fps, then exits.
 *
 *  Controls:
 *      Esc / close window  — quit
 * ============================================================
 */

#include <SFML/Graphics.hpp>
#include <SFML/Window.hpp>
#include <SFML/System.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <random>

#include "AnimationTimer.hpp"
#include "Config.hpp"
#include "Hud.hpp"
#include "PixelCanvas.hpp"
#include "Scene.hpp"

int main()
{
    sf::VideoMode    mode(Neon::WIN_W, Neon::WIN_H);
    sf::RenderWindow window(mode, "Neon Pendulum", sf::Style::Titlebar | sf::Style::Close);
    if (!window.isOpen())
    {
        std::cerr << "Error: could not create " << Neon::WIN_W << "x" << Neon::WIN_H
            << " render window\n";
        return EXIT_FAILURE;
    }
    window.setFramerateLimit(Neon::FPS);

    std::cout << "Neon Pendulum: " << Neon::WIN_W << "x" << Neon::WIN_H
        << " @ " << Neon::FPS << " fps for " << Neon::TIME_LIMIT << "s\n";

    sf::Image   img;
    sf::Texture tex;
    sf::Sprite  sprite;

    Neon::PixelCanvas    canvas(Neon::WIN_W, Neon::WIN_H);
    Neon::Scene          scene(std::random_device{}());
    Neon::Hud            hud(Neon::HUD_FONT_PATH);
    Neon::AnimationTimer timer(sf::seconds(Neon::TIME_LIMIT));

    sf::Clock runClock;

    while (timer.isRunning())
    {
        // ── Events ──
        sf::Event event;
        while (window.pollEvent(event))
        {
            if (event.type == sf::Event::Closed)
                timer.requestStop();

            if (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::Escape)
                timer.requestStop();
        }
        if (!timer.isRunning())
            break;

        // ── Update + rasterize ──
        Neon::updateScene(scene);
        Neon::renderScene(scene, canvas);

        // ── Blit pixel buffer to screen ──
        img.create(canvas.width(), canvas.height(), canvas.pixels());
        tex.loadFromImage(img);
        sprite.setTexture(tex);

        window.clear();
        window.draw(sprite);

        sf::Time elapsed = runClock.getElapsedTime();
        hud.draw(window, scene.pendulum, timer.remaining(elapsed));

        window.display();

        timer.update(runClock.getElapsedTime());
    }

    window.close();

    char buf[128];
    std::snprintf(buf, sizeof(buf), "Stopped (%s) after %lu frames, %.2fs",
        Neon::stopReasonName(timer.reason()), scene.tick,
        runClock.getElapsedTime().asSeconds());
    std::cout << buf << "\n";

    return 0;
}
