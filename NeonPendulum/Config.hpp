#ifndef NEONPENDULUM_CONFIG_HPP
#define NEONPENDULUM_CONFIG_HPP

#include <SFML/Config.hpp>

namespace Neon
{
    // ════════════════════════════════════════════════════════════════════════════
    //  WINDOW / TIMING
    // ════════════════════════════════════════════════════════════════════════════
    static const unsigned int WIN_W = 800u;
    static const unsigned int WIN_H = 600u;
    static const unsigned int FPS = 60u;
    static const float        TIME_LIMIT = 10.0f;   // seconds

    static const float PI = 3.14159265358979323846f;
    static const float TWO_PI = 2.0f * PI;
    static const float DEG2RAD = PI / 180.0f;
    static const float RAD2DEG = 180.0f / PI;

    // ════════════════════════════════════════════════════════════════════════════
    //  PENDULUM   (per-frame units: pixels, radians, frames)
    // ════════════════════════════════════════════════════════════════════════════
    static const float PIVOT_X = 400.0f;
    static const float PIVOT_Y = 100.0f;
    static const float PENDULUM_LENGTH = 150.0f;
    static const float GRAVITY = 0.5f;        // px / frame^2
    static const float DAMPING = 0.96f;       // 96% of velocity kept per frame
    static const float INITIAL_ANGLE = PI / 4.0f;

    // ════════════════════════════════════════════════════════════════════════════
    //  HEXAGON BOB
    // ════════════════════════════════════════════════════════════════════════════
    static const float HEXAGON_SIDE = 20.0f;   // side == circumradius
    static const float HEXAGON_ROTATION_SPEED = 3.0f * DEG2RAD;

    // ════════════════════════════════════════════════════════════════════════════
    //  NEON TRAIL
    // ════════════════════════════════════════════════════════════════════════════
    static const unsigned int TRAIL_LENGTH = 8u;
    static const int          TRAIL_MAX_WIDTH = 3;

    // ════════════════════════════════════════════════════════════════════════════
    //  LIGHT BEAMS
    // ════════════════════════════════════════════════════════════════════════════
    static const float LIGHT_BEAM_THRESHOLD = 5.0f;   // px / frame
    static const float LIGHT_BEAM_SPREAD = 30.0f * DEG2RAD;
    static const int   BEAM_COUNT = 6;
    static const int   BEAM_COUNT_MAX = 12;
    static const float BEAM_LENGTH = 100.0f;
    static const float BEAM_LENGTH_MAX = 200.0f;
    static const sf::Uint8 BEAM_ALPHA = 80;

    // ════════════════════════════════════════════════════════════════════════════
    //  WARPED GRID
    // ════════════════════════════════════════════════════════════════════════════
    static const int       GRID_SPACING = 15;
    static const float     GRID_WARP_RADIUS = 150.0f;
    static const sf::Uint8 GRID_ALPHA = 150;

    // ════════════════════════════════════════════════════════════════════════════
    //  VORTEX
    // ════════════════════════════════════════════════════════════════════════════
    static const unsigned int NUM_VORTEX_PARTICLES = 100u;
    static const float VORTEX_ROTATION_SPEED = 0.02f;   // rad / frame
    static const float VORTEX_CENTER_X = (float)WIN_W * 0.5f;
    static const float VORTEX_CENTER_Y = (float)WIN_H * 0.5f;
    static const float VORTEX_RADIUS_MIN = 90.0f;
    static const float VORTEX_RADIUS_MAX = 110.0f;
    static const float VORTEX_WOBBLE_MAX = 4.0f;        // px
    static const float VORTEX_WOBBLE_SPEED = 0.05f;     // rad / frame

    // ════════════════════════════════════════════════════════════════════════════
    //  COLORS (RGB)
    // ════════════════════════════════════════════════════════════════════════════
    struct Rgb
    {
        sf::Uint8 r, g, b;
    };

    static const Rgb BLACK = { 0, 0, 0 };
    static const Rgb CYAN = { 0, 255, 255 };
    static const Rgb PURPLE = { 128, 0, 128 };
    static const Rgb WHITE = { 255, 255, 255 };
    static const Rgb GRID_GREY = { 50, 50, 50 };

    // ════════════════════════════════════════════════════════════════════════════
    //  HUD
    // ════════════════════════════════════════════════════════════════════════════
    static const char* const HUD_FONT_PATH = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
}

#endif // NEONPENDULUM_CONFIG_HPP
