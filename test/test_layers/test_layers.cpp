/**
 * @file test_layers.cpp
 * @brief Unit tests for grid warp, light beam and hexagon geometry
 */

#include <unity.h>

#include <cmath>

#include "Config.hpp"
#include "Layers.hpp"

using namespace Neon;

static const sf::Vector2f ORIGIN(0.0f, 0.0f);

void setUp(void) {
}

void tearDown(void) {
}

// ── Warped grid ──

void test_warp_leaves_far_points_alone(void) {
    sf::Vector2f center(400.0f, 300.0f);
    sf::Vector2f p(600.0f, 300.0f);
    sf::Vector2f w = warpGridPoint(p, center);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, p.x, w.x);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, p.y, w.y);

    // Exactly on the warp radius counts as outside
    sf::Vector2f edge(550.0f, 300.0f);
    w = warpGridPoint(edge, center);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, edge.x, w.x);
}

void test_warp_leaves_center_alone(void) {
    sf::Vector2f w = warpGridPoint(ORIGIN, ORIGIN);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, w.x);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, w.y);
}

void test_warp_keeps_points_on_a_ring(void) {
    sf::Vector2f w = warpGridPoint(sf::Vector2f(30.0f, 0.0f), ORIGIN);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 30.0f, w.x);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.0f, w.y);
}

void test_warp_pulls_toward_nearest_ring(void) {
    // r = 37 -> ring 30, pull scaled by 1 - 37/150
    sf::Vector2f w = warpGridPoint(sf::Vector2f(37.0f, 0.0f), ORIGIN);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 31.7267f, w.x);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.0f, w.y);
}

void test_warp_is_radial(void) {
    sf::Vector2f p(20.0f, 20.0f);
    sf::Vector2f w = warpGridPoint(p, ORIGIN);
    // Same direction from the centre
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, std::atan2(p.y, p.x), std::atan2(w.y, w.x));
}

void test_warp_fades_toward_radius(void) {
    sf::Vector2f w = warpGridPoint(sf::Vector2f(149.0f, 0.0f), ORIGIN);
    TEST_ASSERT_TRUE(std::abs(w.x - 149.0f) < 0.01f);
}

void test_warp_displacement_bounded_by_half_spacing(void) {
    sf::Vector2f center(412.3f, 231.7f);
    for (int x = 0; x < (int)WIN_W; x += GRID_SPACING)
    {
        for (int y = 0; y < (int)WIN_H; y += GRID_SPACING)
        {
            sf::Vector2f p((float)x, (float)y);
            sf::Vector2f w = warpGridPoint(p, center);
            float d = std::hypot(w.x - p.x, w.y - p.y);
            TEST_ASSERT_TRUE(d <= (float)GRID_SPACING * 0.5f + 1e-3f);
        }
    }
}

// ── Light beams ──

void test_beams_only_above_threshold(void) {
    TEST_ASSERT_FALSE(lightBeamsActive(0.0f));
    TEST_ASSERT_FALSE(lightBeamsActive(LIGHT_BEAM_THRESHOLD));
    TEST_ASSERT_TRUE(lightBeamsActive(LIGHT_BEAM_THRESHOLD + 0.001f));
}

void test_beams_have_no_hysteresis(void) {
    TEST_ASSERT_TRUE(lightBeamsActive(6.0f));
    TEST_ASSERT_FALSE(lightBeamsActive(4.0f));
    TEST_ASSERT_TRUE(lightBeamsActive(6.0f));
    TEST_ASSERT_FALSE(lightBeamsActive(4.0f));
}

void test_beam_count_scales_with_speed(void) {
    TEST_ASSERT_EQUAL_INT(0, beamCount(4.0f));
    TEST_ASSERT_EQUAL_INT(BEAM_COUNT, beamCount(5.01f));
    TEST_ASSERT_EQUAL_INT(7, beamCount(5.5f));
    TEST_ASSERT_EQUAL_INT(BEAM_COUNT_MAX, beamCount(100.0f));
}

void test_beam_length_scales_with_speed(void) {
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, beamLength(4.0f));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, 120.0f, beamLength(6.0f));
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, BEAM_LENGTH_MAX, beamLength(100.0f));
}

void test_beam_polygons_radiate_from_center(void) {
    sf::Vector2f c(100.0f, 80.0f);
    std::vector<std::vector<sf::Vector2f>> beams = lightBeamPolygons(c, 6.0f);
    TEST_ASSERT_EQUAL_UINT32(7, (unsigned int)beams.size());

    for (size_t i = 0; i < beams.size(); ++i)
    {
        TEST_ASSERT_EQUAL_UINT32(3, (unsigned int)beams[i].size());
        TEST_ASSERT_FLOAT_WITHIN(1e-6f, c.x, beams[i][0].x);
        TEST_ASSERT_FLOAT_WITHIN(1e-6f, c.y, beams[i][0].y);
        for (size_t k = 1; k < 3; ++k)
        {
            float d = std::hypot(beams[i][k].x - c.x, beams[i][k].y - c.y);
            TEST_ASSERT_FLOAT_WITHIN(1e-2f, 120.0f, d);
        }
    }

    TEST_ASSERT_EQUAL_UINT32(0, (unsigned int)lightBeamPolygons(c, 1.0f).size());
}

// ── Hexagon ──

void test_hexagon_vertices_on_circumcircle(void) {
    sf::Vector2f c(50.0f, 60.0f);
    std::vector<sf::Vector2f> pts = hexagonVertices(c, 0.3f);
    TEST_ASSERT_EQUAL_UINT32(6, (unsigned int)pts.size());
    for (size_t i = 0; i < pts.size(); ++i)
        TEST_ASSERT_FLOAT_WITHIN(1e-3f, HEXAGON_SIDE, std::hypot(pts[i].x - c.x, pts[i].y - c.y));

    // Regular hexagon: side == circumradius
    for (size_t i = 0; i < pts.size(); ++i)
    {
        const sf::Vector2f& a = pts[i];
        const sf::Vector2f& b = pts[(i + 1) % pts.size()];
        TEST_ASSERT_FLOAT_WITHIN(1e-3f, HEXAGON_SIDE, std::hypot(b.x - a.x, b.y - a.y));
    }
}

void test_hexagon_rotation(void) {
    std::vector<sf::Vector2f> flat = hexagonVertices(ORIGIN, 0.0f);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, HEXAGON_SIDE, flat[0].x);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 0.0f, flat[0].y);

    // A sixth of a turn maps each vertex onto the next
    std::vector<sf::Vector2f> turned = hexagonVertices(ORIGIN, PI / 3.0f);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, flat[1].x, turned[0].x);
    TEST_ASSERT_FLOAT_WITHIN(1e-3f, flat[1].y, turned[0].y);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_warp_leaves_far_points_alone);
    RUN_TEST(test_warp_leaves_center_alone);
    RUN_TEST(test_warp_keeps_points_on_a_ring);
    RUN_TEST(test_warp_pulls_toward_nearest_ring);
    RUN_TEST(test_warp_is_radial);
    RUN_TEST(test_warp_fades_toward_radius);
    RUN_TEST(test_warp_displacement_bounded_by_half_spacing);
    RUN_TEST(test_beams_only_above_threshold);
    RUN_TEST(test_beams_have_no_hysteresis);
    RUN_TEST(test_beam_count_scales_with_speed);
    RUN_TEST(test_beam_length_scales_with_speed);
    RUN_TEST(test_beam_polygons_radiate_from_center);
    RUN_TEST(test_hexagon_vertices_on_circumcircle);
    RUN_TEST(test_hexagon_rotation);

    return UNITY_END();
}
