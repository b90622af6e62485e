/**
 * @file test_vortex.cpp
 * @brief Unit tests for the orbiting background particle field
 */

#include <unity.h>

#include <cmath>
#include <vector>

#include "Config.hpp"
#include "Vortex.hpp"

using namespace Neon;

static const sf::Vector2f CENTER(400.0f, 300.0f);

void setUp(void) {
}

void tearDown(void) {
}

void test_field_has_fixed_count(void) {
    VortexField field(CENTER, NUM_VORTEX_PARTICLES, 7u);
    TEST_ASSERT_EQUAL_UINT32(NUM_VORTEX_PARTICLES, (unsigned int)field.size());

    for (int i = 0; i < 50; ++i)
        field.advance();
    TEST_ASSERT_EQUAL_UINT32(NUM_VORTEX_PARTICLES, (unsigned int)field.size());
}

void test_same_seed_same_field(void) {
    VortexField a(CENTER, 32, 1234u);
    VortexField b(CENTER, 32, 1234u);

    for (size_t i = 0; i < a.size(); ++i)
    {
        TEST_ASSERT_TRUE(a[i].angle == b[i].angle);
        TEST_ASSERT_TRUE(a[i].baseRadius == b[i].baseRadius);
        TEST_ASSERT_TRUE(a[i].wobblePhase == b[i].wobblePhase);
    }
}

void test_particles_start_in_band(void) {
    VortexField field(CENTER, NUM_VORTEX_PARTICLES, 99u);
    for (size_t i = 0; i < field.size(); ++i)
    {
        const VortexParticle& p = field[i];
        TEST_ASSERT_TRUE(p.baseRadius >= VORTEX_RADIUS_MIN && p.baseRadius <= VORTEX_RADIUS_MAX);
        TEST_ASSERT_TRUE(p.angle >= 0.0f && p.angle < TWO_PI);
        TEST_ASSERT_FLOAT_WITHIN(1e-6f, VORTEX_ROTATION_SPEED, p.angularSpeed);
    }
}

void test_angles_advance_at_constant_rate(void) {
    VortexField field(CENTER, 16, 3u);

    std::vector<float> prev;
    for (size_t i = 0; i < field.size(); ++i)
        prev.push_back(field[i].angle);

    for (int frame = 0; frame < 500; ++frame)
    {
        field.advance();
        for (size_t i = 0; i < field.size(); ++i)
        {
            float now = field[i].angle;
            TEST_ASSERT_TRUE(now >= 0.0f && now < TWO_PI);

            // Forward step, modulo one full turn
            float step = std::fmod(now - prev[i] + TWO_PI, TWO_PI);
            TEST_ASSERT_FLOAT_WITHIN(1e-4f, VORTEX_ROTATION_SPEED, step);
            prev[i] = now;
        }
    }
}

void test_radius_oscillates_within_wobble(void) {
    VortexField field(CENTER, NUM_VORTEX_PARTICLES, 5u);

    for (int frame = 0; frame < 200; ++frame)
    {
        for (size_t i = 0; i < field.size(); ++i)
        {
            const VortexParticle& p = field[i];
            TEST_ASSERT_TRUE(std::abs(p.radius() - p.baseRadius) <= p.wobbleAmplitude + 1e-4f);
            TEST_ASSERT_TRUE(p.wobbleAmplitude <= VORTEX_WOBBLE_MAX);
        }
        field.advance();
    }
}

void test_position_lies_on_current_radius(void) {
    VortexField field(CENTER, 10, 11u);
    field.advance();

    for (size_t i = 0; i < field.size(); ++i)
    {
        sf::Vector2f p = field.position(i);
        float r = std::hypot(p.x - CENTER.x, p.y - CENTER.y);
        TEST_ASSERT_FLOAT_WITHIN(1e-3f, field[i].radius(), r);
    }
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_field_has_fixed_count);
    RUN_TEST(test_same_seed_same_field);
    RUN_TEST(test_particles_start_in_band);
    RUN_TEST(test_angles_advance_at_constant_rate);
    RUN_TEST(test_radius_oscillates_within_wobble);
    RUN_TEST(test_position_lies_on_current_radius);

    return UNITY_END();
}
