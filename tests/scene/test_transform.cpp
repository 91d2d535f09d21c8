/*
 * Quadra Transform Tests
 *
 * Local composition, parent propagation and the world-id change signal.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "quadra/transform.h"
#include "quadra/generation.h"
#include <cstdint>

using Catch::Approx;

/* ============================================================================
 * Local Composition
 * ============================================================================ */

TEST_CASE("Transform init", "[transform][init]") {
    Quadra_Transform t;
    quadra_transform_init(&t);

    REQUIRE(t.x == 0.0f);
    REQUIRE(t.y == 0.0f);
    REQUIRE(t.scale_x == 1.0f);
    REQUIRE(t.scale_y == 1.0f);
    REQUIRE(t.rotation == 0.0f);

    SECTION("First update always writes the world matrix") {
        uint32_t before = t.world_id;
        REQUIRE(quadra_transform_update(&t, nullptr));
        REQUIRE(t.world_id != before);

        Quadra_Matrix identity = QUADRA_MATRIX_IDENTITY;
        REQUIRE(quadra_matrix_equals(&t.world, &identity));
    }

    SECTION("Second update without changes is a no-op") {
        quadra_transform_update(&t, nullptr);
        uint32_t id = t.world_id;
        REQUIRE_FALSE(quadra_transform_update(&t, nullptr));
        REQUIRE(t.world_id == id);
    }
}

TEST_CASE("Transform setters", "[transform][local]") {
    Quadra_Transform t;
    quadra_transform_init(&t);
    quadra_transform_update(&t, nullptr);

    SECTION("Position") {
        quadra_transform_set_position(&t, 12.0f, -4.0f);
        REQUIRE(quadra_transform_update(&t, nullptr));
        REQUIRE(t.world.tx == Approx(12.0f));
        REQUIRE(t.world.ty == Approx(-4.0f));
    }

    SECTION("Scale axes independently") {
        quadra_transform_set_scale_x(&t, -2.0f);
        quadra_transform_set_scale_y(&t, 3.0f);
        REQUIRE(quadra_transform_update(&t, nullptr));
        REQUIRE(t.world.a == Approx(-2.0f));
        REQUIRE(t.world.d == Approx(3.0f));
    }

    SECTION("Setting the same value still marks the transform changed") {
        quadra_transform_set_position(&t, 0.0f, 0.0f);
        REQUIRE(quadra_transform_update(&t, nullptr));
    }

    SECTION("Setters bump the bounds generation") {
        uint64_t gen = quadra_generation_current();
        quadra_transform_set_rotation(&t, 0.5f);
        REQUIRE(quadra_generation_current() != gen);
    }
}

/* ============================================================================
 * Hierarchy
 * ============================================================================ */

TEST_CASE("Transform parent propagation", "[transform][hierarchy]") {
    Quadra_Transform parent, child;
    quadra_transform_init(&parent);
    quadra_transform_init(&child);

    quadra_transform_set_position(&parent, 100.0f, 100.0f);
    quadra_transform_set_scale(&parent, 2.0f, 2.0f);
    quadra_transform_set_position(&child, 10.0f, 5.0f);

    quadra_transform_update(&parent, nullptr);
    quadra_transform_update(&child, &parent);

    SECTION("World = parent.world * local") {
        REQUIRE(child.world.tx == Approx(120.0f));
        REQUIRE(child.world.ty == Approx(110.0f));
        REQUIRE(child.world.a == Approx(2.0f));
    }

    SECTION("Parent change propagates without touching the child") {
        quadra_transform_set_position(&parent, 0.0f, 0.0f);
        quadra_transform_update(&parent, nullptr);
        REQUIRE(quadra_transform_update(&child, &parent));
        REQUIRE(child.world.tx == Approx(20.0f));
        REQUIRE(child.world.ty == Approx(10.0f));
    }

    SECTION("Unchanged parent and child skip the update") {
        REQUIRE_FALSE(quadra_transform_update(&child, &parent));
    }

    SECTION("Reparenting forces recomposition") {
        quadra_transform_mark_parent_changed(&child);
        REQUIRE(quadra_transform_update(&child, nullptr));
        REQUIRE(child.world.tx == Approx(10.0f));
        REQUIRE(child.world.ty == Approx(5.0f));
    }
}

/* ============================================================================
 * Change Signal / Conversion
 * ============================================================================ */

TEST_CASE("Transform changed since", "[transform][signal]") {
    Quadra_Transform t;
    quadra_transform_init(&t);
    quadra_transform_update(&t, nullptr);

    uint32_t seen = 0;
    quadra_transform_changed_since(&t, &seen);

    SECTION("No change after reading") {
        REQUIRE_FALSE(quadra_transform_changed_since(&t, &seen));
    }

    SECTION("Local setter alone does not change world until update") {
        quadra_transform_set_position(&t, 1.0f, 1.0f);
        REQUIRE_FALSE(quadra_transform_changed_since(&t, &seen));
        quadra_transform_update(&t, nullptr);
        REQUIRE(quadra_transform_changed_since(&t, &seen));
        REQUIRE_FALSE(quadra_transform_changed_since(&t, &seen));
    }

    SECTION("Direct world overwrite is a change") {
        Quadra_Matrix m;
        quadra_matrix_set(&m, 1.0f, 0.0f, 0.0f, 1.0f, 3.0f, 4.0f);
        quadra_transform_set_world(&t, &m);
        REQUIRE(quadra_transform_changed_since(&t, &seen));
        REQUIRE(t.world.tx == 3.0f);
    }
}

TEST_CASE("Transform coordinate conversion", "[transform][convert]") {
    Quadra_Transform t;
    quadra_transform_init(&t);
    quadra_transform_set_position(&t, 50.0f, 20.0f);
    quadra_transform_set_rotation(&t, 1.2f);
    quadra_transform_set_scale(&t, 2.0f, 0.5f);
    quadra_transform_update(&t, nullptr);

    SECTION("Round trip") {
        Quadra_Point local = {3.0f, -7.0f};
        Quadra_Point world, back;
        quadra_transform_local_to_world(&t, &local, &world);
        REQUIRE(quadra_transform_world_to_local(&t, &world, &back));
        REQUIRE(back.x == Approx(3.0f).margin(1e-4));
        REQUIRE(back.y == Approx(-7.0f).margin(1e-4));
    }

    SECTION("Zero scale cannot be inverted") {
        quadra_transform_set_scale(&t, 0.0f, 1.0f);
        quadra_transform_update(&t, nullptr);
        Quadra_Point world = {50.0f, 20.0f};
        Quadra_Point local;
        REQUIRE_FALSE(quadra_transform_world_to_local(&t, &world, &local));
    }
}
